#ifndef ALIGNMENT_HPP
#define ALIGNMENT_HPP

#include <vector>
#include <htslib/sam.h>
#include "data/data.hpp"

namespace SeqCal
{
    struct Alignment
    {
        // Eg: B7_591:6:155:12:674
        ReadName name;

        // Contig of the alignment, "*" if unplaced
        ChrID cID;

        // Index of the contig in the header (-1 if unplaced)
        int tid = -1;

        // 0-based leftmost position
        Base pos = -1;

        // Mapping quality
        MapQ mapq = 0;

        // Bitwise FLAG
        int flag = 0;

        // Mate's contig index (-1 if unplaced)
        int mtid = -1;

        typedef unsigned Cigar;
        std::vector<std::pair<Cigar, Base>> cigars;

        // bam1_t (null if the alignment isn't backed by htslib)
        void *b = nullptr;

        /*
         * SAM flag fields
         */

        inline bool isUnmapped()  const { return (flag & BAM_FUNMAP) != 0; }
        inline bool isDuplicate() const { return (flag & BAM_FDUP)   != 0; }

        // Reference position after the last aligned base (0-based, exclusive)
        inline Base end() const
        {
            auto p = pos;

            for (const auto &i : cigars)
            {
                switch (i.first)
                {
                    case BAM_CMATCH:
                    case BAM_CEQUAL:
                    case BAM_CDIFF:
                    case BAM_CDEL:
                    case BAM_CREF_SKIP: { p += i.second; break; }
                    default: { break; }
                }
            }

            return p;
        }
    };
}

#endif
