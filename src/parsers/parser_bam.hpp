#ifndef PARSER_BAM_HPP
#define PARSER_BAM_HPP

#include <memory>
#include <functional>
#include "data/region.hpp"
#include "data/alignment.hpp"

namespace SeqCal
{
    /*
     * Random access to alignment records. A fetch() defines the records returned by the following
     * next() calls, in the order they are stored in the file.
     */

    class AlignmentSource
    {
        public:
            AlignmentSource() {}

            // Sources own their file handles
            AlignmentSource(const AlignmentSource &) = delete;
            AlignmentSource &operator=(const AlignmentSource &) = delete;

            virtual ~AlignmentSource() {}

            // Contigs and their lengths in header order (index == tid)
            typedef std::vector<std::pair<ChrID, Base>> Header;

            virtual const Header &header() const = 0;

            // Index of a contig in the header, -1 if missing
            int tid(const ChrID &) const;

            // Records overlapping [beg, end)
            virtual void fetch(const ChrID &, Base beg, Base end) = 0;

            inline void fetch(const Region &r) { fetch(r.cID, r.beg, r.end); }

            // All records on a contig
            virtual void fetch(const ChrID &) = 0;

            // Every record in the file, unmapped reads included
            virtual void fetchAll() = 0;

            /*
             * Next record for the current fetch. Returns false when exhausted, throws on a
             * corrupted record. The record's bam1_t is owned by the source and is only valid
             * until the next call.
             */

            virtual bool next(Alignment &) = 0;

            // bam_hdr_t (null for sources not backed by a file)
            virtual void *h() const = 0;
    };

    struct ParserBAM
    {
        struct Options
        {
            // Decompression threads
            Thread threads = 1;

            // Reference FASTA, required for CRAM
            FileName ref;
        };

        typedef std::function<void (const Alignment &, Progress)> Functor;

        // Open an indexed BAM/CRAM file
        static std::shared_ptr<AlignmentSource> open(const FileName &, const Options &o = Options());

        // Apply a function to every record of the current fetch
        static void parse(AlignmentSource &s, Functor f)
        {
            Alignment x;
            Progress i = 0;

            while (s.next(x))
            {
                f(x, i++);
            }
        }
    };

    bool isUTF8(const std::string &);
}

#endif
