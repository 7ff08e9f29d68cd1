#ifndef COVERAGE_HPP
#define COVERAGE_HPP

#include "data/depth.hpp"
#include "parsers/parser_bam.hpp"

namespace SeqCal
{
    // Unmapped, secondary, QC failed, duplicate and supplementary (0xF04)
    const int DEPTH_EXCLUDE = BAM_FUNMAP | BAM_FSECONDARY | BAM_FQCFAIL | BAM_FDUP | BAM_FSUPPLEMENTARY;

    // Whether an alignment is counted for depth
    inline bool countDepth(const Alignment &x, MapQ minQ)
    {
        return !(x.flag & DEPTH_EXCLUDE) && x.mapq >= minQ;
    }

    /*
     * Depth for every position of a region after removing flank bases from both ends. Only
     * reference-consuming alignment operations (M, = and X) add depth, deletions and skipped
     * regions move along the reference without adding anything. A depth never exceeds
     * maxDepth (0 for no limit).
     */

    DepthResult depthForRegion(AlignmentSource &, const Region &, MapQ minQ, Base flank, Depth maxDepth = 0);

    struct DepthOptions
    {
        MapQ minQ = 0;
        Base flank = 0;
        Depth maxDepth = 0;

        // Regions computed in parallel
        Thread threads = 1;

        // Reference FASTA (CRAM)
        FileName ref;
    };

    /*
     * Depth for each region, computed in parallel. Every region reads from its own handle to
     * the file. Results are in the same order as the regions.
     */

    std::vector<DepthResult> depthForRegions(const FileName &, const Regions &, const DepthOptions &);
}

#endif
