#ifndef G_BEDCOV_HPP
#define G_BEDCOV_HPP

#include "data/depth.hpp"
#include "data/analyzer.hpp"

namespace SeqCal
{
    struct GBedcov
    {
        struct Options : public AnalyzerOptions
        {
            Options() {}

            MapQ minQ = 0;

            // Bases removed from both ends of every region
            Base flank = 0;

            // Depth cap for a position (0 for no limit)
            Depth maxDepth = 8000;

            // Depths for the pct_gt_ columns
            std::vector<Depth> thresholds;

            // Reference FASTA (CRAM)
            FileName ref;

            // Report file, standard output if empty
            FileName outFile;
        };

        struct Stats
        {
            // One for each region, in the order of the region file
            std::vector<DepthResult> results;
        };

        static Stats analyze(const FileName &bed, const FileName &file, const Options &o = Options());

        // Eg: name,chrom,beg,end,len,min,max,mean,std,cv,pct_gt_10
        static std::string header(const std::vector<Depth> &thresholds);

        static std::string row(const DepthResult &, const std::vector<Depth> &thresholds);

        static void writeCSV(std::ostream &, const Stats &, const Options &);

        static void report(const FileName &bed, const FileName &file, const Options &o = Options());
    };
}

#endif
