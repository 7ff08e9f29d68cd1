#ifndef G_CALIBRATE_HPP
#define G_CALIBRATE_HPP

#include "tools/calibrator.hpp"

namespace SeqCal
{
    struct GCalibrate
    {
        struct Options : public AnalyzerOptions
        {
            Options() {}

            // Target (sequin) regions
            FileName bed;

            // Sample regions, name-aligned with the targets
            FileName sampleBed;

            Coverage fold = 40;

            // Bases removed from both ends of every region
            Base flank = 500;

            Seed seed = 5678;

            /*
             * Only for sample profile matching
             */

            bool profile = false;
            Base window = 100;
            MapQ minQ = 10;

            // Drop reads with a mate outside the calibrated contigs
            bool exclude = false;

            // Output alignments, standard output if empty
            FileName outFile;

            bool cram = false;

            // Reference FASTA (CRAM)
            FileName ref;

            bool writeIndex = false;

            // CSV summary, not written if empty
            FileName summary;
        };

        struct Stats
        {
            CalibrationStats cal;

            // Calibrated coverage for each region (NAN if not measured)
            std::vector<Coverage> calib;
        };

        static CalibrationMode mode(const Options &, const Regions &samples);

        static Stats analyze(const FileName &, const Options &o = Options());

        static void writeSummary(const FileName &, const Stats &, const Options &);

        static void report(const FileName &, const Options &o = Options());
    };
}

#endif
