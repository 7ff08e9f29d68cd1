#ifndef CALIBRATOR_HPP
#define CALIBRATOR_HPP

#include "tools/random.hpp"
#include "data/analyzer.hpp"
#include "writers/bam_writer.hpp"
#include "parsers/parser_bam.hpp"

namespace SeqCal
{
    struct CalibrationMode
    {
        enum class Type
        {
            FixedCoverage,
            SampleMeanCoverage,
            SampleProfile
        };

        Type type = Type::FixedCoverage;

        // Defined only for Type::FixedCoverage
        Coverage fold = 40;

        // Sample regions (name-aligned with the targets), not defined for Type::FixedCoverage
        const Regions *samples = nullptr;

        /*
         * Defined only for Type::SampleProfile
         */

        Base flank = 0;
        Base window = 100;
        MapQ minQ = 0;

        Seed seed = 0;

        static CalibrationMode fixed(Coverage fold, Seed seed)
        {
            CalibrationMode m;
            m.type = Type::FixedCoverage;
            m.fold = fold;
            m.seed = seed;
            return m;
        }

        static CalibrationMode sampleMean(const Regions &samples, Seed seed)
        {
            CalibrationMode m;
            m.type = Type::SampleMeanCoverage;
            m.samples = &samples;
            m.seed = seed;
            return m;
        }

        static CalibrationMode sampleProfile(const Regions &samples, Base flank, Base window, MapQ minQ, Seed seed)
        {
            CalibrationMode m;
            m.type = Type::SampleProfile;
            m.samples = &samples;
            m.flank = flank;
            m.window = window;
            m.minQ = minQ;
            m.seed = seed;
            return m;
        }
    };

    struct CalibrationStats
    {
        struct RegionStats
        {
            // Region analyzed (after any flank trimming)
            Region r;

            // Mean coverage before calibration
            Coverage uncalib = NAN;

            // Coverage calibrated to (fold or sample mean, sample mean for a profile)
            Coverage target = NAN;

            // Probability of selection (NAN for a sample profile)
            Probability p = NAN;
        };

        std::vector<RegionStats> regions;

        // Number of query names in the keep set
        Count nKeep = 0;

        // Records written and dropped in the final pass
        Count nWrite = 0;
        Count nSkip  = 0;
    };

    typedef std::map<Name, Probability> Probabilities;

    struct Calibrator
    {
        /*
         * Probability of keeping a read pair for every target region. The target coverage is the
         * mean of the matching sample region (by name) if samples are given, otherwise the fold
         * coverage. Coverages are measured without flank and MAPQ filtering. Throws
         * CalibrationError if a sample region is missing, the target coverage is zero or the
         * target coverage is below the sample coverage.
         */

        static Probabilities probabilities(AlignmentSource &,
                                           const Regions &targets,
                                           const Regions *samples,
                                           Coverage fold,
                                           std::vector<CalibrationStats::RegionStats> *stats = nullptr);

        /*
         * Decide whether a record is kept. A query name is drawn at most once, a mate of a kept
         * read is always kept. Duplicates are never selected.
         */

        static bool subsample(const Alignment &, ReadNames &keep, const ReadNames &considered, RandomSelection &);

        // Number of records with pos in [r.beg, r.end) and mapq >= minQ
        static Count startsIn(AlignmentSource &, const Region &r, MapQ minQ);

        // Read starts for every full window in a region (a trailing partial window is dropped)
        static std::vector<Count> windowStarts(AlignmentSource &, const Region &, Base window, MapQ minQ);

        // Records with pos in [r.beg, r.end), detached from the source
        static std::vector<Alignment> startsInRegion(AlignmentSource &, const Region &r);

        /*
         * Calibrate coverage of the target regions and write the result. Records are written in
         * the order of the source. A record is written if its query name was selected, or if its
         * mate isn't on a calibrated contig and exclude is false.
         */

        static CalibrationStats calibrate(AlignmentSource &,
                                          AlignmentWriter &,
                                          const Regions &targets,
                                          const CalibrationMode &,
                                          bool exclude,
                                          const WriterOptions &o = WriterOptions());
    };
}

#endif
