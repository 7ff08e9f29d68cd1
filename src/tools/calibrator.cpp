#include <algorithm>
#include "tools/tools.hpp"
#include "tools/coverage.hpp"
#include "tools/calibrator.hpp"

using namespace SeqCal;

typedef CalibrationMode::Type Type;
typedef CalibrationStats::RegionStats RegionStats;

// Mean coverage of a region without any filtering
static Coverage meanCoverage(AlignmentSource &src, const Region &r)
{
    return depthForRegion(src, r, 0, 0).mean();
}

// Header indexes of the contigs being calibrated
static TIDs calibratedTIDs(const AlignmentSource &src, const Regions &x)
{
    TIDs tids;

    for (const auto &cID : contigs(x))
    {
        const auto tid = src.tid(cID);

        if (tid >= 0)
        {
            tids.insert(tid);
        }
    }

    return tids;
}

static std::map<Name, const Region *> byName(const Regions &x)
{
    std::map<Name, const Region *> m;
    for (const auto &i : x) { m[i.name] = &i; }
    return m;
}

Probabilities Calibrator::probabilities(AlignmentSource &src,
                                        const Regions &targets,
                                        const Regions *samples,
                                        Coverage fold,
                                        std::vector<RegionStats> *stats)
{
    Probabilities r;

    const auto m = samples ? byName(*samples) : std::map<Name, const Region *>();

    for (const auto &i : targets)
    {
        const auto target = meanCoverage(src, i);

        auto sample = fold;

        if (samples)
        {
            if (!m.count(i.name))
            {
                throw CalibrationError("No sample mean coverage found for target region " + i.name);
            }

            sample = meanCoverage(src, *m.at(i.name));
        }

        if (target == 0)
        {
            throw CalibrationError("Target mean coverage for region " + i.name + " is zero");
        }
        else if (target < sample)
        {
            throw CalibrationError("Target mean coverage for region " + i.name + " is less than sample mean coverage");
        }

        r[i.name] = sample / target;

        if (stats)
        {
            RegionStats x;
            x.r = i;
            x.uncalib = target;
            x.target = sample;
            x.p = r[i.name];
            stats->push_back(x);
        }
    }

    return r;
}

bool Calibrator::subsample(const Alignment &x, ReadNames &keep, const ReadNames &considered, RandomSelection &s)
{
    if (x.isDuplicate())
    {
        return false;
    }
    else if (keep.count(x.name))
    {
        // Mate already selected
        return true;
    }
    else if (considered.count(x.name))
    {
        // Mate already rejected
        return false;
    }
    else if (s.select())
    {
        keep.insert(x.name);
        return true;
    }

    return false;
}

Count Calibrator::startsIn(AlignmentSource &src, const Region &r, MapQ minQ)
{
    Count n = 0;

    src.fetch(r);

    ParserBAM::parse(src, [&](const Alignment &x, Progress)
    {
        if (r.contains(x.pos) && x.mapq >= minQ)
        {
            n++;
        }
    });

    return n;
}

std::vector<Count> Calibrator::windowStarts(AlignmentSource &src, const Region &r, Base window, MapQ minQ)
{
    S_CHECK(window > 0, "Window size must be positive");

    std::vector<Count> x;

    for (Base i = 0; i < r.length() / window; i++)
    {
        const auto beg = r.beg + i * window;
        x.push_back(startsIn(src, Region(r.cID, beg, beg + window, r.name), minQ));
    }

    return x;
}

std::vector<Alignment> Calibrator::startsInRegion(AlignmentSource &src, const Region &r)
{
    std::vector<Alignment> x;

    src.fetch(r);

    ParserBAM::parse(src, [&](const Alignment &i, Progress)
    {
        if (r.contains(i.pos))
        {
            x.push_back(i);

            // Only valid until the next record
            x.back().b = nullptr;
        }
    });

    return x;
}

static void calibrateByCoverage(AlignmentSource &src,
                                const Regions &targets,
                                const CalibrationMode &m,
                                const TIDs &tids,
                                ReadNames &keep,
                                CalibrationStats &stats,
                                const WriterOptions &o)
{
    const auto samples = m.type == Type::SampleMeanCoverage ? m.samples : nullptr;
    const auto probs = Calibrator::probabilities(src, targets, samples, m.fold, &stats.regions);

    ReadNames considered;

    for (const auto &i : stats.regions)
    {
        o.info((boost::format("Calibrating %1% (%2%) mean_coverage=%3% target_coverage=%4% probability=%5%")
                                    % i.r.name
                                    % std::string(i.r)
                                    % S2(i.uncalib)
                                    % S2(i.target)
                                    % toString(i.p, 4)).str());

        // Independent of the other regions
        RandomSelection s(probs.at(i.r.name), m.seed);

        src.fetch(i.r);

        ParserBAM::parse(src, [&](const Alignment &x, Progress)
        {
            if (tids.count(x.mtid))
            {
                Calibrator::subsample(x, keep, considered, s);
            }

            considered.insert(x.name);
        });
    }
}

static void calibrateByProfile(AlignmentSource &src,
                               const Regions &targets,
                               const CalibrationMode &m,
                               ReadNames &keep,
                               CalibrationStats &stats,
                               const WriterOptions &o)
{
    S_CHECK(m.samples, "Sample regions required for sample profile calibration");

    const auto ts = trim(targets, m.flank);
    const auto ss = trim(*m.samples, m.flank);
    const auto sm = byName(ss);

    for (const auto &t : ts)
    {
        o.info("Calibrating region " + t.name);

        if (!sm.count(t.name))
        {
            throw CalibrationError("No matching sample region found for target region " + t.name);
        }

        const auto &s = *sm.at(t.name);

        // The target is a mirror of the sample
        auto starts = Calibrator::windowStarts(src, s, m.window, m.minQ);
        std::reverse(starts.begin(), starts.end());

        const auto records = Calibrator::startsInRegion(src, t);
        const auto n = t.length() / m.window;

        if (static_cast<std::size_t>(n) > starts.size())
        {
            o.warn((boost::format("Sample region %1% has %2% windows, target region has %3%. Nothing is kept for the remaining windows.")
                                            % s.name % starts.size() % n).str());
        }

        for (Base i = 0; i < n; i++)
        {
            const auto w = Region(t.cID, t.beg + i * m.window, t.beg + (i + 1) * m.window, t.name);

            std::vector<const Alignment *> x;

            for (const auto &j : records)
            {
                if (w.contains(j.pos)) { x.push_back(&j); }
            }

            // Each selection keeps a pair, compensate by halving (approximation)
            const auto k = static_cast<std::size_t>(i) < starts.size() ? starts[i] / 2 : 0;

            for (const auto &j : chooseFrom(x.size(), static_cast<Index>(k), m.seed))
            {
                if (!isUTF8(x[j]->name))
                {
                    throw InvalidFormatException("Invalid UTF-8 in query name: " + x[j]->name);
                }

                keep.insert(x[j]->name);
            }
        }

        RegionStats r;
        r.r = t;
        r.uncalib = meanCoverage(src, t);
        r.target  = meanCoverage(src, s);
        stats.regions.push_back(r);
    }
}

CalibrationStats Calibrator::calibrate(AlignmentSource &src,
                                       AlignmentWriter &w,
                                       const Regions &targets,
                                       const CalibrationMode &m,
                                       bool exclude,
                                       const WriterOptions &o)
{
    CalibrationStats stats;

    const auto tids = calibratedTIDs(src, targets);

    ReadNames keep;

    switch (m.type)
    {
        case Type::FixedCoverage:
        case Type::SampleMeanCoverage:
        {
            calibrateByCoverage(src, targets, m, tids, keep, stats, o);
            break;
        }

        case Type::SampleProfile:
        {
            calibrateByProfile(src, targets, m, keep, stats, o);
            break;
        }
    }

    stats.nKeep = keep.size();
    o.info("Selected pairs: " + std::to_string(stats.nKeep));

    /*
     * Final pass over every record, unmapped included
     */

    src.fetchAll();

    ParserBAM::parse(src, [&](const Alignment &x, Progress i)
    {
        if (i && !(i % 1000000)) { o.wait(S0(i)); }

        if (keep.count(x.name) || (!tids.count(x.mtid) && !exclude))
        {
            stats.nWrite++;
            w.write(x);
        }
        else
        {
            stats.nSkip++;
        }
    });

    o.info("Written: " + std::to_string(stats.nWrite));
    o.info("Skipped: " + std::to_string(stats.nSkip));

    return stats;
}
