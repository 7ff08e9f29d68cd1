#include "tools/tools.hpp"
#include "tools/coverage.hpp"
#include "parsers/parser_bed.hpp"
#include "sequins/genomics/g_calibrate.hpp"

using namespace SeqCal;

typedef GCalibrate::Options Options;

CalibrationMode GCalibrate::mode(const Options &o, const Regions &samples)
{
    if (o.profile)
    {
        S_CHECK(!o.sampleBed.empty(), "Sample profile calibration requires sample regions (--sample_bed)");
        return CalibrationMode::sampleProfile(samples, o.flank, o.window, o.minQ, o.seed);
    }
    else if (!o.sampleBed.empty())
    {
        return CalibrationMode::sampleMean(samples, o.seed);
    }

    return CalibrationMode::fixed(o.fold, o.seed);
}

GCalibrate::Stats GCalibrate::analyze(const FileName &file, const Options &o)
{
    // Fail before spending any time on calibration
    if (!o.summary.empty() && exists(o.summary))
    {
        throw std::runtime_error("The summary report file '" + o.summary + "' already exists");
    }
    else if (o.cram && o.ref.empty())
    {
        throw std::runtime_error("CRAM output requires a reference (--reference)");
    }

    auto targets = ParserBed::read(Reader(o.bed));
    auto samples = o.sampleBed.empty() ? Regions() : ParserBed::read(Reader(o.sampleBed));

    o.info("Target regions: " + std::to_string(targets.size()));

    if (!o.sampleBed.empty())
    {
        o.info("Sample regions: " + std::to_string(samples.size()));
    }

    // Trimmed by the engine for a sample profile
    if (!o.profile)
    {
        targets = trim(targets, o.flank);
        samples = trim(samples, o.flank);
    }

    const auto m = mode(o, samples);

    switch (m.type)
    {
        case CalibrationMode::Type::FixedCoverage:      { o.info("Mode: fixed coverage (" + S2(o.fold) + ")"); break; }
        case CalibrationMode::Type::SampleMeanCoverage: { o.info("Mode: sample mean coverage"); break; }
        case CalibrationMode::Type::SampleProfile:      { o.info("Mode: sample profile"); break; }
    }

    ParserBAM::Options bo;
    bo.threads = o.threads;
    bo.ref = o.ref;

    BAMWriter::Options wo;
    wo.cram = o.cram;
    wo.threads = o.threads;
    wo.ref = o.ref;

    GCalibrate::Stats stats;

    auto src = ParserBAM::open(file, bo);

    BAMWriter w;
    w.open(o.outFile.empty() ? "-" : o.outFile, *src, wo);

    stats.cal = Calibrator::calibrate(*src, w, targets, m, o.exclude, o);

    // Must be closed before indexing
    w.close();

    if (o.outFile.empty())
    {
        if (o.writeIndex)
        {
            o.warn("Index not built for the standard output");
        }
    }
    else if (o.writeIndex || !o.summary.empty())
    {
        o.info("Indexing " + o.outFile);
        BAMWriter::index(o.outFile);
    }

    /*
     * Calibrated coverage, only possible if the output is a file
     */

    stats.calib.resize(stats.cal.regions.size(), NAN);

    if (!o.outFile.empty() && !o.summary.empty())
    {
        auto out = ParserBAM::open(o.outFile, bo);

        for (auto i = 0u; i < stats.cal.regions.size(); i++)
        {
            stats.calib[i] = depthForRegion(*out, stats.cal.regions[i].r, 0, 0).mean();
        }
    }

    return stats;
}

void GCalibrate::writeSummary(const FileName &file, const Stats &stats, const Options &o)
{
    const auto format = "%1%,%2%,%3%,%4%,%5%,%6%,%7%";

    o.generate(file);
    o.writer->open(file);
    o.writer->write((boost::format(format) % "name"
                                           % "chrom"
                                           % "start"
                                           % "end"
                                           % "uncalibrated_coverage"
                                           % "target_coverage"
                                           % "calibrated_coverage").str());

    for (auto i = 0u; i < stats.cal.regions.size(); i++)
    {
        const auto &x = stats.cal.regions[i];

        o.writer->write((boost::format(format) % x.r.name
                                               % x.r.cID
                                               % x.r.beg
                                               % x.r.end
                                               % S2(x.uncalib)
                                               % S2(x.target)
                                               % S2(stats.calib[i])).str());
    }

    o.writer->close();
}

void GCalibrate::report(const FileName &file, const Options &o)
{
    const auto stats = analyze(file, o);

    if (!o.summary.empty())
    {
        writeSummary(o.summary, stats, o);
    }
}
