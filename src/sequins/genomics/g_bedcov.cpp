#include <iostream>
#include "tools/tools.hpp"
#include "tools/coverage.hpp"
#include "parsers/parser_bed.hpp"
#include "sequins/genomics/g_bedcov.hpp"

using namespace SeqCal;

typedef GBedcov::Options Options;

GBedcov::Stats GBedcov::analyze(const FileName &bed, const FileName &file, const Options &o)
{
    const auto regions = ParserBed::read(Reader(bed));
    o.info("Regions: " + std::to_string(regions.size()));

    DepthOptions o_;
    o_.minQ = o.minQ;
    o_.flank = o.flank;
    o_.maxDepth = o.maxDepth;
    o_.threads = o.threads;
    o_.ref = o.ref;

    GBedcov::Stats stats;
    stats.results = depthForRegions(file, regions, o_);

    return stats;
}

std::string GBedcov::header(const std::vector<Depth> &thresholds)
{
    Toks x { "name", "chrom", "beg", "end", "len", "min", "max", "mean", "std", "cv" };

    for (const auto &t : thresholds)
    {
        x.push_back("pct_gt_" + std::to_string(t));
    }

    return join(x, ",");
}

std::string GBedcov::row(const DepthResult &x, const std::vector<Depth> &thresholds)
{
    const auto format = "%1%,%2%,%3%,%4%,%5%,%6%,%7%,%8%,%9%,%10%";

    auto r = (boost::format(format) % x.r.name
                                    % x.r.cID
                                    % x.r.beg
                                    % x.r.end
                                    % x.len()
                                    % S0(x.min())
                                    % S0(x.max())
                                    % S2(x.mean())
                                    % S2(x.sd())
                                    % S2(x.cv())).str();

    for (const auto &t : thresholds)
    {
        r += "," + S2(x.percentAbove(t));
    }

    return r;
}

void GBedcov::writeCSV(std::ostream &out, const Stats &stats, const Options &o)
{
    out << header(o.thresholds) << std::endl;

    for (const auto &i : stats.results)
    {
        out << row(i, o.thresholds) << std::endl;
    }
}

void GBedcov::report(const FileName &bed, const FileName &file, const Options &o)
{
    const auto stats = analyze(bed, file, o);

    std::stringstream ss;
    writeCSV(ss, stats, o);

    if (o.outFile.empty())
    {
        std::cout << ss.str();
    }
    else
    {
        o.generate(o.outFile);
        o.writer->open(o.outFile);
        o.writer->write(ss.str(), false);
        o.writer->close();
    }
}
