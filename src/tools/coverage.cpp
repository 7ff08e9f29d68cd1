#include <algorithm>
#include <exception>
#include "tools/errors.hpp"
#include "tools/coverage.hpp"

using namespace SeqCal;

DepthResult SeqCal::depthForRegion(AlignmentSource &src, const Region &x, MapQ minQ, Base flank, Depth maxDepth)
{
    const auto r = x.trim(flank);

    if (src.tid(r.cID) < 0)
    {
        throw InvalidRegionError(x, "Chromosome " + r.cID + " not found in BAM header");
    }

    if (maxDepth <= 0)
    {
        maxDepth = NO_DEPTH_LIMIT;
    }

    std::vector<Depth> d(r.length(), 0);

    src.fetch(r);

    ParserBAM::parse(src, [&](const Alignment &i, Progress)
    {
        if (!countDepth(i, minQ))
        {
            return;
        }

        // Relative to the reference
        auto j = i.pos;

        for (const auto &c : i.cigars)
        {
            switch (c.first)
            {
                case BAM_CMATCH:
                case BAM_CEQUAL:
                case BAM_CDIFF:
                {
                    for (auto k = std::max(j, r.beg); k < std::min(j + c.second, r.end); k++)
                    {
                        auto &n = d[k - r.beg];
                        if (n < maxDepth) { n++; }
                    }

                    j += c.second;
                    break;
                }

                case BAM_CDEL:
                case BAM_CREF_SKIP: { j += c.second; break; }

                case BAM_CINS:
                case BAM_CSOFT_CLIP:
                case BAM_CHARD_CLIP:
                case BAM_CPAD:
                case BAM_CBACK: { break; }

                default:
                {
                    throw InvalidFormatException("Unknown CIGAR operation " + std::to_string(c.first) + " for " + i.name);
                }
            }
        }
    });

    DepthResult::Histogram hist;
    hist.reserve(d.size());

    for (auto i = 0u; i < d.size(); i++)
    {
        hist.push_back(std::pair<Base, Depth>(r.beg + i, d[i]));
    }

    return DepthResult(x, hist);
}

std::vector<DepthResult> SeqCal::depthForRegions(const FileName &file, const Regions &x, const DepthOptions &o)
{
    std::vector<DepthResult> r(x.size());

    // First failure of each region
    std::vector<std::exception_ptr> errs(x.size());

    ParserBAM::Options bo;
    bo.ref = o.ref;

    const auto n = static_cast<long>(x.size());

    #pragma omp parallel for schedule(dynamic) num_threads(std::max(1u, o.threads))
    for (long i = 0; i < n; i++)
    {
        try
        {
            // Handles are not safe to share across threads
            auto src = ParserBAM::open(file, bo);
            r[i] = depthForRegion(*src, x[i], o.minQ, o.flank, o.maxDepth);
        }
        catch (...)
        {
            errs[i] = std::current_exception();
        }
    }

    for (const auto &i : errs)
    {
        if (i) { std::rethrow_exception(i); }
    }

    return r;
}
