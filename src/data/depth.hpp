#ifndef DEPTH_HPP
#define DEPTH_HPP

#include "stats/stats.hpp"
#include "data/region.hpp"

namespace SeqCal
{
    /*
     * Per-base depth of a region. The histogram has one (position, depth) entry for every
     * position of the region, uncovered positions are zero. Statistics are NAN if undefined.
     */

    struct DepthResult
    {
        typedef std::vector<std::pair<Base, Depth>> Histogram;

        DepthResult() {}
        DepthResult(const Region &r, const Histogram &hist) : r(r), hist(hist) {}

        inline Count len() const { return static_cast<Count>(hist.size()); }

        // Depths without positions
        inline std::vector<Depth> depths() const
        {
            std::vector<Depth> x;
            x.reserve(hist.size());
            for (const auto &i : hist) { x.push_back(i.second); }
            return x;
        }

        inline double min()  const { return SeqCal::min(depths());  }
        inline double max()  const { return SeqCal::max(depths());  }
        inline double mean() const { return SeqCal::mean(depths()); }
        inline double sd()   const { return SeqCal::SD(depths());   }
        inline double cv()   const { return SeqCal::CV(depths());   }

        // Fraction of positions with depth >= t
        inline Proportion percentAbove(Depth t) const
        {
            if (hist.empty())
            {
                return NAN;
            }

            const auto n = std::count_if(hist.begin(), hist.end(), [&](const std::pair<Base, Depth> &i)
            {
                return i.second >= t;
            });

            return static_cast<Proportion>(n) / hist.size();
        }

        // The region queried (before any flank trimming)
        Region r;

        Histogram hist;
    };
}

#endif
