#ifndef STATS_HPP
#define STATS_HPP

#include <cmath>
#include <vector>
#include <algorithm>
#include "data/data.hpp"

namespace SeqCal
{
    /*
     * Summary statistics are NAN for an empty input
     */

    template <typename T> double min(const T &x)
    {
        return x.empty() ? NAN : static_cast<double>(*(std::min_element(x.begin(), x.end())));
    }

    template <typename T> double max(const T &x)
    {
        return x.empty() ? NAN : static_cast<double>(*(std::max_element(x.begin(), x.end())));
    }

    template <typename T> double mean(const T &x)
    {
        if (x.empty())
        {
            return NAN;
        }

        double sum = 0;
        for (const auto &i : x) { sum += i; }
        return sum / x.size();
    }

    // Population standard deviation (divided by N)
    template <typename T> double SD(const T &x)
    {
        if (x.empty())
        {
            return NAN;
        }

        const auto mu = mean(x);

        double ss = 0;

        for (const auto &i : x)
        {
            ss += (i - mu) * (i - mu);
        }

        return std::sqrt(ss / x.size());
    }

    // Coefficient of variation, NAN if the mean is zero
    template <typename T> double CV(const T &x)
    {
        const auto mu = mean(x);
        return (std::isnan(mu) || mu == 0) ? NAN : SD(x) / mu;
    }
}

#endif
