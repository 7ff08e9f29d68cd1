#ifndef TOOLS_HPP
#define TOOLS_HPP

#include <cmath>
#include <vector>
#include <iomanip>
#include <sstream>
#include "data/data.hpp"
#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace SeqCal
{
    typedef std::string Tok;
    typedef std::vector<Tok> Toks;

    void createD(const Path &);

    bool exists(const FileName &);

    // Eg: 19-10-2026 10:21:33
    std::string date();

    template <typename T> static void split(const Tok &x, const Tok &d, T &r)
    {
        r.clear();
        boost::split(r, x, boost::is_any_of(d));
    }

    inline Tok join(const Toks &x, const std::string &d)
    {
        return boost::algorithm::join(x, d);
    }

    inline bool isBegin(const std::string &x, const std::string &y)
    {
        return boost::algorithm::starts_with(x, y);
    }

    // Fixed precision, an undefined number is rendered as zero
    template <typename T> std::string toString(const T &x, unsigned n = 2)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(n);

        if (std::isnan(x) || !std::isfinite(x))
        {
            out << 0.0;
        }
        else
        {
            out << x;
        }

        return out.str();
    }

    #define S0(x) toString(x,0)
    #define S2(x) toString(x,2)
}

#endif
