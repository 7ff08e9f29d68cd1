#ifndef PARSER_BED_HPP
#define PARSER_BED_HPP

#include <cctype>
#include <algorithm>
#include "data/region.hpp"
#include "data/reader.hpp"
#include "tools/errors.hpp"
#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

namespace SeqCal
{
    struct ParserBed
    {
        typedef Region Data;

        static bool isInteger(const std::string &x)
        {
            return !x.empty() && std::all_of(x.begin(), x.end(), [](char c) { return isdigit(static_cast<unsigned char>(c)); });
        }

        /*
         * Parse a region list with at least four columns (contig, 0-based start, end, name). Header
         * lines ("track", "browser" and "#") and empty lines are skipped.
         */

        template <typename F> static void parse(const Reader &r, F f)
        {
            Line line;
            Progress i = 0;

            std::vector<std::string> toks;

            while (r.nextLine(line))
            {
                i++;
                boost::trim(line);

                if (line.empty() || line[0] == '#' || boost::starts_with(line, "track") || boost::starts_with(line, "browser"))
                {
                    continue;
                }

                boost::split(toks, line, boost::is_any_of(" \t"), boost::token_compress_on);

                if (toks.size() < 4)
                {
                    throw InvalidFormatException((boost::format("Incorrect number of columns detected, expected >= 4 found %1% (line = %2%)") % toks.size() % i).str());
                }
                else if (!isInteger(toks[1]))
                {
                    throw InvalidFormatException((boost::format("Beg column is not an integer: is %1% (line = %2%)") % toks[1] % i).str());
                }
                else if (!isInteger(toks[2]))
                {
                    throw InvalidFormatException((boost::format("End column is not an integer: is %1% (line = %2%)") % toks[2] % i).str());
                }

                Data d;

                try
                {
                    d = Region(toks[0], std::stoll(toks[1]), std::stoll(toks[2]), toks[3]);
                }
                catch (const std::out_of_range &)
                {
                    throw InvalidFormatException((boost::format("Position out of range (line = %1%)") % i).str());
                }

                f(d, i);
            }
        }

        static Regions read(const Reader &r)
        {
            Regions x;
            parse(r, [&](const Data &d, Progress) { x.push_back(d); });
            return x;
        }
    };
}

#endif
