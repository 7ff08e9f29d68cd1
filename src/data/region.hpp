#ifndef REGION_HPP
#define REGION_HPP

#include <limits>
#include <string>
#include <vector>
#include "data/data.hpp"
#include "tools/errors.hpp"

namespace SeqCal
{
    /*
     * Named interval on a contig. Positions are 0-based and half-open, like BED.
     */

    class Region
    {
        public:

            Region(const ChrID &cID = "", Base beg = 0, Base end = 0, const Name &name = "")
                    : cID(cID), beg(beg), end(end), name(name) {}

            /*
             * Remove flank bases from both ends. The trimmed region must still be non-empty,
             * nothing is clamped.
             */

            Region trim(Base flank) const
            {
                if (flank < 0)
                {
                    throw InvalidRegionError(*this, "Negative flank for region");
                }
                else if (beg > std::numeric_limits<Base>::max() - flank)
                {
                    throw InvalidRegionError(*this, "Region start + flank overflowed for region");
                }
                else if (end < flank)
                {
                    throw InvalidRegionError(*this, "Region end - flank underflowed for region");
                }
                else if (beg + flank >= end - flank)
                {
                    throw InvalidRegionError(*this, "Region start >= end after applying flank for region");
                }

                return Region(cID, beg + flank, end - flank, name);
            }

            inline Base length() const { return end - beg; }

            inline bool contains(Base p) const { return p >= beg && p < end; }

            inline bool operator!=(const Region &r) const { return !operator==(r); }
            inline bool operator==(const Region &r) const
            {
                return cID == r.cID && beg == r.beg && end == r.end && name == r.name;
            }

            // Eg: chr1:100-200
            inline operator std::string() const
            {
                return cID + ":" + std::to_string(beg) + "-" + std::to_string(end);
            }

            ChrID cID;
            Base beg, end;

            // 4-th column in BED
            Name name;
    };

    typedef std::vector<Region> Regions;

    inline Regions trim(const Regions &x, Base flank)
    {
        Regions r;

        for (const auto &i : x)
        {
            r.push_back(i.trim(flank));
        }

        return r;
    }

    inline std::set<ChrID> contigs(const Regions &x)
    {
        std::set<ChrID> r;
        for (const auto &i : x) { r.insert(i.cID); }
        return r;
    }
}

#endif
