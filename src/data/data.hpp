#ifndef DATA_HPP
#define DATA_HPP

#include <map>
#include <set>
#include <cmath>
#include <string>
#include <memory>
#include <vector>

namespace SeqCal
{
    typedef unsigned Thread;

    typedef double Coverage;
    typedef double Proportion;
    typedef double Probability;

    typedef std::string Name;
    typedef std::string ChrID;

    typedef std::string Path;
    typedef std::string FileName;
    typedef std::string ReadName;

    typedef long long Base;
    typedef long long Depth;
    typedef long long Count;

    // Mapping quality
    typedef int MapQ;

    typedef unsigned long long Seed;

    typedef std::size_t Index;

    typedef std::string Line;
    typedef long long Progress;

    // Query names that are accepted or evaluated during calibration
    typedef std::set<ReadName> ReadNames;

    // Reference sequence identifiers (htslib tid)
    typedef std::set<int> TIDs;

    const auto NO_DEPTH_LIMIT = static_cast<Depth>(2147483647);
}

#endif
