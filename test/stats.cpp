#ifdef UNIT_TEST

#include <catch2/catch.hpp>
#include "data/depth.hpp"
#include "tools/tools.hpp"
#include "stats/stats.hpp"

using namespace SeqCal;

TEST_CASE("Stats_1")
{
    const auto x = std::vector<Depth> { 1, 2, 3 };

    REQUIRE(SeqCal::min(x) == 1);
    REQUIRE(SeqCal::max(x) == 3);
    REQUIRE(mean(x) == 2);
    REQUIRE(SD(x) == Approx(0.8164966));
    REQUIRE(CV(x) == Approx(0.4082483));
}

TEST_CASE("Stats_2")
{
    const auto x = std::vector<Depth> {};

    REQUIRE(std::isnan(SeqCal::min(x)));
    REQUIRE(std::isnan(SeqCal::max(x)));
    REQUIRE(std::isnan(mean(x)));
    REQUIRE(std::isnan(SD(x)));
    REQUIRE(std::isnan(CV(x)));
}

TEST_CASE("Stats_3")
{
    const auto x = std::vector<Depth> { 0, 0, 0, 0 };

    REQUIRE(mean(x) == 0);
    REQUIRE(SD(x) == 0);
    REQUIRE(std::isnan(CV(x)));
}

TEST_CASE("PercentAbove")
{
    const auto r = DepthResult(Region("chr1", 0, 4, "A"), DepthResult::Histogram { { 0, 0 }, { 1, 5 }, { 2, 10 }, { 3, 20 } });

    REQUIRE(r.percentAbove(0)  == 1.0);
    REQUIRE(r.percentAbove(5)  == 0.75);
    REQUIRE(r.percentAbove(11) == 0.25);
    REQUIRE(r.percentAbove(21) == 0.0);
    REQUIRE(std::isnan(DepthResult().percentAbove(1)));
}

TEST_CASE("toString_1")
{
    REQUIRE(toString(0.33, 6) == "0.330000");
    REQUIRE(toString(0.7612332244, 6) == "0.761233");
    REQUIRE(S2(2.0) == "2.00");
    REQUIRE(S2(0.816496) == "0.82");
    REQUIRE(S0(3.0) == "3");
    REQUIRE(S2(NAN) == "0.00");
    REQUIRE(S0(NAN) == "0");
}

#endif
