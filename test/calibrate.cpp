#ifdef UNIT_TEST

#include <catch2/catch.hpp>
#include "sequins/genomics/g_calibrate.hpp"

using namespace SeqCal;

TEST_CASE("GCalibrate_Mode")
{
    const auto samples = Regions { Region("chr1", 0, 1000, "S1") };

    GCalibrate::Options o;
    o.fold = 30;
    o.seed = 1234;

    auto m = GCalibrate::mode(o, samples);
    REQUIRE(m.type == CalibrationMode::Type::FixedCoverage);
    REQUIRE(m.fold == Approx(30));
    REQUIRE(m.seed == 1234);

    o.sampleBed = "sample.bed";
    m = GCalibrate::mode(o, samples);
    REQUIRE(m.type == CalibrationMode::Type::SampleMeanCoverage);
    REQUIRE(m.samples == &samples);

    o.profile = true;
    o.window = 50;
    o.minQ = 20;
    m = GCalibrate::mode(o, samples);
    REQUIRE(m.type == CalibrationMode::Type::SampleProfile);
    REQUIRE(m.flank == 500);
    REQUIRE(m.window == 50);
    REQUIRE(m.minQ == 20);

    // Profile without sample regions
    o.sampleBed.clear();
    REQUIRE_THROWS(GCalibrate::mode(o, samples));
}

TEST_CASE("GCalibrate_Summary")
{
    GCalibrate::Stats stats;

    CalibrationStats::RegionStats r1;
    r1.r = Region("chrQ_mirror", 500, 1500, "S1");
    r1.uncalib = 120.5;
    r1.target = 40;
    r1.p = 0.33;

    CalibrationStats::RegionStats r2;
    r2.r = Region("chrQ_mirror", 2500, 3500, "S2");
    r2.uncalib = 80;
    r2.target = 40;

    stats.cal.regions = { r1, r2 };
    stats.calib = { 39.876, NAN };

    auto w = std::make_shared<MockWriter>();

    GCalibrate::Options o;
    o.writer = w;

    GCalibrate::writeSummary("summary.csv", stats, o);

    REQUIRE(w->lines.size() == 3);
    REQUIRE(w->lines[0] == "name,chrom,start,end,uncalibrated_coverage,target_coverage,calibrated_coverage");
    REQUIRE(w->lines[1] == "S1,chrQ_mirror,500,1500,120.50,40.00,39.88");

    // Not measured for the standard output
    REQUIRE(w->lines[2] == "S2,chrQ_mirror,2500,3500,80.00,40.00,0.00");
}

#endif
