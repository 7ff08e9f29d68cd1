#ifdef UNIT_TEST

#include <catch2/catch.hpp>
#include "fixture.hpp"
#include "tools/tools.hpp"
#include "data/reader.hpp"

using namespace SeqCal;

extern int parse_options(int argc, char ** argv);

static int run(const std::vector<std::string> &args)
{
    std::vector<std::vector<char>> x;
    std::vector<char *> argv;

    for (const auto &i : args)
    {
        x.push_back(std::vector<char>(i.begin(), i.end()));
        x.back().push_back('\0');
    }

    for (auto &i : x)
    {
        argv.push_back(i.data());
    }

    argv.push_back(nullptr);
    return parse_options(static_cast<int>(args.size()), argv.data());
}

// Second line of a report
static Line row(const FileName &file)
{
    Reader r(file);

    Line l;
    r.nextLine(l);
    r.nextLine(l);

    return l;
}

TEST_CASE("Cli_Bedcov_Flank")
{
    const auto dir = mockDir();
    const auto bam = mockBAM(dir, { mockRead("R1", CHR1, 100, 300), mockRead("R2", CHR1, 150, 100) });
    const auto bed = dir + "/regions.bed";

    mockText(bed, "chr1\t100\t400\tA\n");

    // Options before the arguments
    REQUIRE(run({ "seqcal", "bedcov", "-f", "50", "-o", dir + "/flank.csv", bed, bam }) == 0);
    REQUIRE(isBegin(row(dir + "/flank.csv"), "A,chr1,100,400,200,1,2,"));

    REQUIRE(run({ "seqcal", "bedcov", "-flank", "50", "-o", dir + "/flank2.csv", bed, bam }) == 0);
    REQUIRE(isBegin(row(dir + "/flank2.csv"), "A,chr1,100,400,200,1,2,"));

    REQUIRE(run({ "seqcal", "bedcov", "-o", dir + "/all.csv", bed, bam }) == 0);
    REQUIRE(isBegin(row(dir + "/all.csv"), "A,chr1,100,400,300,1,2,"));
}

TEST_CASE("Cli_Options")
{
    const auto dir = mockDir();
    const auto bed = dir + "/regions.bed";

    mockText(bed, "chr1\t100\t400\tA\n");

    // Calibration options for bedcov
    REQUIRE(run({ "seqcal", "bedcov", "-profile", bed, "x.bam" }) == 1);
    REQUIRE(run({ "seqcal", "bedcov", "-fold_coverage", "20", bed, "x.bam" }) == 1);
    REQUIRE(run({ "seqcal", "bedcov", "-b", bed, bed, "x.bam" }) == 1);

    // Bedcov options for calibrate
    REQUIRE(run({ "seqcal", "calibrate", "-thresholds", "10", "-b", bed, "x.bam" }) == 1);
    REQUIRE(run({ "seqcal", "calibrate", "-d", "10", "-b", bed, "x.bam" }) == 1);

    // Unknown to both
    REQUIRE(run({ "seqcal", "bedcov", "-unknown", bed, "x.bam" }) == 1);
    REQUIRE(run({ "seqcal", "calibrate", "-debug", "-b", bed, "x.bam" }) == 1);

    // Invalid values
    REQUIRE(run({ "seqcal", "bedcov", "-f", "x", bed, "x.bam" }) == 1);
    REQUIRE(run({ "seqcal", "calibrate", "-f", "x", "-b", bed, "x.bam" }) == 1);
}

#endif
