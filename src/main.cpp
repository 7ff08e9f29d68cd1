#include <chrono>
#include <iostream>
#include <unistd.h>
#include <getopt.h>
#include <string.h>

#include "tools/tools.hpp"
#include "tools/errors.hpp"
#include "writers/file_writer.hpp"
#include "writers/terminal_writer.hpp"
#include "sequins/genomics/g_bedcov.hpp"
#include "sequins/genomics/g_calibrate.hpp"

#ifdef UNIT_TEST
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#endif

using namespace SeqCal;

typedef int Option;

typedef std::string Value;

static std::string version() { return "1.0.0"; }

/*
 * Options specified in the command line
 */

#define OPT_TOOL    321

#define OPT_BED      801
#define OPT_SAMPLE   802
#define OPT_FOLD     803
#define OPT_FLANK    804
#define OPT_SEED     805
#define OPT_WINDOW   806
#define OPT_MAPQ     807
#define OPT_PROFILE  808
#define OPT_EXCLUDE  809
#define OPT_OUTPUT   810
#define OPT_CRAM     811
#define OPT_REF      812
#define OPT_INDEX    813
#define OPT_SUMMARY  814
#define OPT_THREAD   815
#define OPT_DEPTH    816
#define OPT_THRES    817

enum class Tool
{
    Calibrate,
    Bedcov
};

static std::map<Value, Tool> _tools =
{
    { "calibrate", Tool::Calibrate },
    { "bedcov",    Tool::Bedcov    }
};

// Options accepted by each tool
static std::map<Tool, std::set<Option>> _options =
{
    { Tool::Calibrate, { OPT_BED, OPT_SAMPLE, OPT_FOLD, OPT_FLANK, OPT_SEED, OPT_WINDOW, OPT_MAPQ, OPT_PROFILE,
                         OPT_EXCLUDE, OPT_OUTPUT, OPT_CRAM, OPT_REF, OPT_INDEX, OPT_SUMMARY, OPT_THREAD } },
    { Tool::Bedcov,    { OPT_MAPQ, OPT_FLANK, OPT_DEPTH, OPT_THRES, OPT_REF, OPT_THREAD, OPT_OUTPUT } }
};

struct Parsing
{
    // Specific options
    std::map<Option, std::string> opts;

    // Positional arguments after the options
    std::vector<Value> args;

    // How SeqCal is invoked
    std::string cmd;

    Tool tool;
};

// Wrap the variables so that it'll be easier to reset them
static Parsing _p;

static Path __working__;

static std::shared_ptr<FileWriter> __loggerW__;
static std::shared_ptr<TerminalWriter> __outputW__;

struct InvalidUsageException : public std::exception {};

struct InvalidOptionException : public std::exception
{
    InvalidOptionException(const std::string &o) : o(o) {}

    const std::string o;
};

struct InvalidValueException : public std::exception
{
    InvalidValueException(const std::string &o, const std::string &v) : o(o), v(v) {}

    const std::string o, v;
};

struct InvalidToolError : public InvalidValueException
{
    InvalidToolError(const std::string &v) : InvalidValueException("tool", v) {}
};

struct MissingOptionError : public std::exception
{
    MissingOptionError(const std::string &o) : o(o) {}

    // Option that is missing
    const std::string o;
};

static const char *short_opts = ":";

static const struct option long_opts[] =
{
    { "b",   required_argument, 0, OPT_BED },
    { "bed", required_argument, 0, OPT_BED },

    { "S",          required_argument, 0, OPT_SAMPLE },
    { "sample_bed", required_argument, 0, OPT_SAMPLE },
    { "sample-bed", required_argument, 0, OPT_SAMPLE },

    { "f",             required_argument, 0, OPT_FOLD },
    { "fold_coverage", required_argument, 0, OPT_FOLD },
    { "fold-coverage", required_argument, 0, OPT_FOLD },

    { "flank", required_argument, 0, OPT_FLANK },

    { "s",    required_argument, 0, OPT_SEED },
    { "seed", required_argument, 0, OPT_SEED },

    { "w",           required_argument, 0, OPT_WINDOW },
    { "window",      required_argument, 0, OPT_WINDOW },
    { "window_size", required_argument, 0, OPT_WINDOW },
    { "window-size", required_argument, 0, OPT_WINDOW },

    { "q",        required_argument, 0, OPT_MAPQ },
    { "Q",        required_argument, 0, OPT_MAPQ },
    { "min_mapq", required_argument, 0, OPT_MAPQ },
    { "min-MQ",   required_argument, 0, OPT_MAPQ },

    { "profile",      no_argument, 0, OPT_PROFILE },
    { "experimental", no_argument, 0, OPT_PROFILE },

    { "x",                          no_argument, 0, OPT_EXCLUDE },
    { "exclude_uncalibrated",       no_argument, 0, OPT_EXCLUDE },
    { "exclude-uncalibrated-reads", no_argument, 0, OPT_EXCLUDE },

    { "o",      required_argument, 0, OPT_OUTPUT },
    { "output", required_argument, 0, OPT_OUTPUT },

    { "C",    no_argument, 0, OPT_CRAM },
    { "cram", no_argument, 0, OPT_CRAM },

    { "T",         required_argument, 0, OPT_REF },
    { "reference", required_argument, 0, OPT_REF },

    { "write_index", no_argument, 0, OPT_INDEX },
    { "write-index", no_argument, 0, OPT_INDEX },

    { "summary_report", required_argument, 0, OPT_SUMMARY },
    { "summary-report", required_argument, 0, OPT_SUMMARY },

    { "t",       required_argument, 0, OPT_THREAD },
    { "threads", required_argument, 0, OPT_THREAD },

    { "d",         required_argument, 0, OPT_DEPTH },
    { "max_depth", required_argument, 0, OPT_DEPTH },
    { "max-depth", required_argument, 0, OPT_DEPTH },

    { "thresholds", required_argument, 0, OPT_THRES },

    {0, 0, 0, 0 }
};

static std::string optToStr(int opt)
{
    for (const auto &o : long_opts)
    {
        if (o.val == opt)
        {
            return o.name;
        }
    }

    throw std::runtime_error("Invalid option: " + std::to_string(opt));
}

static std::string manual(Tool tool)
{
    switch (tool)
    {
        case Tool::Calibrate:
        {
            return "seqcal calibrate -b <sequin.bed> [options] <alignments>\n\n"
                   "  -b, -bed <file>            Target (sequin) regions\n"
                   "  -S, -sample_bed <file>     Sample regions matching the targets by name\n"
                   "  -f, -fold_coverage <n>     Target fold coverage (default 40)\n"
                   "  -flank <n>                 Bases removed from both ends of a region (default 500)\n"
                   "  -s, -seed <n>              Random seed (default 5678)\n"
                   "  -w, -window <n>            Window size for sample profile (default 100)\n"
                   "  -q, -min_mapq <n>          MAPQ for sample profile read starts (default 10)\n"
                   "  -profile                   Match the sample coverage profile\n"
                   "  -x, -exclude_uncalibrated  Drop reads with a mate outside the calibrated contigs\n"
                   "  -o, -output <file>         Output alignments (default standard output)\n"
                   "  -C, -cram                  Write CRAM (requires -reference)\n"
                   "  -T, -reference <file>      Reference FASTA\n"
                   "  -write_index               Index the output\n"
                   "  -summary_report <file>     CSV summary of the calibration\n"
                   "  -t, -threads <n>           htslib threads (default 1)";
        }

        case Tool::Bedcov:
        {
            return "seqcal bedcov [options] <regions.bed> <alignments>\n\n"
                   "  -Q, -min_mapq <n>          MAPQ threshold (default 0)\n"
                   "  -f, -flank <n>             Bases removed from both ends of a region (default 0)\n"
                   "  -d, -max_depth <n>         Depth cap for a position, 0 for no limit (default 8000)\n"
                   "  -thresholds <n,n,...>      Depths for pct_gt_ columns\n"
                   "  -T, -reference <file>      Reference FASTA\n"
                   "  -t, -threads <n>           Regions in parallel (default 1)\n"
                   "  -o, -output <file>         Report (default standard output)";
        }
    }

    throw std::runtime_error("Unknown tool");
}

static void printUsage()
{
    std::cout << std::endl << "SeqCal v" << version() << std::endl << std::endl
              << "Usage: seqcal <tool> [options]" << std::endl << std::endl
              << "Tools:" << std::endl
              << "  calibrate  Calibrate coverage of sequin regions" << std::endl
              << "  bedcov     Read depth for regions" << std::endl << std::endl;
}

inline std::string option(const Option &key, const std::string &x = "")
{
    return _p.opts.count(key) ? _p.opts[key] : x;
}

static long long toInteger(Option opt, const Value &val, long long min = 0)
{
    try
    {
        std::size_t n;
        const auto x = stoll(val, &n);

        if (n == val.size() && x >= min)
        {
            return x;
        }
    }
    catch (const std::logic_error &) {}

    throw InvalidValueException("-" + optToStr(opt), val);
}

static double toNumber(Option opt, const Value &val, double min = 0)
{
    try
    {
        std::size_t n;
        const auto x = stod(val, &n);

        if (n == val.size() && x >= min)
        {
            return x;
        }
    }
    catch (const std::logic_error &) {}

    throw InvalidValueException("-" + optToStr(opt), val);
}

template <typename O, typename F> void start(const std::string &name, F f, O &o)
{
    o.output = __outputW__;
    o.logger = __loggerW__;
    o.writer = std::make_shared<FileWriter>();

    o.name = name;
    o.cmd = _p.cmd;
    o.version = version();
    o.threads = static_cast<Thread>(toInteger(OPT_THREAD, option(OPT_THREAD, "1"), 1));

    o.logInfo("-----------------------------------------");
    o.logInfo("------------- SeqCal v" + o.version + " -------------");
    o.logInfo("-----------------------------------------");
    o.logInfo(o.cmd);
    o.logInfo(date());

    using namespace std::chrono;

    auto begin = high_resolution_clock::now();

    f(o);

    auto end = high_resolution_clock::now();

    const auto elapsed = (boost::format("Completed %1%. %2% seconds.") % o.name % duration_cast<seconds>(end - begin).count()).str();
    o.info(elapsed);

    o.logger->close();
}

void parse(int argc, char ** argv)
{
    _p = Parsing();

    if ((argc <= 1) || (!strcmp(argv[1], "-h") || !strcmp(argv[1], "--help")))
    {
        printUsage();
        return;
    }

    /*
     * Reconstruct the overall command
     */

    for (auto i = 0; i < argc; i++)
    {
        _p.cmd += std::string(argv[i]) + " ";
    }

    if (strcmp(argv[1], "-v") == 0)
    {
        std::cout << version() << std::endl;
        return;
    }
    else if (strcmp(argv[1], "-t") == 0)
    {
#ifdef UNIT_TEST
        if (Catch::Session().run(1, argv))
        {
            S_THROW("Unit tests failed");
        }
#else
        S_THROW("UNIT_TEST is undefined");
#endif
        return;
    }
    else if (!_tools.count(argv[1]))
    {
        throw InvalidToolError(argv[1]);
    }

    _p.tool = _tools[argv[1]];
    const auto isHelp = argc >= 3 && (!strcmp(argv[2], "-h") || !strcmp(argv[2], "--help"));

    if (isHelp)
    {
        std::cout << std::endl << manual(_p.tool) << std::endl << std::endl;
        return;
    }

    /*
     * Pre-process arguments. This way, we can examine the options in whatever order we'd like to
     */

    std::vector<Value>  vals;
    std::vector<Option> opts;

    // Skip the tool, also required for unit-testing
    optind = 2;

    int next, index = -1;

    while ((next = getopt_long_only(argc, argv, short_opts, long_opts, &index)) != -1)
    {
        if (next < OPT_TOOL || index < 0)
        {
            throw InvalidOptionException(argv[optind - 1]);
        }

        const auto name = std::string(long_opts[index].name);
        index = -1;

        // "-f" is the flank for bedcov
        if (_p.tool == Tool::Bedcov && name == "f")
        {
            next = OPT_FLANK;
        }

        if (!_options.at(_p.tool).count(next))
        {
            throw InvalidOptionException("-" + name);
        }

        opts.push_back(next);
        vals.push_back(optarg ? std::string(optarg) : "");
    }

    for (auto i = optind; i < argc; i++)
    {
        _p.args.push_back(argv[i]);
    }

    for (auto i = 0u; i < opts.size(); i++)
    {
        auto opt = opts[i];
        auto val = vals[i];

        switch (opt)
        {
            case OPT_FLANK:
            case OPT_SEED:
            case OPT_MAPQ:
            case OPT_DEPTH:
            case OPT_THREAD:
            {
                toInteger(opt, val);
                _p.opts[opt] = val;
                break;
            }

            case OPT_FOLD:
            {
                toNumber(opt, val);
                _p.opts[opt] = val;
                break;
            }

            case OPT_WINDOW:
            {
                toInteger(opt, val, 1);
                _p.opts[opt] = val;
                break;
            }

            case OPT_THRES:
            {
                std::vector<std::string> toks;
                split(val, ",", toks);

                for (const auto &t : toks)
                {
                    toInteger(opt, t);
                }

                _p.opts[opt] = val;
                break;
            }

            case OPT_BED:
            case OPT_SAMPLE:
            {
                if (!std::ifstream(val).good())
                {
                    throw InvalidFileError(val);
                }

                _p.opts[opt] = val;
                break;
            }

            default:
            {
                _p.opts[opt] = val;
                break;
            }
        }
    }

    __outputW__ = std::make_shared<TerminalWriter>();
    __loggerW__ = std::make_shared<FileWriter>(__working__);
    __loggerW__->open("seqcal.log");

    auto checkFile = [&](const FileName &file)
    {
        if (!std::ifstream(file).good())
        {
            throw InvalidFileError(file);
        }

        return file;
    };

    switch (_p.tool)
    {
        case Tool::Calibrate:
        {
            if (!_p.opts.count(OPT_BED))
            {
                throw MissingOptionError("-" + optToStr(OPT_BED));
            }
            else if (_p.args.size() != 1)
            {
                throw InvalidUsageException();
            }

            GCalibrate::Options o;

            o.bed        = _p.opts[OPT_BED];
            o.sampleBed  = option(OPT_SAMPLE);
            o.fold       = toNumber(OPT_FOLD, option(OPT_FOLD, "40"));
            o.flank      = toInteger(OPT_FLANK, option(OPT_FLANK, "500"));
            o.seed       = static_cast<Seed>(toInteger(OPT_SEED, option(OPT_SEED, "5678")));
            o.window     = toInteger(OPT_WINDOW, option(OPT_WINDOW, "100"), 1);
            o.minQ       = static_cast<MapQ>(toInteger(OPT_MAPQ, option(OPT_MAPQ, "10")));
            o.profile    = _p.opts.count(OPT_PROFILE);
            o.exclude    = _p.opts.count(OPT_EXCLUDE);
            o.outFile    = option(OPT_OUTPUT);
            o.cram       = _p.opts.count(OPT_CRAM);
            o.ref        = option(OPT_REF);
            o.writeIndex = _p.opts.count(OPT_INDEX);
            o.summary    = option(OPT_SUMMARY);

            const auto file = checkFile(_p.args[0]);

            start("calibrate", [&](const GCalibrate::Options &o)
            {
                GCalibrate::report(file, o);
            }, o);

            break;
        }

        case Tool::Bedcov:
        {
            if (_p.args.size() != 2)
            {
                throw InvalidUsageException();
            }

            GBedcov::Options o;

            o.minQ     = static_cast<MapQ>(toInteger(OPT_MAPQ, option(OPT_MAPQ, "0")));
            o.flank    = toInteger(OPT_FLANK, option(OPT_FLANK, "0"));
            o.maxDepth = toInteger(OPT_DEPTH, option(OPT_DEPTH, "8000"));
            o.ref      = option(OPT_REF);
            o.outFile  = option(OPT_OUTPUT);

            if (_p.opts.count(OPT_THRES))
            {
                std::vector<std::string> toks;
                split(_p.opts[OPT_THRES], ",", toks);

                for (const auto &t : toks)
                {
                    o.thresholds.push_back(toInteger(OPT_THRES, t));
                }
            }

            const auto bed  = checkFile(_p.args[0]);
            const auto file = checkFile(_p.args[1]);

            start("bedcov", [&](const GBedcov::Options &o)
            {
                GBedcov::report(bed, file, o);
            }, o);

            break;
        }
    }
}

extern int parse_options(int argc, char ** argv)
{
    char cwd[1024];

    auto printError = [&](const std::string &x)
    {
        std::cerr << "***********************" << std::endl;
        std::cerr << "[ERRO]: " << x << std::endl;
        std::cerr << "***********************" << std::endl << std::endl;
    };

    if (getcwd(cwd, sizeof(cwd)))
    {
        __working__ = cwd;
    }

    try
    {
        parse(argc, argv);
        return 0;
    }
    catch (const FailedCommandException &ex)
    {
        printError(std::string(ex.what()));
    }
    catch (const InvalidFormatException &ex)
    {
        printError("Invalid file format: " + std::string(ex.what()));
    }
    catch (const InvalidRegionError &ex)
    {
        printError("Invalid region. " + std::string(ex.what()));
    }
    catch (const CalibrationError &ex)
    {
        printError("Calibration failed. " + std::string(ex.what()));
    }
    catch (const InvalidUsageException &)
    {
        printError("Invalid usage. Please check and try again.");
    }
    catch (const InvalidToolError &ex)
    {
        printError("Invalid command. Unknown tool: " + ex.v + ". Please check your usage and try again.");
    }
    catch (const InvalidOptionException &ex)
    {
        printError((boost::format("Invalid usage. Unknown option: %1%") % ex.o).str());
    }
    catch (const InvalidValueException &ex)
    {
        printError((boost::format("Invalid command. %1% not expected for %2%.") % ex.v % ex.o).str());
    }
    catch (const MissingOptionError &ex)
    {
        const auto format = "Invalid command. Mandatory option is missing. Please specify %1%.";
        printError((boost::format(format) % ex.o).str());
    }
    catch (const InvalidFileError &ex)
    {
        printError((boost::format("%1%%2%") % "Invalid command. File is invalid: " % ex.file).str());
    }
    catch (const std::runtime_error &ex)
    {
        printError(ex.what());
    }

    return 1;
}

int main(int argc, char ** argv)
{
    return parse_options(argc, argv);
}
