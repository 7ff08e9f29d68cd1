#ifndef ANALYZER_HPP
#define ANALYZER_HPP

#include <memory>
#include "data/data.hpp"
#include "writers/writer.hpp"

namespace SeqCal
{
    class WriterOptions
    {
        public:
            WriterOptions() : showWarn(true),
                              writer(std::make_shared<MockWriter>()),
                              logger(std::make_shared<MockWriter>()),
                              output(std::make_shared<MockWriter>()) {}

            WriterOptions(const WriterOptions &x) = default;

            bool showWarn;

            std::shared_ptr<Writer<>> writer, logger, output;

            inline void wait(const std::string &s) const
            {
                log("[WAIT]: " + s);
                out("[WAIT]: " + s);
            }

            inline void warn(const std::string &s) const
            {
                if (showWarn)
                {
                    log("[WARN]: " + s);
                    out("[WARN]: " + s);
                }
            }

            inline void generate(const FileName &f) const
            {
                info("Generating " + f);
            }

            inline void info(const std::string &s) const
            {
                log("[INFO]: " + s);
                out("[INFO]: " + s);
            }

            inline void logInfo(const std::string &s) const
            {
                log("[INFO]: " + s);
            }

        private:

            inline void out(const std::string &s) const { if (output) { output->write(s); } }
            inline void log(const std::string &s) const { if (logger) { logger->write(s); } }
    };

    struct AnalyzerOptions : public WriterOptions
    {
        AnalyzerOptions() {}

        // Eg: "calibrate"
        std::string name;

        // Full command
        std::string cmd;

        std::string version;

        // Worker threads (decompression, compression and per-region work)
        Thread threads = 1;
    };
}

#endif
