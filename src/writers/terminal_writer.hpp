#ifndef TERMINAL_WRITER_HPP
#define TERMINAL_WRITER_HPP

#include <iostream>
#include "writers/writer.hpp"

namespace SeqCal
{
    /*
     * Messages go to the standard error, the standard output might be carrying alignments
     */

    class TerminalWriter : public Writer<>
    {
        public:

            inline void close() override {}

            inline void open(const FileName &) override {}

            inline void write(const std::string &str, bool newLine = true) override
            {
                std::cerr << str;
                if (newLine) { std::cerr << std::endl; }
            }
    };
}

#endif
