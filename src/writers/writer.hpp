#ifndef WRITER_HPP
#define WRITER_HPP

#include <vector>
#include "data/data.hpp"

namespace SeqCal
{
    template <typename T = std::string> struct Writer
    {
        virtual ~Writer() {}

        virtual void close() = 0;
        virtual void open(const FileName &) = 0;
        virtual void write(const T &, bool newLine = true) = 0;
    };

    // Keeps everything written, mostly for testing
    struct MockWriter : public Writer<>
    {
        inline void close() override {}
        inline void open(const FileName &) override {}
        inline void write(const std::string &x, bool) override { lines.push_back(x); }

        std::vector<std::string> lines;
    };
}

#endif
