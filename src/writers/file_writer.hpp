#ifndef FILE_WRITER_HPP
#define FILE_WRITER_HPP

#include <memory>
#include <iomanip>
#include <fstream>
#include "tools/tools.hpp"
#include "tools/errors.hpp"
#include "writers/writer.hpp"

namespace SeqCal
{
    class FileWriter : public Writer<>
    {
        public:

            FileWriter(const Path &path = "") : path(path) {}
            ~FileWriter() { close(); }

            void close() override
            {
                if (_o)
                {
                    _o->close();
                    _o.reset();
                }
            }

            void open(const FileName &file) override
            {
                if (!path.empty())
                {
                    createD(path);
                }

                const auto target = !path.empty() ? path + "/" + file : file;
                _o = std::make_shared<std::ofstream>(target);

                if (!_o->good())
                {
                    throw InvalidFileError(target);
                }
            }

            void write(const std::string &x, bool newLine = true) override
            {
                S_CHECK(_o, "FileWriter is not opened");

                *(_o) << std::setiosflags(std::ios::fixed) << std::setprecision(2) << x;
                if (newLine) { *(_o) << std::endl; }
            }

            std::string path;

        private:

            std::shared_ptr<std::ofstream> _o;
    };
}

#endif
