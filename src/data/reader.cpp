#include <sstream>
#include <zlib.h>
#include <boost/algorithm/string.hpp>
#include "data/reader.hpp"
#include "tools/errors.hpp"

using namespace SeqCal;

namespace SeqCal
{
    class GzipFileReader : public AbstractReader
    {
        public:
            GzipFileReader(const FileName &);
            ~GzipFileReader();

            bool nextLine(Line &) const override;
            void reset() override;

        private:
            static const std::size_t BUFLEN = 1024 * 1024;

            gzFile _data = nullptr;
            std::shared_ptr<char> _buf;
    };

    class StringReader : public AbstractReader
    {
        public:
            StringReader(const std::string &x) : AbstractReader("<memory>"), _x(x) { reset(); }

            bool nextLine(Line &s) const override
            {
                if (!std::getline(*_data, s)) { return false; }
                boost::trim_right_if(s, boost::is_any_of("\r\n"));
                return true;
            }

            void reset() override
            {
                _data = std::make_shared<std::istringstream>(_x);
            }

        private:
            const std::string _x;
            std::shared_ptr<std::istringstream> _data;
    };
}

static const std::string GZIPSuffix = ".gz";

TxtFileReader::TxtFileReader(const FileName &file) : AbstractReader(file)
{
    _data = std::make_shared<std::ifstream>(file, std::ios::in);

    if (_data->fail())
    {
        throw InvalidFileError(file);
    }
}

bool TxtFileReader::nextLine(Line &s) const
{
    if (!std::getline(*_data, s)) { return false; }

    // Windows line endings
    boost::trim_right_if(s, boost::is_any_of("\r\n"));

    return true;
}

void TxtFileReader::reset()
{
    _data->clear();
    _data->seekg(0, std::ios::beg);
}

GzipFileReader::GzipFileReader(const FileName &file) : AbstractReader(file)
{
    _data = gzopen(file.c_str(), "rb");

    if (!_data)
    {
        throw InvalidFileError(file);
    }

    _buf = std::shared_ptr<char>(new char[BUFLEN], [](char *p) { delete[] p; });
}

GzipFileReader::~GzipFileReader()
{
    if (_data) { gzclose(_data); }
}

bool GzipFileReader::nextLine(Line &s) const
{
    s.clear();

    // A line longer than the buffer takes more than one read
    while (gzgets(_data, _buf.get(), static_cast<int>(BUFLEN)))
    {
        s.append(_buf.get());

        if (s.back() == '\n')
        {
            break;
        }
    }

    int err;
    gzerror(_data, &err);

    if (err < 0)
    {
        throw InvalidFormatException("Failed to decompress: " + file);
    }
    else if (s.empty())
    {
        return false;
    }

    boost::trim_right_if(s, boost::is_any_of("\r\n"));

    return true;
}

void GzipFileReader::reset()
{
    gzrewind(_data);
}

Reader::Reader(const FileName &file, bool forceGZ)
{
    if (forceGZ || boost::algorithm::ends_with(file, GZIPSuffix))
    {
        _reader = std::make_shared<GzipFileReader>(file);
    }
    else
    {
        _reader = std::make_shared<TxtFileReader>(file);
    }
}

Reader Reader::fromString(const std::string &x)
{
    return Reader(std::shared_ptr<AbstractReader>(new StringReader(x)));
}
