#ifndef READER_HPP
#define READER_HPP

#include <memory>
#include <string>
#include <vector>
#include <fstream>
#include "data/data.hpp"

namespace SeqCal
{
    /*
     * Line-oriented reading of plain or gzipped text (eg: BED region lists)
     */

    class AbstractReader
    {
        public:
            AbstractReader() = delete;
            AbstractReader(const AbstractReader &) = delete;

            AbstractReader(const FileName &file) : file(file) {}
            virtual ~AbstractReader() {}

            virtual void reset() = 0;

            // Returns the next line in the file
            virtual bool nextLine(Line &) const = 0;

        protected:
            FileName file;
    };

    class TxtFileReader : public AbstractReader
    {
        public:
            TxtFileReader(const FileName &);

            bool nextLine(Line &) const override;
            void reset() override;

        private:
            std::shared_ptr<std::ifstream> _data;
    };

    class Reader
    {
        public:
            Reader() = delete;
            Reader(const FileName &, bool forceGZ = false);

            // Reads from memory, mostly for testing
            static Reader fromString(const std::string &);

            Reader(const Reader &r) : _reader(r._reader)
            {
                _reader->reset();
            }

            inline void reset() { _reader->reset(); }

            inline bool nextLine(Line &s) const { return _reader->nextLine(s); }

        private:
            Reader(std::shared_ptr<AbstractReader> r) : _reader(r) {}

            std::shared_ptr<AbstractReader> _reader;
    };
}

#endif
