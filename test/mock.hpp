#ifndef MOCK_HPP
#define MOCK_HPP

#include <limits>
#include <algorithm>
#include "writers/bam_writer.hpp"
#include "parsers/parser_bam.hpp"

namespace SeqCal
{
    /*
     * In-memory alignments, fetched like an indexed file. Records must be given in the order
     * of the file (sorted by contig and position, unmapped last).
     */

    class MockSource : public AlignmentSource
    {
        public:

            MockSource(const Header &h, const std::vector<Alignment> &x = {}) : _h(h), _x(x) {}

            using AlignmentSource::fetch;

            const Header &header() const override { return _h; }

            void *h() const override { return nullptr; }

            void fetch(const ChrID &cID, Base beg, Base end) override
            {
                const auto t = tid(cID);

                if (t < 0)
                {
                    throw std::runtime_error("Chromosome " + cID + " not found in BAM header");
                }

                _q.clear(); _i = 0;

                for (const auto &x : _x)
                {
                    const auto e = (x.isUnmapped() || x.cigars.empty()) ? x.pos + 1 : x.end();

                    if (x.tid == t && x.pos < end && e > beg)
                    {
                        _q.push_back(&x);
                    }
                }
            }

            void fetch(const ChrID &cID) override
            {
                fetch(cID, 0, std::numeric_limits<Base>::max());
            }

            void fetchAll() override
            {
                _q.clear(); _i = 0;
                for (const auto &x : _x) { _q.push_back(&x); }
            }

            bool next(Alignment &x) override
            {
                if (_i >= _q.size())
                {
                    return false;
                }

                x = *_q[_i++];
                return true;
            }

            // Number of records
            inline std::size_t size() const { return _x.size(); }

        private:

            Header _h;
            std::vector<Alignment> _x;

            // Records for the current fetch
            std::vector<const Alignment *> _q;
            std::size_t _i = 0;
    };

    struct MockBAMWriter : public AlignmentWriter
    {
        void close() override { closed = true; }
        void write(const Alignment &x) override { written.push_back(x); }

        // Number of records written for a query name
        inline Count count(const ReadName &name) const
        {
            return std::count_if(written.begin(), written.end(), [&](const Alignment &x)
            {
                return x.name == name;
            });
        }

        // Distinct query names written
        inline ReadNames names() const
        {
            ReadNames x;
            for (const auto &i : written) { x.insert(i.name); }
            return x;
        }

        bool closed = false;
        std::vector<Alignment> written;
    };

    // Contigs for testing, "chrQ_mirror" holds the sequins
    inline AlignmentSource::Header mockHeader()
    {
        return AlignmentSource::Header
        {
            { "chr1",        100000 },
            { "chr2",        100000 },
            { "chrQ_mirror", 100000 }
        };
    }

    const int CHR1 = 0;
    const int CHR2 = 1;
    const int CHRQ = 2;

    /*
     * Paired record with a single match operation. The mate is on the same contig unless
     * specified.
     */

    inline Alignment mockRead(const ReadName &name,
                              int tid,
                              Base pos,
                              Base len = 100,
                              int flag = BAM_FPAIRED,
                              MapQ mapq = 60,
                              int mtid = -2)
    {
        const auto h = mockHeader();

        Alignment x;
        x.name = name;
        x.tid  = tid;
        x.cID  = tid >= 0 ? h[tid].first : "*";
        x.pos  = pos;
        x.mapq = mapq;
        x.flag = flag;
        x.mtid = mtid == -2 ? tid : mtid;

        if (len > 0)
        {
            x.cigars.push_back(std::pair<Alignment::Cigar, Base>(BAM_CMATCH, len));
        }

        return x;
    }

    /*
     * Pairs with both mates on chrQ_mirror starting at the same position. Mate 2 comes first for
     * every second pair.
     */

    inline std::vector<Alignment> mockPairs(const std::string &prefix, int n, Base pos, Base len = 100)
    {
        std::vector<Alignment> x;

        for (auto i = 0; i < n; i++)
        {
            const auto name = prefix + std::to_string(i);

            auto r1 = mockRead(name, CHRQ, pos, len, BAM_FPAIRED | BAM_FREAD1);
            auto r2 = mockRead(name, CHRQ, pos, len, BAM_FPAIRED | BAM_FREAD2 | BAM_FREVERSE);

            if (i % 2)
            {
                x.push_back(r2);
                x.push_back(r1);
            }
            else
            {
                x.push_back(r1);
                x.push_back(r2);
            }
        }

        return x;
    }
}

#endif
