#include <htslib/sam.h>
#include <htslib/hts.h>
#include "tools/errors.hpp"
#include "parsers/parser_bam.hpp"
#include <boost/format.hpp>

using namespace SeqCal;

bool SeqCal::isUTF8(const std::string &x)
{
    auto i = 0u;

    while (i < x.size())
    {
        const auto c = static_cast<unsigned char>(x[i]);

        // Length of the sequence
        unsigned n;

        if      (c < 0x80)           { n = 1; }
        else if ((c & 0xE0) == 0xC0) { n = 2; }
        else if ((c & 0xF0) == 0xE0) { n = 3; }
        else if ((c & 0xF8) == 0xF0) { n = 4; }
        else                         { return false; }

        if (i + n > x.size())
        {
            return false;
        }

        for (auto j = 1u; j < n; j++)
        {
            if ((static_cast<unsigned char>(x[i+j]) & 0xC0) != 0x80)
            {
                return false;
            }
        }

        i += n;
    }

    return true;
}

int AlignmentSource::tid(const ChrID &cID) const
{
    const auto &h = header();

    for (auto i = 0u; i < h.size(); i++)
    {
        if (h[i].first == cID)
        {
            return static_cast<int>(i);
        }
    }

    return -1;
}

static AlignmentSource::Header readHeader(const bam_hdr_t *h)
{
    AlignmentSource::Header x;

    for (auto i = 0; i < h->n_targets; i++)
    {
        const auto cID = std::string(h->target_name[i]);

        if (!isUTF8(cID))
        {
            throw InvalidFormatException("Invalid UTF-8 in target name: " + cID);
        }

        x.push_back(std::pair<ChrID, Base>(cID, h->target_len[i]));
    }

    return x;
}

class HTSSource : public AlignmentSource
{
    public:

        HTSSource(const FileName &file, const ParserBAM::Options &o) : _file(file)
        {
            _f = sam_open(file.c_str(), "r");

            if (!_f)
            {
                throw InvalidFileError(file);
            }

            if (!o.ref.empty() && hts_set_fai_filename(_f, o.ref.c_str()))
            {
                close();
                throw std::runtime_error("Failed to load reference: " + o.ref);
            }

            if (o.threads > 1 && hts_set_threads(_f, static_cast<int>(o.threads)))
            {
                close();
                throw std::runtime_error("Failed to set threads for: " + file);
            }

            if (!(_h = sam_hdr_read(_f)))
            {
                close();
                throw std::runtime_error("Failed to read header: " + file);
            }

            if (!(_idx = sam_index_load(_f, file.c_str())))
            {
                close();
                throw std::runtime_error("Failed to load index for: " + file + ". Is the file indexed?");
            }

            try
            {
                _header = readHeader(_h);
            }
            catch (...)
            {
                close();
                throw;
            }

            _b = bam_init1();
        }

        HTSSource(const HTSSource &) = delete;
        HTSSource &operator=(const HTSSource &) = delete;

        ~HTSSource() { close(); }

        using AlignmentSource::fetch;

        const Header &header() const override { return _header; }

        void *h() const override { return _h; }

        void fetch(const ChrID &cID, Base beg, Base end) override
        {
            const auto i = tid(cID);

            if (i < 0)
            {
                throw std::runtime_error("Chromosome " + cID + " not found in BAM header");
            }

            query(i, beg, end, (boost::format("%1%:%2%-%3%") % cID % beg % end).str());
        }

        void fetch(const ChrID &cID) override
        {
            const auto i = tid(cID);

            if (i < 0)
            {
                throw std::runtime_error("Chromosome " + cID + " not found in BAM header");
            }

            query(i, 0, _header[i].second, cID);
        }

        void fetchAll() override
        {
            query(HTS_IDX_START, 0, 0, "all");
        }

        bool next(Alignment &x) override
        {
            if (!_itr)
            {
                throw std::runtime_error("No region fetched for: " + _file);
            }

            const auto r = sam_itr_next(_f, _itr, _b);

            if (r == -1)
            {
                return false;
            }
            else if (r < -1)
            {
                throw std::runtime_error("Failed to read alignment record from: " + _file);
            }

            const auto &c = _b->core;

            x.b    = _b;
            x.name = bam_get_qname(_b);
            x.tid  = c.tid;
            x.cID  = c.tid >= 0 ? _header[c.tid].first : "*";
            x.pos  = c.pos;
            x.mapq = c.qual;
            x.flag = c.flag;
            x.mtid = c.mtid;

            const auto cig = bam_get_cigar(_b);
            x.cigars.clear();

            for (auto i = 0u; i < c.n_cigar; i++)
            {
                x.cigars.push_back(std::pair<Alignment::Cigar, Base>(bam_cigar_op(cig[i]), bam_cigar_oplen(cig[i])));
            }

            return true;
        }

    private:

        void query(int tid, Base beg, Base end, const std::string &what)
        {
            if (_itr) { hts_itr_destroy(_itr); _itr = nullptr; }

            if (!(_itr = sam_itr_queryi(_idx, tid, beg, end)))
            {
                throw std::runtime_error("Failed to fetch " + what + " from: " + _file);
            }
        }

        void close()
        {
            if (_itr) { hts_itr_destroy(_itr); _itr = nullptr; }
            if (_b)   { bam_destroy1(_b);      _b = nullptr;   }
            if (_idx) { hts_idx_destroy(_idx); _idx = nullptr; }
            if (_h)   { bam_hdr_destroy(_h);   _h = nullptr;   }
            if (_f)   { sam_close(_f);         _f = nullptr;   }
        }

        const FileName _file;

        Header _header;

        samFile   *_f   = nullptr;
        bam_hdr_t *_h   = nullptr;
        hts_idx_t *_idx = nullptr;
        hts_itr_t *_itr = nullptr;
        bam1_t    *_b   = nullptr;
};

std::shared_ptr<AlignmentSource> ParserBAM::open(const FileName &file, const Options &o)
{
    return std::shared_ptr<AlignmentSource>(new HTSSource(file, o));
}
