#include <iostream>
#include <htslib/sam.h>
#include <htslib/hts.h>
#include "tools/errors.hpp"
#include "writers/bam_writer.hpp"

using namespace SeqCal;

struct BAMWriter::Impl
{
    samFile *f = nullptr;
    bam_hdr_t *h = nullptr;
    FileName file;
};

bool BAMWriter::release()
{
    if (!_impl)
    {
        return true;
    }

    if (_impl->h) { bam_hdr_destroy(_impl->h); }

    const auto f = _impl->f;
    _impl.reset();

    // Flushes the remaining blocks (and the EOF marker)
    return !f || sam_close(f) >= 0;
}

BAMWriter::~BAMWriter()
{
    const auto file = _impl ? _impl->file : "";

    if (!release())
    {
        std::cerr << "[WARN]: Failed to close " << file << std::endl;
    }
}

void BAMWriter::close()
{
    const auto file = _impl ? _impl->file : "";

    if (!release())
    {
        throw std::runtime_error("Failed to close: " + file);
    }
}

void BAMWriter::open(const FileName &file, const AlignmentSource &src, const Options &o)
{
    close();

    if (o.cram && o.ref.empty())
    {
        throw std::runtime_error("Writing CRAM requires a reference");
    }

    S_CHECK(src.h(), "Source of " + file + " has no header");

    _impl = std::make_shared<Impl>();
    _impl->file = file;
    _impl->f = sam_open(file.c_str(), o.cram ? "wc" : "wb");

    if (!_impl->f)
    {
        _impl.reset();
        throw InvalidFileError(file);
    }

    if (!o.ref.empty() && hts_set_fai_filename(_impl->f, o.ref.c_str()))
    {
        close();
        throw std::runtime_error("Failed to load reference: " + o.ref);
    }

    if (o.threads > 1 && hts_set_threads(_impl->f, static_cast<int>(o.threads)))
    {
        close();
        throw std::runtime_error("Failed to set threads for: " + file);
    }

    _impl->h = bam_hdr_dup(static_cast<const bam_hdr_t *>(src.h()));

    if (!_impl->h || sam_hdr_write(_impl->f, _impl->h) < 0)
    {
        close();
        throw std::runtime_error("sam_hdr_write() failed for: " + file);
    }
}

void BAMWriter::write(const Alignment &x)
{
    S_CHECK(_impl, "BAMWriter is not opened");
    S_CHECK(x.b, "Alignment " + x.name + " is not backed by a BAM record");

    if (sam_write1(_impl->f, _impl->h, static_cast<const bam1_t *>(x.b)) < 0)
    {
        throw std::runtime_error("sam_write1() failed for: " + _impl->file);
    }
}

void BAMWriter::index(const FileName &file)
{
    if (sam_index_build(file.c_str(), 0) < 0)
    {
        throw FailedCommandException("Failed to build index for: " + file);
    }
}
