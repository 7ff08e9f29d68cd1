#ifndef FIXTURE_HPP
#define FIXTURE_HPP

#include <fstream>
#include <sstream>
#include <stdlib.h>
#include <zlib.h>
#include <htslib/sam.h>
#include "mock.hpp"
#include "tools/errors.hpp"
#include "writers/bam_writer.hpp"

namespace SeqCal
{
    // New empty directory under /tmp
    inline Path mockDir()
    {
        char x[] = "/tmp/seqcal_XXXXXX";
        S_CHECK(mkdtemp(x), "Failed to create a temporary directory");
        return x;
    }

    inline void mockText(const FileName &file, const std::string &x)
    {
        std::ofstream o(file);
        S_CHECK(o.good(), "Failed to write " + file);
        o << x;
    }

    inline void mockGZ(const FileName &file, const std::string &x)
    {
        auto f = gzopen(file.c_str(), "wb");
        S_CHECK(f, "Failed to write " + file);

        const auto n = gzwrite(f, x.data(), static_cast<unsigned>(x.size()));
        gzclose(f);

        S_CHECK(n == static_cast<int>(x.size()), "Failed to compress " + file);
    }

    /*
     * SAM text for the mock contigs. Records must be sorted by contig and position, unmapped
     * last. No sequence or quality is given.
     */

    inline std::string mockSAM(const std::vector<Alignment> &x)
    {
        const auto h = mockHeader();

        std::ostringstream o;
        o << "@HD\tVN:1.6\tSO:coordinate\n";

        for (const auto &i : h)
        {
            o << "@SQ\tSN:" << i.first << "\tLN:" << i.second << "\n";
        }

        for (const auto &i : x)
        {
            std::string cigar;

            for (const auto &c : i.cigars)
            {
                cigar += std::to_string(c.second) + BAM_CIGAR_STR[c.first];
            }

            const auto rname = i.tid < 0 ? std::string("*") : h[i.tid].first;
            const auto rnext = i.mtid < 0 ? std::string("*") : (i.mtid == i.tid ? std::string("=") : h[i.mtid].first);

            o << i.name << "\t"
              << i.flag << "\t"
              << rname  << "\t"
              << i.pos + 1 << "\t"
              << i.mapq << "\t"
              << (cigar.empty() ? "*" : cigar) << "\t"
              << rnext  << "\t"
              << (i.mtid < 0 ? 0 : i.pos + 1) << "\t0\t*\t*\n";
        }

        return o.str();
    }

    // Indexed BAM file in a directory, converted from the SAM text with htslib
    inline FileName mockBAM(const Path &dir, const std::vector<Alignment> &x)
    {
        const auto sam = dir + "/mock.sam";
        const auto bam = dir + "/mock.bam";

        mockText(sam, mockSAM(x));

        auto in = sam_open(sam.c_str(), "r");
        S_CHECK(in, "Failed to open " + sam);

        auto h = sam_hdr_read(in);
        S_CHECK(h, "Failed to read header: " + sam);

        auto out = sam_open(bam.c_str(), "wb");
        S_CHECK(out, "Failed to open " + bam);
        S_CHECK(sam_hdr_write(out, h) >= 0, "Failed to write header: " + bam);

        auto b = bam_init1();

        int r;
        bool written = true;

        while ((r = sam_read1(in, h, b)) >= 0)
        {
            written = written && sam_write1(out, h, b) >= 0;
        }

        bam_destroy1(b);
        bam_hdr_destroy(h);
        sam_close(in);

        const auto closed = sam_close(out) >= 0;

        S_CHECK(r == -1, "Failed to parse " + sam);
        S_CHECK(written && closed, "Failed to write " + bam);

        BAMWriter::index(bam);

        return bam;
    }

    // Every record of an alignment file, unmapped included
    inline std::vector<Alignment> readAll(AlignmentSource &src)
    {
        std::vector<Alignment> x;

        src.fetchAll();

        ParserBAM::parse(src, [&](const Alignment &i, Progress)
        {
            x.push_back(i);
            x.back().b = nullptr;
        });

        return x;
    }
}

#endif
