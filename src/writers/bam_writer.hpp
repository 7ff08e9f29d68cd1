#ifndef BAM_WRITER_HPP
#define BAM_WRITER_HPP

#include "data/data.hpp"
#include "parsers/parser_bam.hpp"

namespace SeqCal
{
    struct AlignmentWriter
    {
        virtual ~AlignmentWriter() {}

        virtual void close() = 0;
        virtual void write(const Alignment &) = 0;
    };

    class BAMWriter : public AlignmentWriter
    {
        public:

            struct Options
            {
                // Write CRAM rather than BAM?
                bool cram = false;

                // Compression threads
                Thread threads = 1;

                // Reference FASTA, required for CRAM
                FileName ref;
            };

            BAMWriter() {}
            ~BAMWriter();

            // Open a file ("-" for standard output) and write the header of the source
            void open(const FileName &, const AlignmentSource &, const Options &o = Options());

            void close() override;
            void write(const Alignment &) override;

            // Build an index for a closed BAM/CRAM file
            static void index(const FileName &);

        private:

            // Returns false if the file couldn't be flushed
            bool release();

            struct Impl;
            std::shared_ptr<Impl> _impl;
    };
}

#endif
