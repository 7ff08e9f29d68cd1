#ifndef RANDOM_HPP
#define RANDOM_HPP

#include <vector>
#include <numeric>
#include <utility>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_01.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include "data/data.hpp"
#include "tools/errors.hpp"

namespace SeqCal
{
    typedef boost::random::mt19937_64 Generator;

    /*
     * Selection by a constant probability. Every instance owns its generator, two instances
     * with the same seed make the same decisions in the same order.
     */

    class RandomSelection
    {
        public:

            RandomSelection(Probability prob, Seed seed) : _prob(prob), _gen(seed)
            {
                S_CHECK(prob >= 0.0, "Negative probability for selection");
            }

            // Draw once, true if the draw is within the probability
            inline bool select()
            {
                return _u(_gen) <= _prob;
            }

        private:

            // The probability of selection
            const Probability _prob;

            Generator _gen;
            boost::random::uniform_01<double> _u;
    };

    /*
     * Choose n distinct indexes from [0, size) uniformly without replacement. All indexes are
     * returned if n >= size.
     */

    inline std::vector<Index> chooseFrom(Index size, Index n, Seed seed)
    {
        std::vector<Index> x(size);
        std::iota(x.begin(), x.end(), 0);

        if (n >= size)
        {
            return x;
        }

        Generator gen(seed);

        // Partial Fisher-Yates
        for (Index i = 0; i < n; i++)
        {
            boost::random::uniform_int_distribution<Index> d(i, size - 1);
            std::swap(x[i], x[d(gen)]);
        }

        x.resize(n);
        return x;
    }
}

#endif
