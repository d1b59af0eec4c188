/*
 * Random Number Generation Header
 *
 * Seedable random sources for the Monte Carlo kernels. Every simulation run
 * and every umbrella window owns its own RandomSource, so independent runs
 * never share generator state.
 */

#ifndef RANDOM_H
#define RANDOM_H

#include <random>

/*
 * Abstract random source
 *
 * uniform()          - random double in [0, 1)
 * uniform_index(n)   - random integer in [0, n)
 * reseed(seed)       - restart the stream from a seed
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual double uniform() = 0;
    virtual void reseed(long int seed) = 0;

    // Default site selection maps uniform() onto [0, n)
    virtual int uniform_index(int n);
};

/*
 * Mersenne Twister implementation of RandomSource
 *
 * Seed convention kept from the ran1 interface: the sign of the seed is
 * ignored and a zero seed is replaced by 1.
 */
class MersenneTwisterSource : public RandomSource {
private:
    std::mt19937 rng;
    std::uniform_real_distribution<double> uniform_dist;
    long int initial_seed;

public:
    explicit MersenneTwisterSource(long int seed);

    double uniform() override;
    void reseed(long int seed) override;

    long int get_seed() const { return initial_seed; }
};

// Magnitude of the seed, 1 for a zero seed; defined for every long int
unsigned long long normalize_seed(long int seed);

// Seeds below 2^32 seed the engine directly, larger ones through a seed_seq of both words
void seed_engine(std::mt19937& engine, long int seed);

#endif // RANDOM_H
