#include "../include/random.h"

unsigned long long normalize_seed(long int seed)
{
    // Negate in unsigned arithmetic so that LONG_MIN has a magnitude too
    unsigned long long value = (seed < 0) ? 0ULL - static_cast<unsigned long long>(seed)
                                          : static_cast<unsigned long long>(seed);
    if (value == 0) value = 1;  // Avoid seed = 0
    return value;
}

void seed_engine(std::mt19937& engine, long int seed)
{
    unsigned long long value = normalize_seed(seed);
    if (value <= 0xFFFFFFFFULL) {
        engine.seed(static_cast<std::mt19937::result_type>(value));
        return;
    }
    std::seed_seq sequence{static_cast<unsigned int>(value & 0xFFFFFFFFULL),
                           static_cast<unsigned int>(value >> 32)};
    engine.seed(sequence);
}

int RandomSource::uniform_index(int n)
{
    int index = static_cast<int>(uniform() * n);
    // uniform() < 1, but rounding of the product may still land on n
    return (index < n) ? index : n - 1;
}

MersenneTwisterSource::MersenneTwisterSource(long int seed)
    : uniform_dist(0.0, 1.0), initial_seed(seed)
{
    seed_engine(rng, seed);
}

double MersenneTwisterSource::uniform()
{
    return uniform_dist(rng);
}

void MersenneTwisterSource::reseed(long int seed)
{
    initial_seed = seed;
    seed_engine(rng, seed);
    uniform_dist.reset();
}
