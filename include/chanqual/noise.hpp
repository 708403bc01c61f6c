#pragma once

#include "types.hpp"
#include <random>

namespace chanqual {

// Generator seeded from std::random_device, for callers that want fresh noise
std::mt19937 freshGenerator();

// Sinusoidal mains interference
Samples mainsNoise(SampleSpan t, double amplitude = 0.5, double mains_freq = 50.0);

// i.i.d. N(0, sigma^2) samples, one per entry of t
Samples gaussianNoise(SampleSpan t, double sigma, std::mt19937& rng);
Samples gaussianNoise(SampleSpan t, double sigma);

/**
 * Sparse impulse noise: zero except at num_impulses uniformly drawn
 * positions, each set to +magnitude or -magnitude with equal probability.
 *
 * Positions are drawn with replacement. When two impulses land on the
 * same sample the later one wins, so fewer than num_impulses samples may
 * be non-zero.
 */
Samples impulseNoise(SampleSpan t, size_t num_impulses, double magnitude, std::mt19937& rng);
Samples impulseNoise(SampleSpan t, size_t num_impulses, double magnitude);

} // namespace chanqual
