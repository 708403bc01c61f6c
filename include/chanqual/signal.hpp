#pragma once

#include "types.hpp"
#include <random>

namespace chanqual {

/**
 * Sample-time grid t[i] = i / fs, i = 0..N-1, N = floor(duration_s * fs).
 *
 * The endpoint `duration_s` is excluded so consecutive segments never
 * overlap. Returns an empty vector when duration_s * fs < 1.
 * Throws std::invalid_argument for fs <= 0 or duration_s < 0.
 */
Samples timeVector(double duration_s, double fs);

// amplitude * sin(2*pi*freq*t + phase)
Samples carrierWave(double freq, SampleSpan t, double amplitude = 1.0, double phase = 0.0);

// Uniformly random 0/1 symbols
Bits makeBitstream(size_t num_bits, std::mt19937& rng);

/**
 * Amplitude-shift keying of a sine carrier.
 *
 * Each bit is held for round(fs / bit_rate) samples (at least one). A bit
 * sequence too short to cover t is padded by repeating its last bit; an
 * empty sequence keys every sample as 0. Output length equals t.size().
 * Bit transitions are hard edges; no pulse shaping is applied.
 */
Samples askModulate(BitSpan bits, double bit_rate, double carrier_freq,
                    SampleSpan t, double fs,
                    double amp_low = 0.0, double amp_high = 1.0);

} // namespace chanqual
