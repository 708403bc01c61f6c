#include "chanqual/signal.hpp"
#include "chanqual/dsp.hpp"
#include "chanqual/logging.hpp"
#define _USE_MATH_DEFINES
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace chanqual {

Samples timeVector(double duration_s, double fs) {
    dsp::requireSampleRate("timeVector", fs);
    if (!(duration_s >= 0) || !std::isfinite(duration_s)) {
        throw std::invalid_argument("timeVector: duration must be non-negative, got " +
                                    std::to_string(duration_s));
    }

    double count = std::floor(duration_s * fs);
    if (!(count < static_cast<double>(std::numeric_limits<size_t>::max()))) {
        throw std::invalid_argument("timeVector: " + std::to_string(duration_s) + " s at " +
                                    std::to_string(fs) + " Hz is too many samples");
    }
    size_t n = static_cast<size_t>(count);
    if (n == 0) {
        LOG_GEN(DEBUG, "timeVector: %.6g s at %.6g Hz yields no samples", duration_s, fs);
    }

    Samples t(n);
    for (size_t i = 0; i < n; ++i) {
        t[i] = static_cast<double>(i) / fs;
    }
    return t;
}

Samples carrierWave(double freq, SampleSpan t, double amplitude, double phase) {
    Samples out(t.size());
    for (size_t i = 0; i < t.size(); ++i) {
        out[i] = amplitude * std::sin(2.0 * M_PI * freq * t[i] + phase);
    }
    return out;
}

Bits makeBitstream(size_t num_bits, std::mt19937& rng) {
    std::uniform_int_distribution<int> coin(0, 1);
    Bits bits(num_bits);
    for (auto& b : bits) {
        b = static_cast<uint8_t>(coin(rng));
    }
    return bits;
}

Samples askModulate(BitSpan bits, double bit_rate, double carrier_freq,
                    SampleSpan t, double fs, double amp_low, double amp_high) {
    if (!(bit_rate > 0) || !std::isfinite(bit_rate)) {
        throw std::invalid_argument("askModulate: bit rate must be positive, got " +
                                    std::to_string(bit_rate));
    }
    dsp::requireSampleRate("askModulate", fs);

    const size_t num_samples = t.size();

    // Whole samples per bit, halves to even; one bit never outlasts the record
    double rounded = std::nearbyint(fs / bit_rate);
    double longest = num_samples > 0 ? static_cast<double>(num_samples) : 1.0;
    size_t samples_per_bit = static_cast<size_t>(std::clamp(rounded, 1.0, longest));

    const size_t required_bits = (num_samples + samples_per_bit - 1) / samples_per_bit;

    if (bits.empty()) {
        LOG_GEN(DEBUG, "askModulate: no bits supplied, keying all %zu samples as 0", num_samples);
    } else if (bits.size() < required_bits) {
        LOG_GEN(DEBUG, "askModulate: padding %zu bits to %zu with last bit %d",
                bits.size(), required_bits, static_cast<int>(bits.back()));
    }

    Samples out(num_samples);
    for (size_t i = 0; i < num_samples; ++i) {
        size_t bit_idx = i / samples_per_bit;
        uint8_t bit = 0;
        if (!bits.empty()) {
            bit = bit_idx < bits.size() ? bits[bit_idx] : bits.back();
        }
        double level = amp_low + (amp_high - amp_low) * (bit ? 1.0 : 0.0);
        out[i] = std::sin(2.0 * M_PI * carrier_freq * t[i]) * level;
    }
    return out;
}

} // namespace chanqual
