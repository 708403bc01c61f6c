#pragma once

#include <complex>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace chanqual {

// Core types
using Sample = double;                         // Real signal sample
using Complex = std::complex<double>;          // DFT bin
using Samples = std::vector<Sample>;           // Signal / time vector buffer
using Bits = std::vector<uint8_t>;             // 0/1 symbols

// Spans for zero-copy operations
using SampleSpan = std::span<const Sample>;
using BitSpan = std::span<const uint8_t>;

// Single-sided spectrum estimate: freqs[i] pairs with values[i]
struct Spectrum {
    Samples freqs;    // Hz, non-negative, ascending
    Samples values;   // Magnitude (FFT) or power density (PSD)

    size_t size() const { return freqs.size(); }
    bool empty() const { return freqs.empty(); }
};

// Total harmonic distortion
// Both fields are NaN when the fundamental carries no energy
struct ThdResult {
    double ratio;
    double db;
};

// Channel simulation parameters
struct ChannelConfig {
    // Time base
    double sample_rate = 100000.0;     // Hz
    double duration_s = 0.02;          // 2000 samples at 100 kHz

    // Transmitted signal
    double carrier_freq = 10000.0;     // Hz
    bool use_data = true;              // ASK-modulate random bits onto the carrier
    double bit_rate = 1000.0;          // bps
    double amp_low = 0.1;              // Carrier amplitude for a 0 bit
    double amp_high = 1.0;             // Carrier amplitude for a 1 bit

    // Noise sources
    double mains_amplitude = 0.5;
    double mains_freq = 50.0;          // Hz (60 in the Americas)
    double gaussian_sigma = 0.2;
    size_t num_impulses = 20;
    double impulse_magnitude = 2.0;

    // Analysis
    double snr_bandwidth_hz = 2000.0;  // Band around the carrier for band-limited SNR
    int thd_harmonics = 5;             // Highest harmonic order included in THD
    size_t psd_segment = 1024;         // Welch segment length

    // Mains cleanup
    bool apply_notch = true;
    double notch_freq = 50.0;
    double notch_q = 30.0;

    // Unset: every run draws fresh noise
    std::optional<uint32_t> seed;

    // Throws std::invalid_argument naming the first bad field
    void validate() const;

    // Only meaningful once validate() has passed
    size_t numSamples() const {
        return static_cast<size_t>(duration_s * sample_rate);
    }
};

// Preset configurations
namespace presets {

// Defaults of the interactive front-end
inline ChannelConfig interactive() {
    return ChannelConfig{};
}

// Fixed, reproducible scenario used by the batch demo
inline ChannelConfig batchDemo() {
    ChannelConfig cfg;
    cfg.num_impulses = 25;
    cfg.thd_harmonics = 6;
    cfg.seed = 0;
    return cfg;
}

// Unmodulated carrier, useful as a spectral reference
inline ChannelConfig pureCarrier() {
    ChannelConfig cfg;
    cfg.use_data = false;
    cfg.seed = 0;
    return cfg;
}

} // namespace presets

} // namespace chanqual
