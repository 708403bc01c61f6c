#pragma once

#include "chanqual/types.hpp"
#include <random>

namespace chanqual {
namespace sim {

/**
 * Result of one pass through the noisy channel.
 *
 * All signals share the same length and sample rate. The filtered_*
 * fields are only meaningful when notch_applied is set.
 */
struct ChannelReport {
    Samples time;
    Bits bits;               // Empty when the carrier is unmodulated
    Samples clean;
    Samples noisy;

    // Broadband and band-limited quality of the raw channel
    double snr_db = 0;
    double bandlimited_snr_db = 0;
    ThdResult thd{0, 0};     // Of the clean signal at the carrier frequency

    Spectrum clean_fft;
    Spectrum noisy_fft;
    Spectrum noise_fft;      // noisy - clean
    Spectrum noisy_psd;

    // After mains cleanup
    bool notch_applied = false;
    Samples filtered;
    double filtered_snr_db = 0;
    double filtered_bandlimited_snr_db = 0;
    Spectrum filtered_fft;
};

/**
 * Noisy channel simulation
 *
 * Synthesizes the clean carrier (optionally ASK-keyed with random bits),
 * adds mains hum, Gaussian and impulse noise, scores the result and
 * optionally re-scores it after a mains notch.
 *
 * The generator is seeded once at construction; repeated run() calls on
 * the same instance continue the stream, two instances with the same
 * seed reproduce each other.
 */
class ChannelSimulation {
public:
    // Validates config, throws std::invalid_argument on bad parameters
    explicit ChannelSimulation(const ChannelConfig& config);

    ChannelReport run();

    const ChannelConfig& getConfig() const { return config_; }

private:
    Samples makeClean(const Samples& t, Bits& bits);
    Samples makeNoise(const Samples& t);

    ChannelConfig config_;
    std::mt19937 rng_;
};

} // namespace sim
} // namespace chanqual
