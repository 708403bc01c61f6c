#include "sim/channel_simulation.hpp"
#include "chanqual/analysis.hpp"
#include "chanqual/dsp.hpp"
#include "chanqual/logging.hpp"
#include "chanqual/noise.hpp"
#include "chanqual/signal.hpp"
#include <cmath>

namespace chanqual {
namespace sim {

ChannelSimulation::ChannelSimulation(const ChannelConfig& config)
    : config_(config)
    , rng_(config.seed ? std::mt19937(*config.seed) : freshGenerator())
{
    config_.validate();
}

Samples ChannelSimulation::makeClean(const Samples& t, Bits& bits) {
    if (!config_.use_data) {
        bits.clear();
        return carrierWave(config_.carrier_freq, t);
    }

    // Enough bits to span the record once upsampled
    size_t num_bits = static_cast<size_t>(std::ceil(config_.duration_s * config_.bit_rate));
    if (num_bits < 1) num_bits = 1;
    bits = makeBitstream(num_bits, rng_);

    return askModulate(bits, config_.bit_rate, config_.carrier_freq, t,
                       config_.sample_rate, config_.amp_low, config_.amp_high);
}

Samples ChannelSimulation::makeNoise(const Samples& t) {
    auto mains = mainsNoise(t, config_.mains_amplitude, config_.mains_freq);
    auto gauss = gaussianNoise(t, config_.gaussian_sigma, rng_);
    auto impulses = impulseNoise(t, config_.num_impulses, config_.impulse_magnitude, rng_);

    return dsp::add(dsp::add(mains, gauss), impulses);
}

ChannelReport ChannelSimulation::run() {
    const double fs = config_.sample_rate;
    ChannelReport report;

    report.time = timeVector(config_.duration_s, fs);
    report.clean = makeClean(report.time, report.bits);
    report.noisy = dsp::add(report.clean, makeNoise(report.time));

    LOG_SIM(DEBUG, "Channel: %zu samples at %.0f Hz, carrier %.0f Hz, %s",
            report.time.size(), fs, config_.carrier_freq,
            config_.use_data ? "ASK data" : "unmodulated");

    report.snr_db = computeSnr(report.clean, report.noisy);
    report.bandlimited_snr_db = computeBandlimitedSnr(
        report.clean, report.noisy, fs, config_.carrier_freq, config_.snr_bandwidth_hz);
    report.thd = computeThd(report.clean, fs, config_.carrier_freq, config_.thd_harmonics);

    report.clean_fft = computeFft(report.clean, fs);
    report.noisy_fft = computeFft(report.noisy, fs);
    report.noise_fft = computeFft(dsp::subtract(report.noisy, report.clean), fs);
    report.noisy_psd = computePsd(report.noisy, fs, config_.psd_segment);

    LOG_SIM(DEBUG, "SNR %.2f dB, band-limited %.2f dB", report.snr_db, report.bandlimited_snr_db);

    if (config_.apply_notch) {
        report.filtered = notchFilter(report.noisy, fs, config_.notch_freq, config_.notch_q);
        report.filtered_snr_db = computeSnr(report.clean, report.filtered);
        report.filtered_bandlimited_snr_db = computeBandlimitedSnr(
            report.clean, report.filtered, fs, config_.carrier_freq, config_.snr_bandwidth_hz);
        report.filtered_fft = computeFft(report.filtered, fs);
        report.notch_applied = true;

        LOG_SIM(DEBUG, "After %.1f Hz notch: SNR %.2f dB, band-limited %.2f dB",
                config_.notch_freq, report.filtered_snr_db, report.filtered_bandlimited_snr_db);
    }

    return report;
}

} // namespace sim
} // namespace chanqual
