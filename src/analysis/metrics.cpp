#include "chanqual/analysis.hpp"
#include "chanqual/dsp.hpp"
#include "chanqual/logging.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace chanqual {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

void requireSameLength(const char* who, SampleSpan clean, SampleSpan noisy) {
    if (clean.size() != noisy.size()) {
        throw std::invalid_argument(std::string(who) + ": clean has " +
                                    std::to_string(clean.size()) + " samples but noisy has " +
                                    std::to_string(noisy.size()));
    }
}

// Index of the bin closest to target; first one wins on a tie
size_t nearestBin(const Samples& freqs, double target) {
    size_t best = 0;
    double best_dist = std::abs(freqs[0] - target);
    for (size_t k = 1; k < freqs.size(); ++k) {
        double dist = std::abs(freqs[k] - target);
        if (dist < best_dist) {
            best_dist = dist;
            best = k;
        }
    }
    return best;
}

} // namespace

double computeSnr(SampleSpan clean, SampleSpan noisy) {
    requireSameLength("computeSnr", clean, noisy);
    if (clean.empty()) {
        LOG_METRIC(DEBUG, "computeSnr: empty signals, SNR undefined");
        return kNaN;
    }

    auto noise = dsp::subtract(noisy, clean);
    double signal_power = dsp::meanSquare(clean);
    double noise_power = dsp::meanSquare(noise);

    if (noise_power == 0) {
        LOG_METRIC(DEBUG, "computeSnr: zero noise power");
        return kInf;
    }
    return dsp::powerToDb(signal_power / noise_power);
}

double computeBandlimitedSnr(SampleSpan clean, SampleSpan noisy, double fs,
                             double center_freq, double bandwidth) {
    requireSameLength("computeBandlimitedSnr", clean, noisy);
    dsp::requireSampleRate("computeBandlimitedSnr", fs);
    const size_t n = clean.size();
    if (n == 0) {
        LOG_METRIC(DEBUG, "computeBandlimitedSnr: empty signals, SNR undefined");
        return kNaN;
    }

    std::vector<Complex> c_time(n), e_time(n);
    for (size_t i = 0; i < n; ++i) {
        c_time[i] = Complex(clean[i], 0.0);
        e_time[i] = Complex(noisy[i] - clean[i], 0.0);
    }

    FFT fft(n);
    std::vector<Complex> c_freq, e_freq;
    fft.forward(c_time, c_freq);
    fft.forward(e_time, e_freq);

    // A real signal's energy splits between +f and -f, so the band is
    // taken on both sides of DC
    const double low = center_freq - bandwidth / 2.0;
    const double high = center_freq + bandwidth / 2.0;
    auto freqs = dsp::fftFrequencies(n, fs);

    double signal_band = 0;
    double noise_band = 0;
    size_t bins_in_band = 0;
    for (size_t k = 0; k < n; ++k) {
        double f = freqs[k];
        bool in_band = (f >= low && f <= high) || (f <= -low && f >= -high);
        if (!in_band) continue;
        signal_band += std::norm(c_freq[k]);
        noise_band += std::norm(e_freq[k]);
        ++bins_in_band;
    }

    const double norm = static_cast<double>(n) * static_cast<double>(n);
    signal_band /= norm;
    noise_band /= norm;

    LOG_METRIC(TRACE, "computeBandlimitedSnr: %zu bins in [%.1f, %.1f] Hz",
               bins_in_band, low, high);

    if (noise_band == 0) {
        LOG_METRIC(DEBUG, "computeBandlimitedSnr: zero in-band noise power");
        return kInf;
    }
    return dsp::powerToDb(signal_band / noise_band);
}

ThdResult computeThd(SampleSpan signal, double fs, double fundamental_freq, int n_harmonics) {
    if (n_harmonics < 1) {
        throw std::invalid_argument("computeThd: harmonic count must be at least 1, got " +
                                    std::to_string(n_harmonics));
    }

    auto spec = computeFft(signal, fs);
    if (spec.empty()) {
        LOG_METRIC(DEBUG, "computeThd: no spectrum, THD undefined");
        return {kNaN, kNaN};
    }

    double mag_f = spec.values[nearestBin(spec.freqs, fundamental_freq)];
    double p_fund = mag_f * mag_f;

    double p_harm = 0;
    for (int h = 2; h <= n_harmonics; ++h) {
        double mag_h = spec.values[nearestBin(spec.freqs, fundamental_freq * h)];
        p_harm += mag_h * mag_h;
    }

    if (p_fund == 0) {
        LOG_METRIC(DEBUG, "computeThd: no energy at %.1f Hz, THD undefined", fundamental_freq);
        return {kNaN, kNaN};
    }

    double ratio = std::sqrt(p_harm / p_fund);
    return {ratio, dsp::amplitudeToDb(ratio)};
}

} // namespace chanqual
