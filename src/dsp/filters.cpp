#include "chanqual/dsp.hpp"
#include "chanqual/logging.hpp"
#define _USE_MATH_DEFINES
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <string>

// M_PI may not be defined on MSVC even with _USE_MATH_DEFINES if cmath was included earlier
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace chanqual {

// ============ Biquad Filter ============

BiquadFilter::BiquadFilter(const Coeffs& coeffs) : coeffs_(coeffs) {}

BiquadFilter BiquadFilter::notch(double freq, double q, double sample_rate) {
    dsp::requireSampleRate("notch", sample_rate);
    if (!(freq > 0) || !(freq < sample_rate / 2)) {
        throw std::invalid_argument("notch: frequency " + std::to_string(freq) +
                                    " Hz outside (0, " + std::to_string(sample_rate / 2) + ") Hz");
    }
    if (!(q > 0) || !std::isfinite(q)) {
        throw std::invalid_argument("notch: Q must be positive, got " + std::to_string(q));
    }

    // -3 dB rejection bandwidth of freq/q
    double w0 = 2.0 * M_PI * freq / sample_rate;
    double bw = w0 / q;
    double beta = std::tan(bw / 2.0);
    double gain = 1.0 / (1.0 + beta);
    double cos_w0 = std::cos(w0);

    Coeffs c;
    c.b0 = gain;
    c.b1 = -2.0 * gain * cos_w0;
    c.b2 = gain;
    c.a1 = c.b1;
    c.a2 = 2.0 * gain - 1.0;

    return BiquadFilter(c);
}

Sample BiquadFilter::process(Sample in) {
    Sample out = coeffs_.b0 * in + z1_;
    z1_ = coeffs_.b1 * in - coeffs_.a1 * out + z2_;
    z2_ = coeffs_.b2 * in - coeffs_.a2 * out;
    return out;
}

Samples BiquadFilter::process(SampleSpan in) {
    Samples out(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        out[i] = process(in[i]);
    }
    return out;
}

void BiquadFilter::reset() {
    z1_ = z2_ = 0;
}

std::array<double, 2> BiquadFilter::steadyStateZi() const {
    const Coeffs& c = coeffs_;
    double dc_gain = (c.b0 + c.b1 + c.b2) / (1.0 + c.a1 + c.a2);
    double z2 = c.b2 - c.a2 * dc_gain;
    double z1 = c.b1 + c.b2 - (c.a1 + c.a2) * dc_gain;
    return {z1, z2};
}

Samples BiquadFilter::filtfilt(SampleSpan in) const {
    const size_t n = in.size();
    if (n == 0) return {};

    // Odd extension of 3 * (filter order + 1) samples at each end
    size_t padlen = std::min<size_t>(9, n - 1);

    Samples ext(n + 2 * padlen);
    for (size_t i = 0; i < padlen; ++i) {
        ext[i] = 2.0 * in[0] - in[padlen - i];
        ext[padlen + n + i] = 2.0 * in[n - 1] - in[n - 2 - i];
    }
    std::copy(in.begin(), in.end(), ext.begin() + padlen);

    auto zi = steadyStateZi();

    BiquadFilter fwd(coeffs_);
    fwd.z1_ = zi[0] * ext.front();
    fwd.z2_ = zi[1] * ext.front();
    Samples y = fwd.process(ext);

    std::reverse(y.begin(), y.end());
    BiquadFilter bwd(coeffs_);
    bwd.z1_ = zi[0] * y.front();
    bwd.z2_ = zi[1] * y.front();
    Samples z = bwd.process(y);
    std::reverse(z.begin(), z.end());

    return Samples(z.begin() + padlen, z.begin() + padlen + n);
}

Samples notchFilter(SampleSpan signal, double fs, double notch_freq, double q) {
    auto filter = BiquadFilter::notch(notch_freq, q, fs);
    if (signal.size() < 10) {
        LOG_FILT(DEBUG, "Short record (%zu samples): edge padding reduced", signal.size());
    }
    return filter.filtfilt(signal);
}

// ============ Utility functions ============

namespace dsp {

double meanSquare(SampleSpan samples) {
    if (samples.empty()) return 0;
    double sum_sq = 0;
    for (auto s : samples) sum_sq += s * s;
    return sum_sq / samples.size();
}

double rms(SampleSpan samples) {
    return std::sqrt(meanSquare(samples));
}

Samples subtract(SampleSpan a, SampleSpan b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("subtract: lengths differ (" + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()) + ")");
    }
    Samples out(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        out[i] = a[i] - b[i];
    }
    return out;
}

Samples add(SampleSpan a, SampleSpan b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("add: lengths differ (" + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()) + ")");
    }
    Samples out(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        out[i] = a[i] + b[i];
    }
    return out;
}

std::vector<Sample> hannWindow(size_t size, bool periodic) {
    if (size <= 1) return std::vector<Sample>(size, 1.0);

    std::vector<Sample> w(size);
    double denom = periodic ? static_cast<double>(size) : static_cast<double>(size - 1);
    for (size_t n = 0; n < size; ++n) {
        w[n] = 0.5 * (1.0 - std::cos(2.0 * M_PI * n / denom));
    }
    return w;
}

Samples fftFrequencies(size_t n, double fs) {
    Samples freqs(n);
    if (n == 0) return freqs;
    double df = fs / n;
    // Bins above (n-1)/2 alias to negative frequencies
    size_t positive = (n - 1) / 2;
    for (size_t k = 0; k < n; ++k) {
        if (k <= positive) {
            freqs[k] = k * df;
        } else {
            freqs[k] = -static_cast<double>(n - k) * df;
        }
    }
    return freqs;
}

void requireSampleRate(const char* who, double fs) {
    if (!(fs > 0) || !std::isfinite(fs)) {
        throw std::invalid_argument(std::string(who) + ": sample rate must be positive, got " +
                                    std::to_string(fs));
    }
}

} // namespace dsp

} // namespace chanqual
