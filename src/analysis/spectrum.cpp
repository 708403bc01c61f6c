#include "chanqual/analysis.hpp"
#include "chanqual/dsp.hpp"
#include "chanqual/logging.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace chanqual {

Spectrum computeFft(SampleSpan signal, double fs) {
    dsp::requireSampleRate("computeFft", fs);

    Spectrum spec;
    const size_t n = signal.size();
    const size_t half = n / 2;
    if (half == 0) {
        LOG_SPEC(DEBUG, "computeFft: %zu samples, no positive-frequency bins", n);
        return spec;
    }

    FFT fft(n);
    auto bins = fft.forwardReal(signal);

    spec.freqs.resize(half);
    spec.values.resize(half);
    double df = fs / n;
    for (size_t k = 0; k < half; ++k) {
        spec.freqs[k] = k * df;
        spec.values[k] = std::abs(bins[k]) / n;
    }
    return spec;
}

Spectrum computePsd(SampleSpan signal, double fs, size_t nperseg) {
    dsp::requireSampleRate("computePsd", fs);
    if (nperseg == 0) {
        throw std::invalid_argument("computePsd: segment length must be positive");
    }

    Spectrum spec;
    const size_t n = signal.size();
    if (n == 0) {
        LOG_SPEC(DEBUG, "computePsd: empty signal");
        return spec;
    }

    size_t seg = nperseg;
    if (seg > n) {
        LOG_SPEC(DEBUG, "computePsd: segment %zu longer than signal, using %zu", nperseg, n);
        seg = n;
    }

    const size_t overlap = seg / 2;
    const size_t step = seg - overlap;
    const size_t num_segments = (n - seg) / step + 1;
    const size_t num_bins = seg / 2 + 1;

    auto window = dsp::hannWindow(seg, true);
    double window_power = 0;
    for (auto w : window) window_power += w * w;
    const double scale = 1.0 / (fs * window_power);

    FFT fft(seg);
    Samples segment(seg);
    std::vector<Complex> bins(num_bins);
    Samples power(num_bins, 0.0);

    for (size_t s = 0; s < num_segments; ++s) {
        const size_t start = s * step;

        double mean = 0;
        for (size_t i = 0; i < seg; ++i) mean += signal[start + i];
        mean /= seg;

        for (size_t i = 0; i < seg; ++i) {
            segment[i] = (signal[start + i] - mean) * window[i];
        }

        fft.forwardReal(segment.data(), bins.data());
        for (size_t k = 0; k < num_bins; ++k) {
            power[k] += std::norm(bins[k]) * scale;
        }
    }

    // Fold negative frequencies in; DC and an even-length Nyquist bin have no mirror
    size_t fold_end = (seg % 2 == 0) ? num_bins - 1 : num_bins;
    for (size_t k = 1; k < fold_end; ++k) {
        power[k] *= 2.0;
    }

    spec.freqs.resize(num_bins);
    spec.values.resize(num_bins);
    for (size_t k = 0; k < num_bins; ++k) {
        spec.freqs[k] = k * fs / seg;
        spec.values[k] = power[k] / num_segments;
    }

    LOG_SPEC(TRACE, "computePsd: %zu segments of %zu samples, %zu bins",
             num_segments, seg, num_bins);
    return spec;
}

} // namespace chanqual
