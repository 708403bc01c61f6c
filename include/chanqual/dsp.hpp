#pragma once

#include "types.hpp"
#include <array>
#include <cmath>
#include <memory>

namespace chanqual {

/**
 * FFT wrapper
 *
 * Owns FFTW3 plans for one transform length. Any length is accepted,
 * not only powers of two, so a record is transformed as-is without
 * zero padding. Plans are created and destroyed under a global lock
 * (the FFTW planner is not re-entrant); executing a plan is not.
 */
class FFT {
public:
    explicit FFT(size_t size);
    ~FFT();

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;

    // Complex forward FFT: time -> frequency (unnormalized)
    void forward(const Complex* in, Complex* out);
    void forward(const std::vector<Complex>& in, std::vector<Complex>& out);

    // Real forward FFT: N real -> N/2+1 complex (unnormalized)
    void forwardReal(const Sample* in, Complex* out);
    std::vector<Complex> forwardReal(SampleSpan in);

    size_t size() const { return size_; }

private:
    size_t size_;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * IIR Biquad Filter
 *
 * Transposed direct form II, a0 normalized to 1.
 */
class BiquadFilter {
public:
    struct Coeffs {
        double b0, b1, b2;  // Numerator
        double a1, a2;      // Denominator (a0 normalized to 1)
    };

    explicit BiquadFilter(const Coeffs& coeffs);

    // Band-reject centred on freq, -3 dB rejection bandwidth freq/q
    static BiquadFilter notch(double freq, double q, double sample_rate);

    Sample process(Sample in);
    Samples process(SampleSpan in);
    void reset();

    // Zero-phase forward-backward filtering of a whole record.
    // Does not touch the streaming state used by process().
    Samples filtfilt(SampleSpan in) const;

    // State after an infinitely long unit step, used to start filtfilt
    // without an edge transient
    std::array<double, 2> steadyStateZi() const;

    const Coeffs& coeffs() const { return coeffs_; }

private:
    Coeffs coeffs_;
    double z1_ = 0, z2_ = 0;  // State
};

/**
 * Remove a single tone (mains hum) with a zero-phase notch.
 * Output is sample-aligned with the input.
 */
Samples notchFilter(SampleSpan signal, double fs, double notch_freq = 50.0, double q = 30.0);

// Utility functions
namespace dsp {

// Mean of squared samples (0 for an empty span)
double meanSquare(SampleSpan samples);

// Compute RMS level
double rms(SampleSpan samples);

// Elementwise a - b; spans must have equal length
Samples subtract(SampleSpan a, SampleSpan b);

// Elementwise sum of equally long signals
Samples add(SampleSpan a, SampleSpan b);

// Hann window; periodic=true gives the DFT-even form used for spectral averaging
std::vector<Sample> hannWindow(size_t size, bool periodic = false);

// DFT bin centre frequencies in FFT output order: 0, +df, ..., then negative
Samples fftFrequencies(size_t n, double fs);

// Throws std::invalid_argument "<who>: sample rate must be positive, got <fs>"
// unless fs is finite and > 0
void requireSampleRate(const char* who, double fs);

// Convert between linear and dB
inline double powerToDb(double ratio) { return 10.0 * std::log10(ratio); }
inline double amplitudeToDb(double ratio) { return 20.0 * std::log10(ratio); }

} // namespace dsp

} // namespace chanqual
