#pragma once

#include "types.hpp"

namespace chanqual {

/**
 * Single-sided magnitude spectrum.
 *
 * Returns the first N/2 DFT bins at k*fs/N with magnitude |X[k]|/N, so a
 * sinusoid of amplitude A landing on a bin reads A/2 there.
 */
Spectrum computeFft(SampleSpan signal, double fs);

/**
 * Welch power spectral density (V^2/Hz).
 *
 * Periodic Hann window, 50% overlap, per-segment mean removal, one-sided
 * density scaling. nperseg larger than the signal is clamped to the signal
 * length.
 */
Spectrum computePsd(SampleSpan signal, double fs, size_t nperseg = 1024);

// Broadband SNR in dB of noisy against clean.
// +inf when noisy == clean, NaN for empty inputs.
// Throws std::invalid_argument on a length mismatch.
double computeSnr(SampleSpan clean, SampleSpan noisy);

/**
 * SNR in dB counting only spectral energy within
 * [center - bw/2, center + bw/2] and its negative-frequency mirror.
 *
 * Same sentinels and length check as computeSnr().
 */
double computeBandlimitedSnr(SampleSpan clean, SampleSpan noisy, double fs,
                             double center_freq, double bandwidth);

/**
 * THD from the nearest FFT bins to the fundamental and its harmonics
 * 2..n_harmonics: ratio = sqrt(P_harmonics / P_fundamental).
 *
 * Returns {NaN, NaN} when the fundamental bin holds no energy.
 */
ThdResult computeThd(SampleSpan signal, double fs, double fundamental_freq, int n_harmonics = 5);

} // namespace chanqual
