#define _USE_MATH_DEFINES
#include <cmath>
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

#include "chanqual/dsp.hpp"
#include "chanqual/noise.hpp"
#include "chanqual/signal.hpp"
#include "test_harness.hpp"

#include <algorithm>
#include <complex>
#include <stdexcept>

using namespace chanqual;

// Frequency response of a biquad at f
static double gainAt(const BiquadFilter& filter, double f, double fs) {
    const auto& c = filter.coeffs();
    std::complex<double> z1 = std::polar(1.0, -2 * M_PI * f / fs);
    std::complex<double> z2 = z1 * z1;
    auto num = c.b0 + c.b1 * z1 + c.b2 * z2;
    auto den = 1.0 + c.a1 * z1 + c.a2 * z2;
    return std::abs(num / den);
}

static SampleSpan interior(const Samples& x, size_t skip) {
    return SampleSpan(x).subspan(skip, x.size() - 2 * skip);
}

bool test_notch_response() {
    std::cout << "\n--- Notch frequency response ---\n";

    const double fs = 100000;
    auto notch = BiquadFilter::notch(50, 30, fs);

    TEST_ASSERT(gainAt(notch, 50, fs) < 1e-6, "Null at the notch frequency");
    TEST_ASSERT_NEAR(gainAt(notch, 0, fs), 1.0, 1e-8, "Unity at DC");
    TEST_ASSERT_NEAR(gainAt(notch, fs / 2, fs), 1.0, 1e-9, "Unity at Nyquist");
    TEST_ASSERT_NEAR(gainAt(notch, 10000, fs), 1.0, 1e-6, "Carrier passes");

    // -3 dB edges at f0 +/- f0/(2Q)
    double edge = 50 + 50.0 / 60;
    TEST_ASSERT_NEAR(gainAt(notch, edge, fs), 1 / std::sqrt(2.0), 0.01, "-3 dB bandwidth f0/Q");

    auto wide = BiquadFilter::notch(50, 2, fs);
    TEST_ASSERT(gainAt(wide, 45, fs) < gainAt(notch, 45, fs), "Lower Q rejects a wider band");

    TEST_PASS("Notch rejects f0 only, bandwidth set by Q");
    return true;
}

bool test_notch_removes_mains() {
    std::cout << "\n--- Notch removes mains hum, keeps carrier ---\n";

    const double fs = 25000;
    auto t = timeVector(4.0, fs);
    auto hum = mainsNoise(t, 1.0, 50.0);
    auto carrier = carrierWave(10000, t);

    // Skip the filter's settling time (~0.2 s at Q=30) at each end
    const size_t skip = static_cast<size_t>(fs);

    auto hum_out = notchFilter(hum, fs, 50.0, 30.0);
    TEST_ASSERT(hum_out.size() == hum.size(), "Length preserved");

    double attenuation_db = dsp::powerToDb(dsp::meanSquare(interior(hum, skip)) /
                                           dsp::meanSquare(interior(hum_out, skip)));
    std::cout << "  50 Hz attenuation: " << attenuation_db << " dB\n";
    TEST_ASSERT(attenuation_db > 20, "Mains hum suppressed by more than 20 dB");

    auto mixed_out = notchFilter(dsp::add(hum, carrier), fs, 50.0, 30.0);
    double change_db = std::abs(dsp::powerToDb(dsp::meanSquare(mixed_out) / dsp::meanSquare(carrier)));
    std::cout << "  Carrier power change: " << change_db << " dB\n";
    TEST_ASSERT(change_db < 1.0, "10 kHz carrier power within 1 dB");

    TEST_PASS("Hum rejected, carrier untouched");
    return true;
}

bool test_filtfilt_zero_phase() {
    std::cout << "\n--- Forward-backward filtering is zero-phase ---\n";

    // Notch close to the tone so a single pass visibly shifts its phase
    const double fs = 8000;
    auto t = timeVector(1.0, fs);
    auto x = carrierWave(1000, t);
    auto notch = BiquadFilter::notch(900, 5, fs);
    const size_t skip = 400;

    auto residual = [&](const Samples& y) {
        auto xi = interior(x, skip);
        auto yi = interior(y, skip);
        double xy = 0, xx = 0;
        for (size_t i = 0; i < xi.size(); ++i) {
            xy += xi[i] * yi[i];
            xx += xi[i] * xi[i];
        }
        double g = xy / xx;
        double err = 0;
        for (size_t i = 0; i < xi.size(); ++i) {
            double d = yi[i] - g * xi[i];
            err += d * d;
        }
        return std::sqrt(err / xx);
    };

    auto zero_phase = notch.filtfilt(x);
    BiquadFilter streaming(notch.coeffs());
    auto single_pass = streaming.process(x);

    double zp_residual = residual(zero_phase);
    double sp_residual = residual(single_pass);
    std::cout << "  filtfilt residual " << zp_residual << ", single pass " << sp_residual << "\n";

    TEST_ASSERT(zero_phase.size() == x.size(), "Length preserved");
    TEST_ASSERT(zp_residual < 1e-6, "filtfilt output is a scaled copy of the input");
    TEST_ASSERT(sp_residual > 1e-2, "Single pass shifts phase");

    double expected_gain = std::pow(gainAt(notch, 1000, fs), 2);
    double peak = 0;
    for (auto s : interior(zero_phase, skip)) peak = std::max(peak, std::abs(s));
    TEST_ASSERT_NEAR(peak, expected_gain, 1e-3, "Magnitude response applied twice");

    TEST_PASS("No group delay relative to input");
    return true;
}

bool test_filtfilt_dc_and_short() {
    std::cout << "\n--- filtfilt DC and short records ---\n";

    auto notch = BiquadFilter::notch(50, 30, 1000);

    // Steady-state start: a constant passes without an edge transient
    Samples dc(500, 1.0);
    auto y = notch.filtfilt(dc);
    for (auto s : y) {
        TEST_ASSERT_NEAR(s, 1.0, 1e-9, "DC preserved end to end");
    }

    TEST_ASSERT(notchFilter(Samples{}, 1000).empty(), "Empty in, empty out");
    for (size_t n : {1, 2, 5, 10}) {
        Samples x(n, 0.5);
        auto out = notchFilter(x, 1000);
        TEST_ASSERT(out.size() == n, "Short record keeps its length");
        for (auto s : out) {
            TEST_ASSERT_NEAR(s, 0.5, 1e-9, "Short constant record preserved");
        }
    }

    TEST_PASS("Constant and short inputs handled");
    return true;
}

bool test_streaming_reset() {
    std::cout << "\n--- Streaming state and reset ---\n";

    auto t = timeVector(0.05, 8000);
    auto x = carrierWave(60, t);
    auto filter = BiquadFilter::notch(60, 10, 8000);

    auto first = filter.process(x);
    auto continued = filter.process(x);
    filter.reset();
    auto again = filter.process(x);

    TEST_ASSERT(first == again, "reset() restores the initial state");
    TEST_ASSERT(first != continued, "State carries across blocks");

    TEST_PASS("process() is stateful, reset() clears it");
    return true;
}

bool test_notch_invalid() {
    std::cout << "\n--- Notch parameter checks ---\n";

    Samples x(100, 0.0);
    TEST_ASSERT_THROWS(notchFilter(x, 1000, 0.0, 30), std::invalid_argument, "Zero frequency");
    TEST_ASSERT_THROWS(notchFilter(x, 1000, 500.0, 30), std::invalid_argument, "At Nyquist");
    TEST_ASSERT_THROWS(notchFilter(x, 1000, 50.0, 0.0), std::invalid_argument, "Zero Q");
    TEST_ASSERT_THROWS(notchFilter(x, -1000, 50.0, 30), std::invalid_argument, "Negative fs");

    TEST_PASS("Invalid notch parameters throw");
    return true;
}

int main() {
    std::cout << "Testing notch filter...\n";

    test_notch_response();
    test_notch_removes_mains();
    test_filtfilt_zero_phase();
    test_filtfilt_dc_and_short();
    test_streaming_reset();
    test_notch_invalid();

    return testSummary("Notch");
}
