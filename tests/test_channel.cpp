#include "sim/channel_simulation.hpp"
#include "chanqual/analysis.hpp"
#include "chanqual/dsp.hpp"
#include "chanqual/logging.hpp"
#include "test_harness.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

using namespace chanqual;

// 10 kHz carrier at 100 kHz for 20 ms under hum, white noise and 20 impulses
static ChannelConfig referenceChannel() {
    auto cfg = presets::pureCarrier();
    cfg.seed = 1234;
    return cfg;
}

bool test_reference_channel() {
    std::cout << "\n--- Reference channel end to end ---\n";

    sim::ChannelSimulation channel(referenceChannel());
    auto report = channel.run();

    TEST_ASSERT(report.time.size() == 2000, "20 ms at 100 kHz");
    TEST_ASSERT(report.bits.empty(), "Unmodulated carrier carries no bits");

    // Expected noise power 0.125 + 0.04 + 20 * 4 / 2000 against 0.5
    std::cout << "  broadband " << report.snr_db << " dB, band-limited "
              << report.bandlimited_snr_db << " dB\n";
    TEST_ASSERT(std::isfinite(report.snr_db), "Broadband SNR finite");
    TEST_ASSERT(report.snr_db > 0 && report.snr_db < 15, "Broadband SNR in expected range");

    // Hum lies far outside 9-11 kHz and white noise is mostly outside it
    TEST_ASSERT(report.bandlimited_snr_db > report.snr_db + 5,
                "Band-limited SNR well above broadband");

    TEST_ASSERT(report.thd.db < -100, "Clean sine has negligible THD");

    TEST_PASS("Noisy carrier scored broadband and in band");
    return true;
}

bool test_report_shapes() {
    std::cout << "\n--- Report fields ---\n";

    auto cfg = presets::interactive();
    cfg.seed = 3;
    sim::ChannelSimulation channel(cfg);
    auto report = channel.run();

    const size_t n = cfg.numSamples();
    TEST_ASSERT(report.time.size() == n, "Time base matches config");
    TEST_ASSERT(report.clean.size() == n && report.noisy.size() == n, "Signals aligned");
    TEST_ASSERT(report.bits.size() == 20, "ceil(duration * bit_rate) bits");

    TEST_ASSERT(report.clean_fft.size() == n / 2, "Clean spectrum N/2 bins");
    TEST_ASSERT(report.noisy_fft.size() == n / 2, "Noisy spectrum N/2 bins");
    TEST_ASSERT(report.noise_fft.size() == n / 2, "Noise spectrum N/2 bins");
    TEST_ASSERT(report.noisy_psd.size() == cfg.psd_segment / 2 + 1, "Welch bins");

    TEST_ASSERT(report.notch_applied, "Notch stage ran");
    TEST_ASSERT(report.filtered.size() == n, "Filtered signal aligned");
    TEST_ASSERT(report.filtered_fft.size() == n / 2, "Filtered spectrum N/2 bins");
    TEST_ASSERT(std::isfinite(report.filtered_snr_db), "Filtered SNR finite");

    // noise_fft is the spectrum of noisy - clean
    auto noise = computeFft(dsp::subtract(report.noisy, report.clean), cfg.sample_rate);
    TEST_ASSERT(noise.values == report.noise_fft.values, "Noise spectrum of the difference");

    cfg.apply_notch = false;
    auto raw = sim::ChannelSimulation(cfg).run();
    TEST_ASSERT(!raw.notch_applied && raw.filtered.empty(), "Notch stage skipped when disabled");

    TEST_PASS("Every report field sized consistently");
    return true;
}

bool test_seeded_reproducibility() {
    std::cout << "\n--- Seeded runs ---\n";

    auto cfg = presets::batchDemo();
    auto a = sim::ChannelSimulation(cfg).run();
    auto b = sim::ChannelSimulation(cfg).run();
    TEST_ASSERT(a.noisy == b.noisy && a.bits == b.bits, "Same seed, same channel");
    TEST_ASSERT(a.snr_db == b.snr_db, "Same seed, same SNR");

    cfg.seed = 1;
    auto c = sim::ChannelSimulation(cfg).run();
    TEST_ASSERT(a.noisy != c.noisy, "Different seed, different noise");

    sim::ChannelSimulation channel(presets::batchDemo());
    TEST_ASSERT(channel.getConfig().num_impulses == 25, "Instance keeps its config");
    auto first = channel.run();
    auto second = channel.run();
    TEST_ASSERT(first.noisy == a.noisy, "First run matches a fresh instance");
    TEST_ASSERT(first.noisy != second.noisy, "Repeated runs continue the stream");

    TEST_PASS("Seed pins the whole channel");
    return true;
}

bool test_presets() {
    std::cout << "\n--- Presets ---\n";

    auto interactive = presets::interactive();
    TEST_ASSERT(interactive.use_data && !interactive.seed, "Interactive: ASK data, fresh noise");
    TEST_ASSERT(interactive.num_impulses == 20 && interactive.thd_harmonics == 5,
                "Interactive defaults");

    auto demo = presets::batchDemo();
    TEST_ASSERT(demo.num_impulses == 25 && demo.thd_harmonics == 6, "Demo scenario");
    TEST_ASSERT(demo.seed && *demo.seed == 0, "Demo is seeded");

    auto carrier = presets::pureCarrier();
    TEST_ASSERT(!carrier.use_data && carrier.seed, "Pure carrier is unmodulated and seeded");

    interactive.validate();
    demo.validate();
    carrier.validate();

    TEST_PASS("Presets are valid and distinct");
    return true;
}

bool test_config_validation() {
    std::cout << "\n--- Config validation ---\n";

    auto bad = [](auto mutate) {
        auto cfg = presets::interactive();
        mutate(cfg);
        return cfg;
    };

    TEST_ASSERT_THROWS(sim::ChannelSimulation(bad([](ChannelConfig& c) { c.sample_rate = 0; })),
                       std::invalid_argument, "Zero sample rate");
    TEST_ASSERT_THROWS(sim::ChannelSimulation(bad([](ChannelConfig& c) { c.duration_s = -1; })),
                       std::invalid_argument, "Negative duration");
    TEST_ASSERT_THROWS(sim::ChannelSimulation(bad([](ChannelConfig& c) { c.bit_rate = 0; })),
                       std::invalid_argument, "Zero bit rate with data");
    TEST_ASSERT_THROWS(sim::ChannelSimulation(bad([](ChannelConfig& c) { c.gaussian_sigma = -0.1; })),
                       std::invalid_argument, "Negative sigma");
    TEST_ASSERT_THROWS(sim::ChannelSimulation(bad([](ChannelConfig& c) { c.thd_harmonics = 0; })),
                       std::invalid_argument, "No harmonics");
    TEST_ASSERT_THROWS(sim::ChannelSimulation(bad([](ChannelConfig& c) { c.psd_segment = 0; })),
                       std::invalid_argument, "Zero PSD segment");
    TEST_ASSERT_THROWS(sim::ChannelSimulation(bad([](ChannelConfig& c) { c.notch_freq = 60000; })),
                       std::invalid_argument, "Notch above Nyquist");
    TEST_ASSERT_THROWS(sim::ChannelSimulation(bad([](ChannelConfig& c) { c.notch_q = 0; })),
                       std::invalid_argument, "Zero notch Q");
    TEST_ASSERT_THROWS(sim::ChannelSimulation(bad([](ChannelConfig& c) {
                           c.sample_rate = 1e10; c.duration_s = 1e10; })),
                       std::invalid_argument, "Sample count overflows size_t");

    // Fields of disabled stages are not checked
    auto no_data = bad([](ChannelConfig& c) { c.use_data = false; c.bit_rate = 0; });
    no_data.validate();
    auto no_notch = bad([](ChannelConfig& c) { c.apply_notch = false; c.notch_freq = 0; });
    no_notch.validate();

    try {
        bad([](ChannelConfig& c) { c.sample_rate = -5; }).validate();
        TEST_ASSERT(false, "validate() should throw");
    } catch (const std::invalid_argument& e) {
        std::string what = e.what();
        std::cout << "  Message: " << what << "\n";
        TEST_ASSERT(what.find("sample_rate") != std::string::npos, "Message names the field");
    }

    TEST_PASS("Bad parameters rejected up front");
    return true;
}

bool test_log_level_names() {
    std::cout << "\n--- Log level names ---\n";

    LogLevel level = LogLevel::NONE;
    TEST_ASSERT(parseLogLevel("trace", level) && level == LogLevel::TRACE, "trace");
    TEST_ASSERT(parseLogLevel("warn", level) && level == LogLevel::WARN, "warn");
    TEST_ASSERT(parseLogLevel("none", level) && level == LogLevel::NONE, "none");

    level = LogLevel::INFO;
    TEST_ASSERT(!parseLogLevel("warning", level), "Longer name rejected");
    TEST_ASSERT(!parseLogLevel("err", level), "Prefix rejected");
    TEST_ASSERT(!parseLogLevel("", level), "Empty name rejected");
    TEST_ASSERT(level == LogLevel::INFO, "Unknown name leaves the level untouched");

    TEST_PASS("CLI log level names parse exactly");
    return true;
}

int main() {
    std::cout << "Testing channel simulation...\n";
    setLogLevel(LogLevel::WARN);

    test_reference_channel();
    test_report_shapes();
    test_seeded_reproducibility();
    test_presets();
    test_config_validation();
    test_log_level_names();

    return testSummary("Channel");
}
