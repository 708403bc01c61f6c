#include "chanqual/logging.hpp"
#include "chanqual/types.hpp"
#include "sim/channel_simulation.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

using namespace chanqual;

void printUsage(const char* prog) {
    std::cerr << "chanqual - Noisy channel quality analyzer\n\n";
    std::cerr << "Usage: " << prog << " [options]\n\n";
    std::cerr << "Synthesizes a carrier, adds mains hum, Gaussian and impulse noise,\n";
    std::cerr << "and reports SNR, band-limited SNR and THD before and after a mains notch.\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --preset <name>     demo (default), interactive, carrier\n";
    std::cerr << "  -r <rate>           Sample rate in Hz (default: 100000)\n";
    std::cerr << "  -t <seconds>        Duration (default: 0.02)\n";
    std::cerr << "  -f <hz>             Carrier frequency (default: 10000)\n";
    std::cerr << "  -b <bps>            ASK bit rate (default: 1000)\n";
    std::cerr << "  --no-data           Unmodulated carrier\n";
    std::cerr << "  --mains <amp>       Mains hum amplitude (default: 0.5)\n";
    std::cerr << "  --mains-freq <hz>   Mains frequency (default: 50)\n";
    std::cerr << "  --sigma <s>         Gaussian noise sigma (default: 0.2)\n";
    std::cerr << "  --impulses <n>      Number of impulses\n";
    std::cerr << "  --impulse-mag <m>   Impulse magnitude (default: 2.0)\n";
    std::cerr << "  --bandwidth <hz>    Band for band-limited SNR (default: 2000)\n";
    std::cerr << "  --harmonics <n>     Highest THD harmonic order\n";
    std::cerr << "  --nperseg <n>       Welch segment length (default: 1024)\n";
    std::cerr << "  --notch-freq <hz>   Notch centre (default: 50)\n";
    std::cerr << "  -q <Q>              Notch quality factor (default: 30)\n";
    std::cerr << "  --no-notch          Skip the notch stage\n";
    std::cerr << "  --seed <n>          Noise seed\n";
    std::cerr << "  --random            Fresh noise on every run\n";
    std::cerr << "  --peaks <n>         List the n strongest noise-only spectral lines\n";
    std::cerr << "  --log-level <lvl>   none, error, warn, info, debug, trace\n";
    std::cerr << "  -v                  Same as --log-level debug\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " --no-data --impulses 20 --peaks 5\n";
    std::cerr << "  " << prog << " --mains 1.0 --mains-freq 60 --notch-freq 60\n";
    std::cerr << "\n";
}

static void printPeaks(const Spectrum& spec, size_t count) {
    std::vector<size_t> order(spec.size());
    std::iota(order.begin(), order.end(), 0);
    count = std::min(count, order.size());
    std::partial_sort(order.begin(), order.begin() + count, order.end(),
                      [&](size_t a, size_t b) { return spec.values[a] > spec.values[b]; });

    std::cout << "\nStrongest noise-only components:\n";
    std::cout << "  " << std::setw(12) << "Freq (Hz)" << std::setw(14) << "Level (dB)" << "\n";
    for (size_t i = 0; i < count; ++i) {
        size_t k = order[i];
        double level_db = 20.0 * std::log10(spec.values[k] + 1e-12);
        std::cout << "  " << std::setw(12) << std::setprecision(1) << std::fixed << spec.freqs[k]
                  << std::setw(14) << std::setprecision(2) << level_db << "\n";
    }
}

static void printReport(const ChannelConfig& cfg, const sim::ChannelReport& report) {
    std::cout << "=== Channel ===\n";
    std::cout << "  Samples:        " << report.time.size() << " @ " << cfg.sample_rate << " Hz\n";
    std::cout << "  Carrier:        " << cfg.carrier_freq << " Hz"
              << (cfg.use_data ? " (ASK, " + std::to_string(report.bits.size()) + " bits)" : "")
              << "\n";
    std::cout << "  Noise:          mains " << cfg.mains_amplitude << " @ " << cfg.mains_freq
              << " Hz, sigma " << cfg.gaussian_sigma << ", " << cfg.num_impulses
              << " impulses of " << cfg.impulse_magnitude << "\n";

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n=== Quality ===\n";
    std::cout << "  SNR (clean vs noisy):        " << report.snr_db << " dB\n";
    std::cout << "  Band-limited SNR (" << std::setprecision(0) << cfg.snr_bandwidth_hz
              << " Hz):  " << std::setprecision(2) << report.bandlimited_snr_db << " dB\n";
    std::cout << "  THD (clean):                 ratio=" << std::setprecision(4) << report.thd.ratio
              << ", " << std::setprecision(2) << report.thd.db << " dB\n";

    if (!report.noisy_psd.empty()) {
        auto it = std::max_element(report.noisy_psd.values.begin(), report.noisy_psd.values.end());
        size_t k = static_cast<size_t>(it - report.noisy_psd.values.begin());
        std::cout << "  PSD peak:                    " << std::setprecision(1)
                  << report.noisy_psd.freqs[k] << " Hz\n";
    }

    if (report.notch_applied) {
        std::cout << std::setprecision(2);
        std::cout << "\n=== After " << cfg.notch_freq << " Hz notch (Q=" << cfg.notch_q << ") ===\n";
        std::cout << "  SNR (broadband):             " << report.filtered_snr_db << " dB\n";
        std::cout << "  SNR (band-limited):          " << report.filtered_bandlimited_snr_db << " dB\n";
    }
}

int main(int argc, char* argv[]) {
    ChannelConfig config = presets::batchDemo();
    size_t peaks = 0;

    try {
        // Preset first so later flags override it
        for (int i = 1; i < argc; i++) {
            if (strcmp(argv[i], "--preset") == 0 && i + 1 < argc) {
                std::string name = argv[i + 1];
                if (name == "interactive") {
                    config = presets::interactive();
                } else if (name == "carrier") {
                    config = presets::pureCarrier();
                } else if (name == "demo") {
                    config = presets::batchDemo();
                } else {
                    std::cerr << "Unknown preset: " << name << "\n";
                    return 1;
                }
            }
        }

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--preset" && has_value) {
                ++i;
            } else if (arg == "-r" && has_value) {
                config.sample_rate = std::stod(argv[++i]);
            } else if (arg == "-t" && has_value) {
                config.duration_s = std::stod(argv[++i]);
            } else if (arg == "-f" && has_value) {
                config.carrier_freq = std::stod(argv[++i]);
            } else if (arg == "-b" && has_value) {
                config.bit_rate = std::stod(argv[++i]);
            } else if (arg == "--no-data") {
                config.use_data = false;
            } else if (arg == "--mains" && has_value) {
                config.mains_amplitude = std::stod(argv[++i]);
            } else if (arg == "--mains-freq" && has_value) {
                config.mains_freq = std::stod(argv[++i]);
            } else if (arg == "--sigma" && has_value) {
                config.gaussian_sigma = std::stod(argv[++i]);
            } else if (arg == "--impulses" && has_value) {
                config.num_impulses = std::stoul(argv[++i]);
            } else if (arg == "--impulse-mag" && has_value) {
                config.impulse_magnitude = std::stod(argv[++i]);
            } else if (arg == "--bandwidth" && has_value) {
                config.snr_bandwidth_hz = std::stod(argv[++i]);
            } else if (arg == "--harmonics" && has_value) {
                config.thd_harmonics = std::stoi(argv[++i]);
            } else if (arg == "--nperseg" && has_value) {
                config.psd_segment = std::stoul(argv[++i]);
            } else if (arg == "--notch-freq" && has_value) {
                config.notch_freq = std::stod(argv[++i]);
            } else if (arg == "-q" && has_value) {
                config.notch_q = std::stod(argv[++i]);
            } else if (arg == "--no-notch") {
                config.apply_notch = false;
            } else if (arg == "--seed" && has_value) {
                config.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--random") {
                config.seed.reset();
            } else if (arg == "--peaks" && has_value) {
                peaks = std::stoul(argv[++i]);
            } else if (arg == "--log-level" && has_value) {
                LogLevel level = LogLevel::INFO;
                if (!parseLogLevel(argv[++i], level)) {
                    std::cerr << "Unknown log level: " << argv[i] << "\n";
                    return 1;
                }
                setLogLevel(level);
            } else if (arg == "-v" || arg == "--verbose") {
                setLogLevel(LogLevel::DEBUG);
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        sim::ChannelSimulation simulation(config);
        auto report = simulation.run();

        printReport(config, report);
        if (peaks > 0) {
            printPeaks(report.noise_fft, peaks);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("MAIN", "%s", e.what());
        return 1;
    }

    return 0;
}
