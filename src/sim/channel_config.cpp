#include "chanqual/types.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace chanqual {

namespace {

void requirePositive(const char* field, double value) {
    if (!(value > 0) || !std::isfinite(value)) {
        throw std::invalid_argument(std::string("ChannelConfig.") + field +
                                    " must be positive, got " + std::to_string(value));
    }
}

void requireNonNegative(const char* field, double value) {
    if (!(value >= 0) || !std::isfinite(value)) {
        throw std::invalid_argument(std::string("ChannelConfig.") + field +
                                    " must be non-negative, got " + std::to_string(value));
    }
}

} // namespace

void ChannelConfig::validate() const {
    requirePositive("sample_rate", sample_rate);
    requirePositive("duration_s", duration_s);
    if (!(std::floor(duration_s * sample_rate) < static_cast<double>(std::numeric_limits<size_t>::max()))) {
        throw std::invalid_argument("ChannelConfig.duration_s " + std::to_string(duration_s) +
                                    " s at " + std::to_string(sample_rate) +
                                    " Hz is too many samples");
    }
    requireNonNegative("carrier_freq", carrier_freq);
    if (use_data) {
        requirePositive("bit_rate", bit_rate);
    }
    requireNonNegative("mains_freq", mains_freq);
    requireNonNegative("gaussian_sigma", gaussian_sigma);
    requireNonNegative("snr_bandwidth_hz", snr_bandwidth_hz);

    if (thd_harmonics < 1) {
        throw std::invalid_argument("ChannelConfig.thd_harmonics must be at least 1, got " +
                                    std::to_string(thd_harmonics));
    }
    if (psd_segment == 0) {
        throw std::invalid_argument("ChannelConfig.psd_segment must be positive");
    }

    if (apply_notch) {
        requirePositive("notch_q", notch_q);
        if (!(notch_freq > 0) || !(notch_freq < sample_rate / 2)) {
            throw std::invalid_argument("ChannelConfig.notch_freq " + std::to_string(notch_freq) +
                                        " Hz outside (0, " + std::to_string(sample_rate / 2) +
                                        ") Hz");
        }
    }
}

} // namespace chanqual
