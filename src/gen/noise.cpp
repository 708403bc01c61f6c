#include "chanqual/noise.hpp"
#include "chanqual/signal.hpp"
#include "chanqual/logging.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace chanqual {

std::mt19937 freshGenerator() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937(seq);
}

Samples mainsNoise(SampleSpan t, double amplitude, double mains_freq) {
    return carrierWave(mains_freq, t, amplitude);
}

Samples gaussianNoise(SampleSpan t, double sigma, std::mt19937& rng) {
    if (!(sigma >= 0) || !std::isfinite(sigma)) {
        throw std::invalid_argument("gaussianNoise: sigma must be non-negative, got " +
                                    std::to_string(sigma));
    }

    std::normal_distribution<double> gaussian(0.0, 1.0);
    Samples out(t.size());
    for (auto& s : out) {
        s = sigma * gaussian(rng);
    }
    return out;
}

Samples gaussianNoise(SampleSpan t, double sigma) {
    auto rng = freshGenerator();
    return gaussianNoise(t, sigma, rng);
}

Samples impulseNoise(SampleSpan t, size_t num_impulses, double magnitude, std::mt19937& rng) {
    Samples out(t.size(), 0.0);
    if (t.empty()) {
        if (num_impulses > 0) {
            LOG_GEN(DEBUG, "impulseNoise: empty time vector, %zu impulses dropped", num_impulses);
        }
        return out;
    }

    std::uniform_int_distribution<size_t> position(0, t.size() - 1);
    std::bernoulli_distribution positive(0.5);

    // Collisions are kept: a later impulse overwrites an earlier one
    for (size_t k = 0; k < num_impulses; ++k) {
        size_t idx = position(rng);
        out[idx] = positive(rng) ? magnitude : -magnitude;
    }
    return out;
}

Samples impulseNoise(SampleSpan t, size_t num_impulses, double magnitude) {
    auto rng = freshGenerator();
    return impulseNoise(t, num_impulses, magnitude, rng);
}

} // namespace chanqual
