#include "chanqual/dsp.hpp"
#include <cstring>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>

#include <fftw3.h>

namespace chanqual {

namespace {

// FFTW planner calls are not thread-safe; fftw_execute on distinct plans is
std::mutex& plannerMutex() {
    static std::mutex m;
    return m;
}

} // namespace

struct FFT::Impl {
    size_t size;

    fftw_plan forward_plan = nullptr;
    fftw_plan forward_real_plan = nullptr;
    fftw_complex* buffer = nullptr;
    double* real_buffer = nullptr;

    ~Impl() {
        std::lock_guard<std::mutex> lock(plannerMutex());
        if (forward_plan) fftw_destroy_plan(forward_plan);
        if (forward_real_plan) fftw_destroy_plan(forward_real_plan);
        if (buffer) fftw_free(buffer);
        if (real_buffer) fftw_free(real_buffer);
    }
};

FFT::FFT(size_t size) : size_(size), impl_(std::make_unique<Impl>()) {
    if (size == 0) {
        throw std::invalid_argument("FFT size must be positive");
    }

    impl_->size = size;

    std::lock_guard<std::mutex> lock(plannerMutex());

    impl_->buffer = fftw_alloc_complex(size);
    impl_->real_buffer = fftw_alloc_real(size);
    if (!impl_->buffer || !impl_->real_buffer) {
        throw std::bad_alloc();
    }

    // One-shot analyses: ESTIMATE plans in microseconds, MEASURE would
    // cost more than the transform itself
    impl_->forward_plan = fftw_plan_dft_1d(
        static_cast<int>(size),
        impl_->buffer, impl_->buffer,
        FFTW_FORWARD, FFTW_ESTIMATE
    );

    impl_->forward_real_plan = fftw_plan_dft_r2c_1d(
        static_cast<int>(size),
        impl_->real_buffer,
        impl_->buffer,
        FFTW_ESTIMATE
    );

    if (!impl_->forward_plan || !impl_->forward_real_plan) {
        throw std::runtime_error("FFTW failed to create plan for size " + std::to_string(size));
    }
}

FFT::~FFT() = default;

void FFT::forward(const Complex* in, Complex* out) {
    // std::complex<double> is layout-compatible with fftw_complex
    std::memcpy(impl_->buffer, in, size_ * sizeof(fftw_complex));
    fftw_execute(impl_->forward_plan);
    std::memcpy(out, impl_->buffer, size_ * sizeof(fftw_complex));
}

void FFT::forward(const std::vector<Complex>& in, std::vector<Complex>& out) {
    if (in.size() != size_) {
        throw std::invalid_argument("FFT input has " + std::to_string(in.size()) +
                                    " samples, plan expects " + std::to_string(size_));
    }
    out.resize(size_);
    forward(in.data(), out.data());
}

void FFT::forwardReal(const Sample* in, Complex* out) {
    std::memcpy(impl_->real_buffer, in, size_ * sizeof(double));
    fftw_execute(impl_->forward_real_plan);
    for (size_t i = 0; i <= size_ / 2; ++i) {
        out[i] = Complex(impl_->buffer[i][0], impl_->buffer[i][1]);
    }
}

std::vector<Complex> FFT::forwardReal(SampleSpan in) {
    if (in.size() != size_) {
        throw std::invalid_argument("FFT input has " + std::to_string(in.size()) +
                                    " samples, plan expects " + std::to_string(size_));
    }
    std::vector<Complex> out(size_ / 2 + 1);
    forwardReal(in.data(), out.data());
    return out;
}

} // namespace chanqual
