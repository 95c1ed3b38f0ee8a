#include "ringframe/fft_processor.hpp"

#include <fftw3.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

namespace ringframe {

/// FFTW plan and its aligned buffers.
struct FFTProcessor::Plan {
    fftwf_plan handle = nullptr;
    float* input = nullptr;
    fftwf_complex* output = nullptr;

    Plan() = default;
    Plan(const Plan&) = delete;
    Plan& operator=(const Plan&) = delete;

    ~Plan() {
        if (handle != nullptr) {
            fftwf_destroy_plan(handle);
        }
        fftwf_free(input);
        fftwf_free(output);
    }
};

namespace {

void check_size(std::size_t fft_size) {
    if (fft_size < 2 || (fft_size & (fft_size - 1)) != 0) {
        throw std::invalid_argument("FFT size must be a power of two, got " +
                                    std::to_string(fft_size));
    }
}

}  // namespace

FFTProcessor::FFTProcessor(const FFTConfig& config) : config_{config} {
    check_size(config_.fft_size);
    plan();
    build_window();
}

FFTProcessor::~FFTProcessor() = default;

FFTProcessor::FFTProcessor(FFTProcessor&& other) noexcept = default;
FFTProcessor& FFTProcessor::operator=(FFTProcessor&& other) noexcept = default;

void FFTProcessor::plan() {
    const auto n = config_.fft_size;
    auto next = std::make_unique<Plan>();

    next->input = fftwf_alloc_real(n);
    next->output = fftwf_alloc_complex(n / 2 + 1);
    if (next->input == nullptr || next->output == nullptr) {
        throw std::runtime_error("Failed to allocate FFTW buffers");
    }

    next->handle = fftwf_plan_dft_r2c_1d(static_cast<int>(n), next->input, next->output,
                                         FFTW_ESTIMATE);
    if (next->handle == nullptr) {
        throw std::runtime_error("Failed to create FFTW plan");
    }

    plan_ = std::move(next);
}

void FFTProcessor::build_window() {
    const auto n = config_.fft_size;
    constexpr auto two_pi = 2.0f * std::numbers::pi_v<float>;

    window_.assign(n, 1.0f);
    for (std::size_t i = 0; i < n; ++i) {
        const auto phase = two_pi * static_cast<float>(i) / static_cast<float>(n - 1);
        switch (config_.window) {
            case WindowFunction::Rectangular:
                break;
            case WindowFunction::Hann:
                window_[i] = 0.5f - 0.5f * std::cos(phase);
                break;
            case WindowFunction::Hamming:
                window_[i] = 0.54f - 0.46f * std::cos(phase);
                break;
            case WindowFunction::Blackman:
                window_[i] = 0.42f - 0.5f * std::cos(phase) + 0.08f * std::cos(2.0f * phase);
                break;
            case WindowFunction::FlatTop:
                window_[i] = 0.21557895f - 0.41663158f * std::cos(phase) +
                             0.277263158f * std::cos(2.0f * phase) -
                             0.083578947f * std::cos(3.0f * phase) +
                             0.006947368f * std::cos(4.0f * phase);
                break;
        }
    }
}

std::size_t FFTProcessor::compute(const SampleArray<float>& frame, std::span<float> output) {
    if (!plan_) {
        throw std::logic_error("FFTProcessor used after being moved from");
    }
    if (output.size() < bin_count()) {
        throw std::invalid_argument("Spectrum output is smaller than bin_count()");
    }

    const auto n = config_.fft_size;
    const auto rows = std::min(frame.rows(), n);
    const auto first_row = frame.rows() - rows;
    const auto first_input = n - rows;
    const auto scale = 1.0f / static_cast<float>(frame.columns());

    std::fill_n(plan_->input, first_input, 0.0f);
    for (std::size_t r = 0; r < rows; ++r) {
        float mono = 0.0f;
        for (const float sample : frame.row(first_row + r)) {
            mono += sample;
        }
        plan_->input[first_input + r] = mono * scale * window_[first_input + r];
    }

    fftwf_execute(plan_->handle);

    const auto bins = bin_count();
    const auto norm = 2.0f / static_cast<float>(n);
    const auto db_range = config_.db_ceiling - config_.db_floor;

    for (std::size_t i = 0; i < bins; ++i) {
        const float re = plan_->output[i][0];
        const float im = plan_->output[i][1];
        float magnitude = std::hypot(re, im) * norm;
        if (i == 0 || i == bins - 1) {
            magnitude *= 0.5f;  // DC and Nyquist have no mirrored half
        }

        if (config_.use_magnitude_db) {
            const float db = std::clamp(20.0f * std::log10(magnitude + 1e-10f), config_.db_floor,
                                        config_.db_ceiling);
            output[i] = (db - config_.db_floor) / db_range;
        } else {
            output[i] = magnitude;
        }
    }

    return bins;
}

std::size_t FFTProcessor::compute(std::span<const float> samples, std::span<float> output) {
    return compute(SampleArray<float>(samples, 1), output);
}

std::size_t FFTProcessor::frequency_to_bin(float frequency, float sample_rate) const noexcept {
    const auto bin = static_cast<std::size_t>(
        std::lround(frequency * static_cast<float>(config_.fft_size) / sample_rate));
    return std::min(bin, bin_count() - 1);
}

void FFTProcessor::set_config(const FFTConfig& config) {
    check_size(config.fft_size);
    const bool replan = config.fft_size != config_.fft_size;
    config_ = config;

    if (replan) {
        plan();
    }
    build_window();
}

}  // namespace ringframe
