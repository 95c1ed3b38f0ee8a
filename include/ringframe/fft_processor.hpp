#pragma once

#include "ringframe/sample_array.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace ringframe {

/// Analysis windows applied to each frame before the transform.
enum class WindowFunction {
    Rectangular,
    Hann,
    Hamming,
    Blackman,
    FlatTop
};

struct FFTConfig {
    std::size_t fft_size = 2048;              // Power of two
    WindowFunction window = WindowFunction::Hann;
    bool use_magnitude_db = true;             // Normalized dB output in [0, 1]
    float db_floor = -80.0f;
    float db_ceiling = 0.0f;
};

/// Magnitude spectrum of one analysis frame, backed by an FFTW real-to-complex
/// plan.
///
/// Frames come straight from buffer reads: a multi-channel frame is averaged
/// down to mono first. Short frames are zero-padded at the front, long ones
/// contribute only their newest fft_size rows.
///
/// Not thread-safe; one instance per consumer thread.
class FFTProcessor {
public:
    /// @throws std::invalid_argument if fft_size is not a power of two >= 2.
    /// @throws std::runtime_error if FFTW cannot allocate or plan.
    explicit FFTProcessor(const FFTConfig& config = {});
    ~FFTProcessor();

    FFTProcessor(const FFTProcessor&) = delete;
    FFTProcessor& operator=(const FFTProcessor&) = delete;
    FFTProcessor(FFTProcessor&& other) noexcept;
    FFTProcessor& operator=(FFTProcessor&& other) noexcept;

    /// Transforms a frame. `output` needs at least bin_count() entries.
    /// @return Number of magnitudes written (bin_count()).
    std::size_t compute(const SampleArray<float>& frame, std::span<float> output);

    /// Mono convenience overload.
    std::size_t compute(std::span<const float> samples, std::span<float> output);

    [[nodiscard]] std::size_t bin_count() const noexcept { return config_.fft_size / 2 + 1; }
    [[nodiscard]] std::size_t fft_size() const noexcept { return config_.fft_size; }

    [[nodiscard]] float bin_to_frequency(std::size_t bin, float sample_rate) const noexcept {
        return static_cast<float>(bin) * sample_rate / static_cast<float>(config_.fft_size);
    }

    /// Nearest bin, clamped to the last one.
    [[nodiscard]] std::size_t frequency_to_bin(float frequency, float sample_rate) const noexcept;

    [[nodiscard]] const FFTConfig& config() const noexcept { return config_; }

    /// Replans if the size changes and recomputes the window.
    void set_config(const FFTConfig& config);

private:
    struct Plan;

    void plan();
    void build_window();

    FFTConfig config_;
    std::unique_ptr<Plan> plan_;
    std::vector<float> window_;
};

}  // namespace ringframe
