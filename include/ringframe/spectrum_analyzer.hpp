#pragma once

#include "ringframe/fft_processor.hpp"
#include "ringframe/sample_buffer.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace ringframe {

struct AnalyzerConfig {
    std::size_t num_bands = 64;
    std::size_t hop_size = 512;           // Rows between consecutive frames
    float min_frequency = 20.0f;
    float max_frequency = 20000.0f;
    float smoothing_factor = 0.7f;        // 0 = none, towards 1 = slow
    float peak_decay_rate = 0.95f;        // Per update
    bool logarithmic_frequency = true;
};

struct SpectrumData {
    std::vector<float> magnitudes;        // Per band, 0.0 to 1.0
    std::vector<float> peaks;             // Peak hold per band
    float rms_level = 0.0f;
    float peak_level = 0.0f;
    std::size_t frames = 0;               // Hops consumed by this update (0 = no new frame)
};

/// Turns overlapping frames from an analysis ring buffer into display bands.
///
/// Each update() takes the newest hop-aligned frame with
/// RingBuffer::read_last(fft_size, hop_size), so a slow display skips stale
/// hops instead of falling behind. Frames overlap by fft_size - hop_size rows.
class SpectrumAnalyzer {
public:
    /// @throws std::invalid_argument if hop_size or num_bands is zero, or
    ///         the frequency range is empty.
    SpectrumAnalyzer(AnalysisBuffer& source, float sample_rate, const FFTConfig& fft_config = {},
                     const AnalyzerConfig& config = {});

    /// Analyzes the newest frame if one is buffered. Without one the previous
    /// smoothed state is returned with frames == 0.
    [[nodiscard]] SpectrumData update();

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }
    void set_config(const AnalyzerConfig& config);

    [[nodiscard]] float sample_rate() const noexcept { return sample_rate_; }
    [[nodiscard]] const FFTProcessor& fft() const noexcept { return fft_; }

private:
    void map_bands();
    [[nodiscard]] float band_magnitude(std::size_t band) const;

    AnalysisBuffer& source_;
    float sample_rate_;
    FFTProcessor fft_;
    AnalyzerConfig config_;

    std::vector<float> bins_;
    std::vector<float> smoothed_;
    std::vector<float> peaks_;
    std::vector<std::pair<std::size_t, std::size_t>> band_bins_;
};

/// Splits FFT bins into `num_bands` logarithmically spaced [first, last)
/// ranges between `min_freq` and `max_freq`. Every band gets at least one bin.
std::vector<std::pair<std::size_t, std::size_t>> compute_log_bands(
    std::size_t bin_count,
    std::size_t num_bands,
    float min_freq,
    float max_freq,
    float sample_rate,
    std::size_t fft_size
);

}  // namespace ringframe
