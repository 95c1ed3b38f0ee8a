#include "ringframe/spectrum_analyzer.hpp"

#include "ringframe/log.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ringframe {
namespace {

void check_config(const AnalyzerConfig& config) {
    if (config.num_bands == 0 || config.hop_size == 0) {
        throw std::invalid_argument("Analyzer needs at least one band and a non-zero hop");
    }
    if (!(config.min_frequency > 0.0f) || !(config.max_frequency > config.min_frequency)) {
        throw std::invalid_argument("Analyzer frequency range is empty");
    }
}

}  // namespace

SpectrumAnalyzer::SpectrumAnalyzer(AnalysisBuffer& source, float sample_rate,
                                   const FFTConfig& fft_config, const AnalyzerConfig& config)
    : source_{source}, sample_rate_{sample_rate}, fft_{fft_config}, config_{config} {
    check_config(config_);
    bins_.resize(fft_.bin_count());
    smoothed_.resize(config_.num_bands, 0.0f);
    peaks_.resize(config_.num_bands, 0.0f);
    map_bands();
}

void SpectrumAnalyzer::set_config(const AnalyzerConfig& config) {
    check_config(config);
    config_ = config;
    smoothed_.assign(config_.num_bands, 0.0f);
    peaks_.assign(config_.num_bands, 0.0f);
    map_bands();
}

void SpectrumAnalyzer::map_bands() {
    const auto bins = fft_.bin_count();
    if (config_.logarithmic_frequency) {
        band_bins_ = compute_log_bands(bins, config_.num_bands, config_.min_frequency,
                                       config_.max_frequency, sample_rate_, fft_.fft_size());
        return;
    }

    band_bins_.clear();
    const auto per_band = std::max<std::size_t>(1, bins / config_.num_bands);
    for (std::size_t i = 0; i < config_.num_bands; ++i) {
        const auto first = std::min(i * per_band, bins - 1);
        band_bins_.emplace_back(first, std::min(first + per_band, bins));
    }
}

float SpectrumAnalyzer::band_magnitude(std::size_t band) const {
    const auto [first, last] = band_bins_[band];
    if (first >= last) {
        return 0.0f;
    }

    float sum = 0.0f;
    for (std::size_t i = first; i < last; ++i) {
        sum += bins_[i];
    }
    return sum / static_cast<float>(last - first);
}

SpectrumData SpectrumAnalyzer::update() {
    auto window = source_.with_lock([this](RingBuffer<float>& buffer) {
        return buffer.read_last(fft_.fft_size(), config_.hop_size);
    });

    SpectrumData result;
    result.frames = window.frames;

    if (window.frames == 0) {
        result.magnitudes = smoothed_;
        result.peaks = peaks_;
        return result;
    }

    if (window.frames > 1) {
        RINGFRAME_LOG_DEBUG("analyzer", "skipped {} stale hops", window.frames - 1);
    }

    float sum_squares = 0.0f;
    float peak = 0.0f;
    for (const float sample : window.data.values()) {
        sum_squares += sample * sample;
        peak = std::max(peak, std::abs(sample));
    }
    result.rms_level = std::sqrt(sum_squares / static_cast<float>(window.data.size()));
    result.peak_level = peak;

    fft_.compute(window.data, bins_);

    const float alpha = 1.0f - config_.smoothing_factor;
    result.magnitudes.resize(config_.num_bands);
    result.peaks.resize(config_.num_bands);

    for (std::size_t i = 0; i < config_.num_bands; ++i) {
        smoothed_[i] = alpha * band_magnitude(i) + config_.smoothing_factor * smoothed_[i];
        peaks_[i] = smoothed_[i] > peaks_[i] ? smoothed_[i] : peaks_[i] * config_.peak_decay_rate;

        result.magnitudes[i] = smoothed_[i];
        result.peaks[i] = peaks_[i];
    }

    return result;
}

std::vector<std::pair<std::size_t, std::size_t>> compute_log_bands(std::size_t bin_count,
                                                                   std::size_t num_bands,
                                                                   float min_freq, float max_freq,
                                                                   float sample_rate,
                                                                   std::size_t fft_size) {
    std::vector<std::pair<std::size_t, std::size_t>> bands;
    bands.reserve(num_bands);

    const float ratio = std::pow(max_freq / min_freq, 1.0f / static_cast<float>(num_bands));
    const float bin_width = sample_rate / static_cast<float>(fft_size);

    auto bin_of = [&](float freq) {
        const auto bin = static_cast<std::size_t>(freq / bin_width);
        return std::min(bin, bin_count - 1);
    };

    float lower = min_freq;
    for (std::size_t i = 0; i < num_bands; ++i) {
        const float upper = lower * ratio;
        const auto first = bin_of(lower);
        const auto last = std::min(std::max(bin_of(upper), first + 1), bin_count);
        bands.emplace_back(first, last);
        lower = upper;
    }

    return bands;
}

}  // namespace ringframe
