#include "ringframe/audio_router.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ringframe {

AudioRouter::AudioRouter(AnalysisBuffer& analysis, std::size_t channels,
                         const std::optional<FramingConfig>& monitor)
    : analysis_{analysis}, channels_{channels} {
    if (channels_ == 0) {
        throw std::invalid_argument("Audio router needs at least one channel");
    }
    if (monitor) {
        if (monitor->channels != channels_) {
            throw std::invalid_argument("Monitor buffer channel count differs from the stream");
        }
        monitor_ = std::make_unique<FramingBuffer<float>>(*monitor);
    }
}

void AudioRouter::route(std::span<const float> input, std::span<float> output,
                        bool input_overflow) noexcept {
    if (input_overflow) {
        overruns_.fetch_add(1, std::memory_order_relaxed);
    }

    try {
        route_block(input, output);
    } catch (...) {
        // Called from a C audio callback: nothing may propagate
        callback_errors_.fetch_add(1, std::memory_order_relaxed);
        std::fill(output.begin(), output.end(), 0.0f);
    }

    callback_count_.fetch_add(1, std::memory_order_relaxed);
}

void AudioRouter::route_block(std::span<const float> input, std::span<float> output) {
    track_peak(input);

    const auto frames = input.size() / channels_;
    bool dropped = false;
    const bool locked = analysis_.try_with_lock([&](RingBuffer<float>& buffer) {
        dropped = frames > buffer.available_space();
        buffer.write(input, false);
    });
    if (!locked) {
        contended_blocks_.fetch_add(1, std::memory_order_relaxed);
        overruns_.fetch_add(1, std::memory_order_relaxed);
    } else if (dropped) {
        overruns_.fetch_add(1, std::memory_order_relaxed);
    }

    if (monitor_ && !output.empty()) {
        monitor_->write(input);
        if (monitor_->can_read() && monitor_->size() < output.size() / channels_) {
            underruns_.fetch_add(1, std::memory_order_relaxed);
        }
        monitor_->read_into(output);
        monitor_fill_.store(monitor_->size(), std::memory_order_relaxed);
    } else {
        std::fill(output.begin(), output.end(), 0.0f);
    }

    frames_captured_.fetch_add(frames, std::memory_order_relaxed);
}

void AudioRouter::track_peak(std::span<const float> input) noexcept {
    float peak = 0.0f;
    for (const float sample : input) {
        peak = std::max(peak, std::abs(sample));
    }

    float current = peak_amplitude_.load(std::memory_order_relaxed);
    while (peak > current &&
           !peak_amplitude_.compare_exchange_weak(current, peak, std::memory_order_relaxed)) {
    }
}

AudioStats AudioRouter::stats() const {
    return AudioStats{.frames_captured = frames_captured_.load(std::memory_order_relaxed),
                      .callback_count = callback_count_.load(std::memory_order_relaxed),
                      .overruns = overruns_.load(std::memory_order_relaxed),
                      .underruns = underruns_.load(std::memory_order_relaxed),
                      .contended_blocks = contended_blocks_.load(std::memory_order_relaxed),
                      .callback_errors = callback_errors_.load(std::memory_order_relaxed),
                      .analysis_fill = analysis_.size(),
                      .monitor_fill = monitor_fill_.load(std::memory_order_relaxed),
                      .peak_amplitude = peak_amplitude_.load(std::memory_order_relaxed)};
}

}  // namespace ringframe
