#pragma once

#include "ringframe/framing_buffer.hpp"
#include "ringframe/sample_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace ringframe {

struct AudioStats {
    std::uint64_t frames_captured = 0;
    std::uint64_t callback_count = 0;
    std::uint64_t overruns = 0;           // Analysis rows dropped or device input overflow
    std::uint64_t underruns = 0;          // Monitor blocks that played silence
    std::uint64_t contended_blocks = 0;   // Blocks skipped because the analyzer held the lock
    std::uint64_t callback_errors = 0;    // Blocks abandoned after an exception
    std::size_t analysis_fill = 0;        // Rows waiting in the analysis buffer
    std::size_t monitor_fill = 0;         // Rows waiting in the monitor buffer
    float peak_amplitude = 0.0f;
};

/// Routes each captured block of interleaved frames into the analysis ring
/// buffer and, when monitoring, through a FramingBuffer to the output.
///
/// route() is the body of an audio callback and never blocks: the analysis
/// lock is only tried, and a block that finds it held is skipped and
/// counted. route() never throws either; a block that fails is counted and
/// its output is silenced.
///
/// The monitor buffer is owned here and touched only by the thread calling
/// route().
class AudioRouter {
public:
    /// @throws std::invalid_argument if channels is zero, or the monitor
    ///         configuration is invalid or has a different channel count.
    AudioRouter(AnalysisBuffer& analysis, std::size_t channels,
                const std::optional<FramingConfig>& monitor = std::nullopt);

    AudioRouter(const AudioRouter&) = delete;
    AudioRouter& operator=(const AudioRouter&) = delete;

    /// Handles one block. `input` or `output` may be empty when the device
    /// has no such direction. `input_overflow` reports samples the device
    /// dropped before this block.
    void route(std::span<const float> input, std::span<float> output,
               bool input_overflow) noexcept;

    /// Counters so far. Locks the analysis buffer for its fill level, so
    /// call it from the consumer side, not from the callback.
    [[nodiscard]] AudioStats stats() const;

    [[nodiscard]] std::size_t channels() const noexcept { return channels_; }
    [[nodiscard]] bool monitoring() const noexcept { return monitor_ != nullptr; }

private:
    void route_block(std::span<const float> input, std::span<float> output);
    void track_peak(std::span<const float> input) noexcept;

    AnalysisBuffer& analysis_;
    std::size_t channels_;
    std::unique_ptr<FramingBuffer<float>> monitor_;

    std::atomic<std::uint64_t> frames_captured_{0};
    std::atomic<std::uint64_t> callback_count_{0};
    std::atomic<std::uint64_t> overruns_{0};
    std::atomic<std::uint64_t> underruns_{0};
    std::atomic<std::uint64_t> contended_blocks_{0};
    std::atomic<std::uint64_t> callback_errors_{0};
    std::atomic<std::size_t> monitor_fill_{0};
    std::atomic<float> peak_amplitude_{0.0f};
};

}  // namespace ringframe
