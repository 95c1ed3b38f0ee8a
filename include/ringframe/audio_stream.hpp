#pragma once

#include "ringframe/audio_router.hpp"
#include "ringframe/sample_buffer.hpp"

#include <portaudio.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace ringframe {

struct AudioConfig {
    std::uint32_t sample_rate = 48000;
    std::uint32_t buffer_frames = 256;    // Frames per callback
    std::uint32_t channels = 1;
    float analysis_seconds = 0.5f;        // Analysis ring buffer length
    bool monitor_output = true;           // Play input back through a FramingBuffer
    float monitor_seconds = 1.0f;
    float monitor_delay = 0.1f;           // Playback latency in seconds
};

/// RAII reference on PortAudio initialization.
class PortAudioGuard {
public:
    /// @throws std::runtime_error if Pa_Initialize fails.
    PortAudioGuard();
    ~PortAudioGuard();

    PortAudioGuard(const PortAudioGuard&) = delete;
    PortAudioGuard& operator=(const PortAudioGuard&) = delete;

private:
    static std::atomic<int> ref_count_;
};

/// PortAudio stream feeding the ring buffers.
///
/// The callback hands every block to an AudioRouter: captured frames go
/// into the shared analysis RingBuffer (non-strict, so the oldest rows go
/// when the analyzer falls behind) and, when monitoring, through a
/// FramingBuffer back to the output with `monitor_delay` of latency.
class AudioStream {
public:
    /// Opens the default input (and output, when monitoring) device.
    /// @throws std::runtime_error on PortAudio failure.
    /// @throws std::invalid_argument on an unusable configuration.
    explicit AudioStream(const AudioConfig& config = {});
    ~AudioStream();

    AudioStream(const AudioStream&) = delete;
    AudioStream& operator=(const AudioStream&) = delete;
    AudioStream(AudioStream&&) = delete;
    AudioStream& operator=(AudioStream&&) = delete;

    /// Idempotent.
    void start();

    /// Idempotent.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(std::memory_order_relaxed); }
    [[nodiscard]] const AudioConfig& config() const noexcept { return config_; }
    [[nodiscard]] AudioStats stats() const { return router_->stats(); }
    [[nodiscard]] const std::string& device_name() const noexcept { return device_name_; }

    /// Shared buffer the analyzer reads from.
    [[nodiscard]] AnalysisBuffer& analysis() noexcept { return *analysis_; }

    [[nodiscard]] static std::vector<std::string> list_input_devices();

private:
    static int callback(const void* input, void* output, unsigned long frame_count,
                        const PaStreamCallbackTimeInfo* time_info,
                        PaStreamCallbackFlags status_flags, void* user_data);

    PortAudioGuard guard_;
    AudioConfig config_;
    std::string device_name_;
    std::unique_ptr<AnalysisBuffer> analysis_;
    std::unique_ptr<AudioRouter> router_;

    PaStream* stream_ = nullptr;
    std::atomic<bool> running_{false};
};

}  // namespace ringframe
