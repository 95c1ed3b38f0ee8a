#include "ringframe/audio_stream.hpp"

#include "ringframe/log.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>

namespace ringframe {

std::atomic<int> PortAudioGuard::ref_count_{0};

PortAudioGuard::PortAudioGuard() {
    if (ref_count_.fetch_add(1, std::memory_order_acq_rel) == 0) {
        const PaError err = Pa_Initialize();
        if (err != paNoError) {
            ref_count_.fetch_sub(1, std::memory_order_acq_rel);
            throw std::runtime_error(std::string("Failed to initialize PortAudio: ") +
                                     Pa_GetErrorText(err));
        }
    }
}

PortAudioGuard::~PortAudioGuard() {
    if (ref_count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        Pa_Terminate();
    }
}

AudioStream::AudioStream(const AudioConfig& config) : config_{config} {
    if (config_.channels == 0 || config_.sample_rate == 0) {
        throw std::invalid_argument("Audio stream needs a sample rate and at least one channel");
    }

    const auto analysis_rows = static_cast<std::size_t>(
        std::ceil(config_.analysis_seconds * static_cast<float>(config_.sample_rate)));
    analysis_ = std::make_unique<AnalysisBuffer>(analysis_rows, config_.channels);

    const PaDeviceIndex input_device = Pa_GetDefaultInputDevice();
    if (input_device == paNoDevice) {
        throw std::runtime_error("No default audio input device available");
    }
    const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_device);
    if (input_info == nullptr) {
        throw std::runtime_error("Failed to get input device info");
    }
    device_name_ = input_info->name;

    PaStreamParameters input_params{};
    input_params.device = input_device;
    input_params.channelCount = static_cast<int>(config_.channels);
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = input_info->defaultLowInputLatency;

    PaStreamParameters output_params{};
    PaStreamParameters* output = nullptr;
    if (config_.monitor_output) {
        const PaDeviceIndex output_device = Pa_GetDefaultOutputDevice();
        const PaDeviceInfo* output_info =
            output_device == paNoDevice ? nullptr : Pa_GetDeviceInfo(output_device);
        if (output_info == nullptr) {
            RINGFRAME_LOG_WARN("audio", "no output device, monitoring disabled");
        } else {
            output_params.device = output_device;
            output_params.channelCount = static_cast<int>(config_.channels);
            output_params.sampleFormat = paFloat32;
            output_params.suggestedLatency = output_info->defaultLowOutputLatency;
            output = &output_params;
        }
    }

    std::optional<FramingConfig> monitor;
    if (output != nullptr) {
        monitor = FramingConfig{.sample_rate = static_cast<double>(config_.sample_rate),
                                .seconds = config_.monitor_seconds,
                                .buffer_delay = config_.monitor_delay,
                                .channels = config_.channels};
    }
    router_ = std::make_unique<AudioRouter>(*analysis_, config_.channels, monitor);

    const PaError err = Pa_OpenStream(&stream_, &input_params, output,
                                      static_cast<double>(config_.sample_rate),
                                      config_.buffer_frames, paClipOff, &AudioStream::callback,
                                      this);
    if (err != paNoError) {
        throw std::runtime_error(std::string("Failed to open audio stream: ") +
                                 Pa_GetErrorText(err));
    }

    RINGFRAME_LOG_INFO("audio", "opened '{}' at {} Hz, {} channel(s), monitor {}", device_name_,
                       config_.sample_rate, config_.channels, router_->monitoring() ? "on" : "off");
}

AudioStream::~AudioStream() {
    stop();
    if (stream_ != nullptr) {
        Pa_CloseStream(stream_);
    }
}

void AudioStream::start() {
    if (running_.load(std::memory_order_relaxed)) {
        return;
    }

    const PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        throw std::runtime_error(std::string("Failed to start audio stream: ") +
                                 Pa_GetErrorText(err));
    }
    running_.store(true, std::memory_order_release);
}

void AudioStream::stop() {
    if (!running_.load(std::memory_order_relaxed)) {
        return;
    }

    running_.store(false, std::memory_order_release);
    const PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        RINGFRAME_LOG_ERROR("audio", "failed to stop stream: {}", Pa_GetErrorText(err));
    }
}

int AudioStream::callback(const void* input, void* output, unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* /*time_info*/,
                          PaStreamCallbackFlags status_flags, void* user_data) {
    auto* self = static_cast<AudioStream*>(user_data);
    const auto samples = frame_count * self->config_.channels;

    std::span<const float> in;
    if (input != nullptr) {
        in = {static_cast<const float*>(input), samples};
    }
    std::span<float> out;
    if (output != nullptr) {
        out = {static_cast<float*>(output), samples};
    }

    self->router_->route(in, out, (status_flags & paInputOverflow) != 0);
    return paContinue;
}

std::vector<std::string> AudioStream::list_input_devices() {
    PortAudioGuard guard;
    std::vector<std::string> devices;

    const int device_count = Pa_GetDeviceCount();
    if (device_count < 0) {
        throw std::runtime_error("Failed to enumerate audio devices");
    }

    for (int i = 0; i < device_count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info != nullptr && info->maxInputChannels > 0) {
            devices.emplace_back(info->name);
        }
    }

    return devices;
}

}  // namespace ringframe
