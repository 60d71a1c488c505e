#include "chunkring/audio_capture.hpp"

#include <portaudio.h>

#include <stdexcept>

namespace chunkring {

std::atomic<int> PortAudioGuard::ref_count_{0};

PortAudioGuard::PortAudioGuard() {
    if (ref_count_.fetch_add(1, std::memory_order_acq_rel) == 0) {
        PaError err = Pa_Initialize();
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

namespace {

void check_pa(PaError err, const char* what) {
    if (err != paNoError) {
        throw std::runtime_error(std::string(what) + ": " + Pa_GetErrorText(err));
    }
}

}  // namespace

AudioCapture::AudioCapture(const CaptureConfig& config)
    : config_{config}, queue_{config.chunk_frames * config.channels, config.history_chunks} {
    PaDeviceIndex device = Pa_GetDefaultInputDevice();
    if (device == paNoDevice) {
        throw std::runtime_error("No default audio input device available");
    }

    const PaDeviceInfo* device_info = Pa_GetDeviceInfo(device);
    if (device_info == nullptr) {
        throw std::runtime_error("Failed to get input device info");
    }
    device_name_ = device_info->name;

    PaStreamParameters input_params{};
    input_params.device = device;
    input_params.channelCount = static_cast<int>(config_.channels);
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = device_info->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    check_pa(Pa_OpenStream(&stream_, &input_params,
                           nullptr,  // Input only
                           static_cast<double>(config_.sample_rate), config_.buffer_frames,
                           paClipOff, &AudioCapture::audio_callback, this),
             "Failed to open audio stream");
}

AudioCapture::~AudioCapture() {
    if (running_.exchange(false, std::memory_order_acq_rel)) {
        Pa_StopStream(stream_);
    }
    if (stream_ != nullptr) {
        Pa_CloseStream(stream_);
    }
}

void AudioCapture::start() {
    if (running_.load(std::memory_order_relaxed)) {
        return;
    }

    check_pa(Pa_StartStream(stream_), "Failed to start audio stream");
    running_.store(true, std::memory_order_release);
}

void AudioCapture::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    check_pa(Pa_StopStream(stream_), "Failed to stop audio stream");
}

CaptureStats AudioCapture::stats() const {
    return CaptureStats{.callback_count = callback_count_.load(std::memory_order_relaxed),
                        .input_overflows = input_overflows_.load(std::memory_order_relaxed),
                        .queue = queue_.stats()};
}

int AudioCapture::audio_callback(const void* input, void* /*output*/, unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo* /*time_info*/,
                                 PaStreamCallbackFlags status_flags, void* user_data) {
    auto* self = static_cast<AudioCapture*>(user_data);

    if ((status_flags & paInputOverflow) != 0) {
        self->input_overflows_.fetch_add(1, std::memory_order_relaxed);
    }
    self->callback_count_.fetch_add(1, std::memory_order_relaxed);

    // PortAudio passes a null buffer when input was lost entirely
    if (input != nullptr) {
        const auto* samples = static_cast<const float*>(input);
        // A refused block is counted by the queue
        static_cast<void>(self->queue_.push(
            std::span<const float>{samples, frame_count * self->config_.channels}));
    }

    return paContinue;
}

std::vector<std::string> AudioCapture::list_input_devices() {
    PortAudioGuard portaudio;
    std::vector<std::string> devices;

    int device_count = Pa_GetDeviceCount();
    if (device_count < 0) {
        throw std::runtime_error(std::string("Failed to enumerate audio devices: ") +
                                 Pa_GetErrorText(device_count));
    }

    for (int i = 0; i < device_count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info != nullptr && info->maxInputChannels > 0) {
            devices.emplace_back(info->name);
        }
    }

    return devices;
}

}  // namespace chunkring
