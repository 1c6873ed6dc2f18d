#include "audio_input.hpp"
#include <sstream>
#include <stdexcept>

namespace {

void check(PaError err, const std::string& what) {
    if (err != paNoError) {
        throw std::runtime_error(what + ": " + Pa_GetErrorText(err));
    }
}

// Scoped Pa_Initialize/Pa_Terminate for one-off device queries.
struct PaSession {
    PaSession() { check(Pa_Initialize(), "PortAudio init failed"); }
    ~PaSession() { Pa_Terminate(); }
    PaSession(const PaSession&) = delete;
    PaSession& operator=(const PaSession&) = delete;
};

InputDevice describe(int index, const PaDeviceInfo& info) {
    InputDevice d;
    d.index = index;
    d.name = info.name ? info.name : "?";
    const PaHostApiInfo* api = Pa_GetHostApiInfo(info.hostApi);
    d.host_api = api ? api->name : "?";
    d.max_input_channels = info.maxInputChannels;
    d.default_sample_rate = info.defaultSampleRate;
    return d;
}

} // namespace

std::string format_device(const InputDevice& d) {
    std::ostringstream oss;
    oss << "[" << d.index << "] " << d.name << " (" << d.host_api << "), "
        << d.max_input_channels << " in, " << d.default_sample_rate << " Hz";
    return oss.str();
}

AudioInput::AudioInput() {
    check(Pa_Initialize(), "PortAudio init failed");
}

AudioInput::~AudioInput() {
    if (stream_) {
        Pa_AbortStream(stream_);
        Pa_CloseStream(stream_);
    }
    Pa_Terminate();
}

std::vector<InputDevice> AudioInput::list_input_devices() {
    PaSession session;
    const int count = Pa_GetDeviceCount();
    if (count < 0) check(count, "Cannot enumerate devices");

    std::vector<InputDevice> out;
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) out.push_back(describe(i, *info));
    }
    return out;
}

int AudioInput::resolve_device(const std::optional<int>& requested) const {
    const int device = requested ? *requested : Pa_GetDefaultInputDevice();
    if (device == paNoDevice) {
        throw std::runtime_error("No default input device available");
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info) {
        throw std::runtime_error("No input device with index " + std::to_string(device));
    }
    if (info->maxInputChannels < 1) {
        throw std::runtime_error("Device " + std::to_string(device) + " has no input channels");
    }
    return device;
}

InputDevice AudioInput::device_info(int device_index) const {
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device_index);
    if (!info) {
        throw std::runtime_error("No input device with index " + std::to_string(device_index));
    }
    return describe(device_index, *info);
}

void AudioInput::open(const AudioParams& params, Callback cb) {
    if (stream_) {
        throw std::runtime_error("Capture stream already open");
    }
    const int device = resolve_device(params.device_index);

    // The detector takes mono float in [-1, 1].
    PaStreamParameters in{};
    in.device = device;
    in.channelCount = 1;
    in.sampleFormat = paFloat32;
    in.suggestedLatency = Pa_GetDeviceInfo(device)->defaultLowInputLatency;

    const PaError supported = Pa_IsFormatSupported(&in, nullptr, params.sample_rate);
    if (supported != paFormatIsSupported) {
        check(supported, "Device " + std::to_string(device) + " cannot capture mono float at " +
                             std::to_string(params.sample_rate) + " Hz");
    }

    callback_ = std::move(cb);
    PaStream* stream = nullptr;
    check(Pa_OpenStream(&stream, &in, nullptr, params.sample_rate, params.frames_per_buffer,
                        paClipOff, &AudioInput::pa_callback, this),
          "Pa_OpenStream failed");
    stream_ = stream;
}

void AudioInput::start() {
    if (!stream_) throw std::runtime_error("Capture stream not open");
    check(Pa_StartStream(stream_), "Pa_StartStream failed");
}

void AudioInput::stop() {
    if (!stream_) return;
    // Returns once the last callback has finished, so no push races the caller after this.
    check(Pa_StopStream(stream_), "Pa_StopStream failed");
}

int AudioInput::pa_callback(const void* input,
                            void* /*output*/,
                            unsigned long frame_count,
                            const PaStreamCallbackTimeInfo* /*time_info*/,
                            PaStreamCallbackFlags status_flags,
                            void* user_data) {
    auto* self = static_cast<AudioInput*>(user_data);
    if (status_flags & paInputOverflow) self->overflows_.fetch_add(1, std::memory_order_relaxed);
    if (input && self->callback_) {
        self->callback_(static_cast<const float*>(input), static_cast<std::size_t>(frame_count));
    }
    return paContinue;
}
