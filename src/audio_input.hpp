#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <portaudio.h>
#include <string>
#include <vector>

struct AudioParams {
    int sample_rate = 16000;
    unsigned long frames_per_buffer = 512; // 32 ms @ 16k
    std::optional<int> device_index;       // default input when unset
};

struct InputDevice {
    int index = -1;
    std::string name;
    std::string host_api;
    int max_input_channels = 0;
    double default_sample_rate = 0.0;
};

std::string format_device(const InputDevice& d);

// Mono float capture from a PortAudio input device. PortAudio stays
// initialized for the lifetime of the object.
class AudioInput {
public:
    // Runs on the PortAudio thread with the samples of one buffer.
    using Callback = std::function<void(const float* data, std::size_t frames)>;

    AudioInput();
    ~AudioInput();
    AudioInput(const AudioInput&) = delete;
    AudioInput& operator=(const AudioInput&) = delete;

    // Usable without an AudioInput instance.
    static std::vector<InputDevice> list_input_devices();

    // Requested index, or the default input; throws if it cannot record.
    int resolve_device(const std::optional<int>& requested) const;
    InputDevice device_info(int device_index) const;

    void open(const AudioParams& params, Callback cb);
    void start();
    void stop();

    // Buffers PortAudio flagged as overflowed. Samples were lost, so stream
    // times after the first one run early.
    std::uint64_t overflow_count() const { return overflows_.load(); }

private:
    static int pa_callback(const void* input,
                           void* output,
                           unsigned long frame_count,
                           const PaStreamCallbackTimeInfo* time_info,
                           PaStreamCallbackFlags status_flags,
                           void* user_data);

    PaStream* stream_ = nullptr;
    Callback callback_;
    std::atomic<std::uint64_t> overflows_{0};
};
