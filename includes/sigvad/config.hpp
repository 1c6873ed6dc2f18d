#pragma once
#include <optional>

namespace sigvad {

// Detector configuration. Passed by value to both segmenters and never
// mutated by them.
//
// Lengths are in samples, run lengths in frames. For spectrogram input
// frame_length is informational and hop_length only drives time conversion.
struct DetectorConfig {
    double top_db{25.0};                  // dB drop below reference still counted as speech
    int frame_length{1024};
    int hop_length{256};
    int min_speech_frames{1};             // speech run needed to open a segment
    int min_silence_frames{1};            // silence run needed to close it
    std::optional<double> reference_level; // fixed reference (energy domain), else peak
    bool pad_final_frame{true};           // zero-pad the tail instead of dropping it

    // Throws DetectorError(InvalidConfiguration) on the first violation.
    void validate() const;
};

// Number of frames covering `seconds` at the given hop (rounded up, >= 1).
int frames_for_duration(double seconds, int hop_length, int sample_rate);

} // namespace sigvad
