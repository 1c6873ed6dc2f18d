#pragma once
#include "sigvad/frame_energy.hpp"
#include <string>
#include <vector>

// Owning counterpart of sigvad::Spectrogram, loaded from JSON:
//
//   {
//     "sample_rate": 16000,
//     "hop_length": 256,                  // optional
//     "scale": "linear" | "normalized_db", // optional, default linear
//     "frames": [[...], [...], ...]        // equal-length rows
//   }
struct SpectrogramFile {
    std::vector<float> data;
    std::size_t num_frames = 0;
    std::size_t num_bands = 0;
    int sample_rate = 0;
    int hop_length = 0;          // 0 when the file does not say
    sigvad::SpectrogramScale scale = sigvad::SpectrogramScale::Linear;

    sigvad::Spectrogram view() const {
        sigvad::Spectrogram s;
        s.data = data.data();
        s.num_frames = num_frames;
        s.num_bands = num_bands;
        s.sample_rate = sample_rate;
        s.scale = scale;
        return s;
    }
};

SpectrogramFile parse_spectrogram_json(const std::string& text);
SpectrogramFile load_spectrogram_file(const std::string& path);
