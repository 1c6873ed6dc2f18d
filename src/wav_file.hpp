#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct WavAudio {
    std::vector<float> samples;   // mono, [-1, 1]
    int sample_rate = 0;
    int channels = 0;             // channels in the file before downmix
    int bits_per_sample = 0;
};

// Reads a RIFF/WAVE file: PCM 16/24/32-bit or IEEE float 32-bit, any channel
// count (averaged to mono). Walks the chunk list, so LIST/fact chunks before
// 'data' are fine. Throws std::runtime_error on anything else.
WavAudio read_wav_file(const std::string& path);

// Writes mono float samples as 16-bit PCM.
void write_wav_file(const std::string& path, const std::vector<float>& samples, int sample_rate);
