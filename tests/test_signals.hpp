#pragma once
#include "sigvad/segment.hpp"

#include <cmath>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

// Synthetic inputs shared by the segmenter tests.
namespace test_signals {

constexpr int kSampleRate = 16000;
constexpr double kPi = 3.14159265358979323846;

inline void add_tone(std::vector<float>& x, std::size_t begin, std::size_t end,
                     float amplitude, double hz = 440.0) {
    for (std::size_t i = begin; i < end && i < x.size(); ++i) {
        x[i] = static_cast<float>(amplitude * std::sin(2.0 * kPi * hz * (i - begin) / kSampleRate));
    }
}

// One second: silence, tone over [8000, 12000), silence.
inline std::vector<float> tone_burst() {
    std::vector<float> x(kSampleRate, 0.0f);
    add_tone(x, 8000, 12000, 0.5f);
    return x;
}

// One block of `block` samples per character: 'X' loud constant, 'q' quiet
// constant, anything else zero.
inline std::vector<float> pattern(const std::string& p, std::size_t block) {
    std::vector<float> x;
    x.reserve(p.size() * block);
    for (char c : p) {
        const float v = c == 'X' ? 1.0f : (c == 'q' ? 0.01f : 0.0f);
        x.insert(x.end(), block, v);
    }
    return x;
}

// Random mix of tone and low noise blocks, reproducible per seed.
inline std::vector<float> random_bursts(unsigned seed, std::size_t blocks, std::size_t block) {
    std::mt19937 rng(seed);
    std::bernoulli_distribution loud(0.45);
    std::uniform_real_distribution<float> noise(-0.001f, 0.001f);
    std::vector<float> x(blocks * block);
    for (std::size_t b = 0; b < blocks; ++b) {
        if (loud(rng)) {
            add_tone(x, b * block, (b + 1) * block, 0.5f, 300.0 + 50.0 * (b % 5));
        } else {
            for (std::size_t i = b * block; i < (b + 1) * block; ++i) x[i] = noise(rng);
        }
    }
    return x;
}

// Spectrogram rows for frame 400 / hop 160: four bands, each the energy of
// one quarter of the window, so a row sums to the frame energy.
inline std::vector<float> band_rows(const std::vector<float>& x, std::size_t frames) {
    std::vector<float> rows;
    for (std::size_t i = 0; i < frames; ++i) {
        for (std::size_t b = 0; b < 4; ++b) {
            double acc = 0.0;
            for (std::size_t k = 0; k < 100; ++k) {
                const std::size_t idx = i * 160 + b * 100 + k;
                if (idx < x.size()) acc += static_cast<double>(x[idx]) * x[idx];
            }
            rows.push_back(static_cast<float>(acc));
        }
    }
    return rows;
}

inline bool well_formed(const std::vector<sigvad::Segment>& segments) {
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& s = segments[i];
        if (s.start_frame >= s.end_frame || s.start_time >= s.end_time) return false;
        if (i > 0 && segments[i - 1].end_frame >= s.start_frame) return false;
        if (i > 0 && segments[i - 1].end_time > s.start_time) return false;
    }
    return true;
}

inline void dump(const char* label, const std::vector<sigvad::Segment>& segments) {
    std::fprintf(stderr, "  %s:", label);
    for (const auto& s : segments) {
        std::fprintf(stderr, " [%lld,%lld)", static_cast<long long>(s.start_frame),
                     static_cast<long long>(s.end_frame));
    }
    std::fprintf(stderr, "\n");
}

}
