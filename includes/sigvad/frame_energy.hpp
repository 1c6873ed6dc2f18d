#pragma once
#include "sigvad/config.hpp"
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace sigvad {

// Read-only view over caller-owned mono samples.
struct Signal {
    const float* samples{nullptr};
    std::size_t size{0};
    int sample_rate{0};

    Signal() = default;
    Signal(const float* s, std::size_t n, int sr) : samples(s), size(n), sample_rate(sr) {}
    Signal(const std::vector<float>& s, int sr) : samples(s.data()), size(s.size()), sample_rate(sr) {}

    double duration() const {
        return sample_rate > 0 ? static_cast<double>(size) / sample_rate : 0.0;
    }
};

enum class SpectrogramScale {
    Linear,       // band magnitudes, summed as-is
    NormalizedDb  // dB normalized to [0, 1] (min level -100 dB, reference +20 dB)
};

// Read-only view over caller-owned rows (row-major, num_bands values each).
struct Spectrogram {
    const float* data{nullptr};
    std::size_t num_frames{0};
    std::size_t num_bands{0};
    int sample_rate{0};
    SpectrogramScale scale{SpectrogramScale::Linear};

    const float* row(std::size_t i) const { return data + i * num_bands; }
};

using Input = std::variant<Signal, Spectrogram>;

// Energy of one window: sum of squares over the first min(available, frame_length)
// samples, the rest counting as zero padding.
double window_energy(const float* samples, std::size_t available, std::size_t frame_length);

// Reduction of one spectrogram row.
double row_energy(const float* row, std::size_t num_bands, SpectrogramScale scale);

// Frames a signal of n samples yields under `config`.
std::size_t signal_frame_count(std::size_t n, const DetectorConfig& config);

std::vector<double> compute_energies(const Signal& signal, const DetectorConfig& config);
std::vector<double> compute_energies(const Spectrogram& spec, const DetectorConfig& config);
std::vector<double> compute_energies(const Input& input, const DetectorConfig& config);

// Input checks shared by the offline and streaming paths; throw InvalidInput.
void check_signal(const Signal& signal);
void check_spectrogram(const Spectrogram& spec);

// Incremental extractor for signal chunks. Keeps the samples that the next
// frame still needs, so energies equal compute_energies() on the
// concatenated input whatever the chunk boundaries.
class FrameEnergyStream {
public:
    explicit FrameEnergyStream(const DetectorConfig& config);

    // Energies of the frames completed by this chunk.
    std::vector<double> push(const float* samples, std::size_t n);

    // Zero-padded tail frames (empty when padding is disabled). Call once.
    std::vector<double> finish();

    void reset();

    std::int64_t samples_seen() const { return samples_seen_; }
    std::int64_t next_frame() const { return next_frame_; }

private:
    std::size_t frame_length_;
    std::size_t hop_length_;
    bool pad_;

    std::vector<float> pending_;     // samples from pending_start_ on
    std::int64_t pending_start_ = 0; // absolute index of pending_[0]
    std::int64_t samples_seen_ = 0;
    std::int64_t next_frame_ = 0;

    void drop_consumed();
};

} // namespace sigvad
