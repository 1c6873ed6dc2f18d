#include "sigvad/frame_energy.hpp"
#include "sigvad/errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace sigvad {

namespace {

// Normalization used by mel front ends that store dB scaled into [0, 1].
constexpr double kMinLevelDb = -100.0;
constexpr double kRefLevelDb = 20.0;

void invalid(const std::string& msg) {
    throw DetectorError(ErrorKind::InvalidInput, msg);
}

void check_finite(const float* x, std::size_t n, const char* what) {
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i])) {
            invalid(std::string(what) + " contains a non-finite value at index " + std::to_string(i));
        }
    }
}

} // namespace

double window_energy(const float* samples, std::size_t available, std::size_t frame_length) {
    const std::size_t n = std::min(available, frame_length);
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double s = static_cast<double>(samples[i]);
        acc += s * s;
    }
    return acc;
}

double row_energy(const float* row, std::size_t num_bands, SpectrogramScale scale) {
    double acc = 0.0;
    if (scale == SpectrogramScale::Linear) {
        for (std::size_t b = 0; b < num_bands; ++b) acc += static_cast<double>(row[b]);
        return acc;
    }
    for (std::size_t b = 0; b < num_bands; ++b) {
        const double m = std::clamp(static_cast<double>(row[b]), 0.0, 1.0);
        const double db = m * (-kMinLevelDb) + kMinLevelDb;
        acc += std::pow(10.0, (db + kRefLevelDb) * 0.05);
    }
    return acc;
}

std::size_t signal_frame_count(std::size_t n, const DetectorConfig& config) {
    const auto hop = static_cast<std::size_t>(config.hop_length);
    const auto len = static_cast<std::size_t>(config.frame_length);
    if (config.pad_final_frame) return (n + hop - 1) / hop;
    return n >= len ? 1 + (n - len) / hop : 0;
}

void check_signal(const Signal& signal) {
    if (signal.size == 0) invalid("signal is empty");
    if (!signal.samples) invalid("signal has no sample buffer");
    if (signal.sample_rate <= 0) invalid("signal sample rate must be > 0");
    check_finite(signal.samples, signal.size, "signal");
}

void check_spectrogram(const Spectrogram& spec) {
    if (spec.num_frames == 0) invalid("spectrogram has no frames");
    if (spec.num_bands == 0) invalid("spectrogram has no bands");
    if (!spec.data) invalid("spectrogram has no data buffer");
    if (spec.sample_rate <= 0) invalid("spectrogram sample rate must be supplied and > 0");
    const std::size_t total = spec.num_frames * spec.num_bands;
    check_finite(spec.data, total, "spectrogram");
    if (spec.scale == SpectrogramScale::Linear) {
        for (std::size_t i = 0; i < total; ++i) {
            if (spec.data[i] < 0.0f) invalid("linear spectrogram contains a negative magnitude");
        }
    }
}

std::vector<double> compute_energies(const Signal& signal, const DetectorConfig& config) {
    config.validate();
    check_signal(signal);

    const auto hop = static_cast<std::size_t>(config.hop_length);
    const auto len = static_cast<std::size_t>(config.frame_length);
    const std::size_t frames = signal_frame_count(signal.size, config);

    std::vector<double> energies;
    energies.reserve(frames);
    for (std::size_t i = 0; i < frames; ++i) {
        const std::size_t start = i * hop;
        energies.push_back(window_energy(signal.samples + start, signal.size - start, len));
    }
    return energies;
}

std::vector<double> compute_energies(const Spectrogram& spec, const DetectorConfig& config) {
    config.validate();
    check_spectrogram(spec);

    std::vector<double> energies;
    energies.reserve(spec.num_frames);
    for (std::size_t i = 0; i < spec.num_frames; ++i) {
        energies.push_back(row_energy(spec.row(i), spec.num_bands, spec.scale));
    }
    return energies;
}

std::vector<double> compute_energies(const Input& input, const DetectorConfig& config) {
    return std::visit([&](const auto& in) { return compute_energies(in, config); }, input);
}

// ---------------------------------------------------------------------------

FrameEnergyStream::FrameEnergyStream(const DetectorConfig& config)
    : frame_length_(static_cast<std::size_t>(config.frame_length)),
      hop_length_(static_cast<std::size_t>(config.hop_length)),
      pad_(config.pad_final_frame) {
    config.validate();
    pending_.reserve(frame_length_ * 2);
}

std::vector<double> FrameEnergyStream::push(const float* samples, std::size_t n) {
    std::vector<double> out;
    if (n == 0) return out;
    if (!samples) invalid("chunk has no sample buffer");
    check_finite(samples, n, "chunk");

    pending_.insert(pending_.end(), samples, samples + n);
    samples_seen_ += static_cast<std::int64_t>(n);

    const auto hop = static_cast<std::int64_t>(hop_length_);
    const auto len = static_cast<std::int64_t>(frame_length_);
    while (next_frame_ * hop + len <= samples_seen_) {
        const auto offset = static_cast<std::size_t>(next_frame_ * hop - pending_start_);
        out.push_back(window_energy(pending_.data() + offset, frame_length_, frame_length_));
        ++next_frame_;
    }
    drop_consumed();
    return out;
}

std::vector<double> FrameEnergyStream::finish() {
    std::vector<double> out;
    if (!pad_) return out;

    const auto hop = static_cast<std::int64_t>(hop_length_);
    while (next_frame_ * hop < samples_seen_) {
        const std::int64_t start = next_frame_ * hop;
        const auto offset = static_cast<std::size_t>(start - pending_start_);
        const auto available = static_cast<std::size_t>(samples_seen_ - start);
        out.push_back(window_energy(pending_.data() + offset, available, frame_length_));
        ++next_frame_;
    }
    drop_consumed();
    return out;
}

void FrameEnergyStream::reset() {
    pending_.clear();
    pending_start_ = 0;
    samples_seen_ = 0;
    next_frame_ = 0;
}

void FrameEnergyStream::drop_consumed() {
    const std::int64_t keep_from = next_frame_ * static_cast<std::int64_t>(hop_length_);
    const auto drop = static_cast<std::size_t>(
        std::min<std::int64_t>(keep_from - pending_start_, static_cast<std::int64_t>(pending_.size())));
    if (drop == 0) return;
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(drop));
    pending_start_ += static_cast<std::int64_t>(drop);
}

} // namespace sigvad
