#pragma once
#include "sigvad/config.hpp"
#include "sigvad/frame_energy.hpp"
#include "sigvad/segment.hpp"
#include "sigvad/threshold.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace sigvad {

// Hysteresis over a whole label sequence, scanning runs left to right.
// Outside speech, a speech run opens a segment only if it lasts
// min_speech_frames. Inside speech, a silence run shorter than
// min_silence_frames is bridged unless it ends the input.
std::vector<FrameLabel> smooth_labels(const std::vector<FrameLabel>& labels,
                                      int min_speech_frames, int min_silence_frames);

// Maximal runs of `label` as [start, end) frame pairs.
std::vector<std::pair<std::int64_t, std::int64_t>>
label_runs(const std::vector<FrameLabel>& labels, FrameLabel label);

// Whole-buffer detector: energies and the reference level are computed
// over the entire input before any frame is classified.
class OfflineSegmenter {
public:
    explicit OfflineSegmenter(const DetectorConfig& config);

    std::vector<Segment> get_speech_endpoint(const Signal& signal) const;
    std::vector<Segment> get_speech_endpoint(const Spectrogram& spec) const;
    std::vector<Segment> get_speech_endpoint(const Input& input) const;

    // Complement of the speech segments over the analysed frames.
    std::vector<Segment> get_silence_endpoint(const Input& input) const;

    // Raw, unsmoothed classification.
    std::vector<FrameLabel> label_frames(const Input& input) const;

    // Reference this detector would use for the given energies.
    double reference_for(const std::vector<double>& energies) const;

    const DetectorConfig& config() const { return config_; }

private:
    struct Analysis {
        std::vector<double> energies;
        std::vector<FrameLabel> smoothed;
        int sample_rate = 0;
        double duration = 0.0;
    };

    DetectorConfig config_;

    Analysis analyse(const Input& input) const;
    std::vector<Segment> runs_to_segments(const Analysis& a, FrameLabel label) const;
};

// One-shot form taking the configuration surface explicitly.
std::vector<Segment> get_speech_endpoint(const Input& input, double top_db,
                                         int frame_length, int hop_length,
                                         int min_speech_frames, int min_silence_frames);

} // namespace sigvad
