#include "sigvad/offline_segmenter.hpp"
#include "sigvad/errors.hpp"

namespace sigvad {

std::vector<std::pair<std::int64_t, std::int64_t>>
label_runs(const std::vector<FrameLabel>& labels, FrameLabel label) {
    std::vector<std::pair<std::int64_t, std::int64_t>> runs;
    const auto n = static_cast<std::int64_t>(labels.size());
    std::int64_t i = 0;
    while (i < n) {
        if (labels[static_cast<std::size_t>(i)] != label) { ++i; continue; }
        std::int64_t j = i;
        while (j < n && labels[static_cast<std::size_t>(j)] == label) ++j;
        runs.emplace_back(i, j);
        i = j;
    }
    return runs;
}

std::vector<FrameLabel> smooth_labels(const std::vector<FrameLabel>& labels,
                                      int min_speech_frames, int min_silence_frames) {
    if (min_speech_frames < 1 || min_silence_frames < 1) {
        throw DetectorError(ErrorKind::InvalidConfiguration, "minimum run lengths must be >= 1");
    }

    std::vector<FrameLabel> out(labels.size(), FrameLabel::Silence);
    const std::size_t n = labels.size();
    bool in_speech = false;

    std::size_t i = 0;
    while (i < n) {
        std::size_t j = i;
        while (j < n && labels[j] == labels[i]) ++j;
        const std::size_t run = j - i;
        const bool speech = labels[i] == FrameLabel::Speech;

        bool keep_speech;
        if (!in_speech) {
            keep_speech = speech && run >= static_cast<std::size_t>(min_speech_frames);
        } else if (speech) {
            keep_speech = true;
        } else {
            // Bridge short gaps, but only when speech can still follow.
            keep_speech = run < static_cast<std::size_t>(min_silence_frames) && j < n;
        }
        in_speech = keep_speech;

        if (keep_speech) {
            for (std::size_t k = i; k < j; ++k) out[k] = FrameLabel::Speech;
        }
        i = j;
    }
    return out;
}

OfflineSegmenter::OfflineSegmenter(const DetectorConfig& config) : config_(config) {
    config_.validate();
}

double OfflineSegmenter::reference_for(const std::vector<double>& energies) const {
    if (config_.reference_level) return *config_.reference_level;
    return reference_level(energies);
}

OfflineSegmenter::Analysis OfflineSegmenter::analyse(const Input& input) const {
    Analysis a;
    a.energies = compute_energies(input, config_);

    if (const auto* sig = std::get_if<Signal>(&input)) {
        a.sample_rate = sig->sample_rate;
        a.duration = sig->duration();
    } else {
        const auto& spec = std::get<Spectrogram>(input);
        a.sample_rate = spec.sample_rate;
        a.duration = frame_to_seconds(static_cast<std::int64_t>(spec.num_frames),
                                      config_.hop_length, spec.sample_rate);
    }

    // A signal shorter than one frame with padding disabled has no frames.
    if (a.energies.empty()) return a;

    const double threshold = threshold_from(reference_for(a.energies), config_.top_db);
    a.smoothed = smooth_labels(classify_frames(a.energies, threshold),
                               config_.min_speech_frames, config_.min_silence_frames);
    return a;
}

std::vector<Segment> OfflineSegmenter::runs_to_segments(const Analysis& a, FrameLabel label) const {
    std::vector<Segment> segments;
    for (const auto& [start, end] : label_runs(a.smoothed, label)) {
        segments.push_back(make_segment(start, end, config_.hop_length, a.sample_rate, a.duration));
    }
    return segments;
}

std::vector<Segment> OfflineSegmenter::get_speech_endpoint(const Signal& signal) const {
    return get_speech_endpoint(Input(signal));
}

std::vector<Segment> OfflineSegmenter::get_speech_endpoint(const Spectrogram& spec) const {
    return get_speech_endpoint(Input(spec));
}

std::vector<Segment> OfflineSegmenter::get_speech_endpoint(const Input& input) const {
    return runs_to_segments(analyse(input), FrameLabel::Speech);
}

std::vector<Segment> OfflineSegmenter::get_silence_endpoint(const Input& input) const {
    return runs_to_segments(analyse(input), FrameLabel::Silence);
}

std::vector<FrameLabel> OfflineSegmenter::label_frames(const Input& input) const {
    const std::vector<double> energies = compute_energies(input, config_);
    if (energies.empty()) return {};
    return classify_frames(energies, threshold_from(reference_for(energies), config_.top_db));
}

std::vector<Segment> get_speech_endpoint(const Input& input, double top_db,
                                         int frame_length, int hop_length,
                                         int min_speech_frames, int min_silence_frames) {
    DetectorConfig config;
    config.top_db = top_db;
    config.frame_length = frame_length;
    config.hop_length = hop_length;
    config.min_speech_frames = min_speech_frames;
    config.min_silence_frames = min_silence_frames;
    return OfflineSegmenter(config).get_speech_endpoint(input);
}

} // namespace sigvad
