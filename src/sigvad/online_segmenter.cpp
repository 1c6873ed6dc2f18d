#include "sigvad/online_segmenter.hpp"
#include "sigvad/errors.hpp"
#include <algorithm>
#include <string>

namespace sigvad {

OnlineSegmenter::OnlineSegmenter(const DetectorConfig& config, int sample_rate)
    : config_(config), sample_rate_(sample_rate), energy_(config) {
    config_.validate();
    if (sample_rate_ <= 0) {
        throw DetectorError(ErrorKind::InvalidConfiguration,
                            "stream sample rate must be > 0, got " + std::to_string(sample_rate_));
    }
}

std::optional<double> OnlineSegmenter::current_reference() const {
    if (config_.reference_level) return config_.reference_level;
    return state_.peak;
}

void OnlineSegmenter::ensure_open() const {
    if (state_.closed) {
        throw DetectorError(ErrorKind::StreamClosed, "stream was flushed; call reset() to reuse it");
    }
}

void OnlineSegmenter::bind_kind(StreamKind kind, std::size_t num_bands, SpectrogramScale scale) {
    if (state_.kind != StreamKind::Unset && state_.kind != kind) {
        throw DetectorError(ErrorKind::InvalidInput,
                            "a stream takes either samples or spectrogram rows, not both");
    }
    if (kind == StreamKind::Rows && state_.kind == StreamKind::Rows && state_.num_bands != num_bands) {
        throw DetectorError(ErrorKind::InvalidInput,
                            "band count changed from " + std::to_string(state_.num_bands) +
                            " to " + std::to_string(num_bands));
    }
    if (kind == StreamKind::Rows && state_.kind == StreamKind::Rows && state_.scale != scale) {
        throw DetectorError(ErrorKind::InvalidInput, "spectrogram scale changed mid-stream");
    }
}

std::vector<Segment> OnlineSegmenter::push(const float* samples, std::size_t n) {
    ensure_open();
    std::vector<Segment> out;
    if (n == 0) return out;

    bind_kind(StreamKind::Samples, 0, SpectrogramScale::Linear);
    const std::vector<double> energies = energy_.push(samples, n);
    state_.kind = StreamKind::Samples;

    consume(energies, out);
    return out;
}

std::vector<Segment> OnlineSegmenter::push_rows(const Spectrogram& rows) {
    ensure_open();
    std::vector<Segment> out;
    if (rows.num_frames == 0) return out;

    check_spectrogram(rows);
    if (rows.sample_rate != sample_rate_) {
        throw DetectorError(ErrorKind::InvalidInput,
                            "rows at " + std::to_string(rows.sample_rate) +
                            " Hz pushed to a " + std::to_string(sample_rate_) + " Hz stream");
    }
    bind_kind(StreamKind::Rows, rows.num_bands, rows.scale);
    state_.kind = StreamKind::Rows;
    state_.num_bands = rows.num_bands;
    state_.scale = rows.scale;

    std::vector<double> energies;
    energies.reserve(rows.num_frames);
    for (std::size_t i = 0; i < rows.num_frames; ++i) {
        energies.push_back(row_energy(rows.row(i), rows.num_bands, rows.scale));
    }
    state_.rows_seen += static_cast<std::int64_t>(rows.num_frames);

    consume(energies, out);
    return out;
}

std::vector<Segment> OnlineSegmenter::flush() {
    ensure_open();
    std::vector<Segment> out;

    if (state_.kind == StreamKind::Samples) {
        consume(energy_.finish(), out);
    }
    if (state_.open_start) {
        // A trailing silence run too short to close the segment is not part of it.
        close_segment(state_.next_frame - state_.silence_run, out);
    }
    state_.mode = StreamMode::Silence;
    state_.speech_run = 0;
    state_.silence_run = 0;
    state_.closed = true;
    return out;
}

void OnlineSegmenter::reset() {
    energy_.reset();
    state_ = StreamState{};
}

void OnlineSegmenter::consume(const std::vector<double>& energies, std::vector<Segment>& out) {
    if (energies.empty()) return;

    if (!config_.reference_level) {
        const double chunk_peak = *std::max_element(energies.begin(), energies.end());
        state_.peak = state_.peak ? std::max(*state_.peak, chunk_peak) : chunk_peak;
    }
    const double threshold = threshold_from(*current_reference(), config_.top_db);

    for (double e : energies) {
        advance(classify(e, threshold), out);
    }
}

void OnlineSegmenter::advance(FrameLabel label, std::vector<Segment>& out) {
    const std::int64_t current = state_.next_frame;

    if (state_.mode == StreamMode::Silence) {
        if (label == FrameLabel::Speech) {
            if (++state_.speech_run >= config_.min_speech_frames) {
                state_.mode = StreamMode::Speech;
                state_.open_start = current - config_.min_speech_frames + 1;
                state_.speech_run = 0;
                state_.silence_run = 0;
            }
        } else {
            state_.speech_run = 0;
        }
    } else {
        if (label == FrameLabel::Silence) {
            if (++state_.silence_run >= config_.min_silence_frames) {
                close_segment(current - config_.min_silence_frames + 1, out);
                state_.mode = StreamMode::Silence;
                state_.silence_run = 0;
                state_.speech_run = 0;
            }
        } else {
            state_.silence_run = 0;
        }
    }

    state_.next_frame = current + 1;
}

void OnlineSegmenter::close_segment(std::int64_t end_frame, std::vector<Segment>& out) {
    out.push_back(make_segment(*state_.open_start, end_frame, config_.hop_length,
                               sample_rate_, stream_duration()));
    state_.open_start.reset();
}

double OnlineSegmenter::stream_duration() const {
    if (state_.kind == StreamKind::Rows) {
        return frame_to_seconds(state_.rows_seen, config_.hop_length, sample_rate_);
    }
    return static_cast<double>(energy_.samples_seen()) / sample_rate_;
}

} // namespace sigvad
