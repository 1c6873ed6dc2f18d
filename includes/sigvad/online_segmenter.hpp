#pragma once
#include "sigvad/config.hpp"
#include "sigvad/frame_energy.hpp"
#include "sigvad/segment.hpp"
#include "sigvad/threshold.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace sigvad {

enum class StreamMode { Silence, Speech };

enum class StreamKind { Unset, Samples, Rows };

// Everything the online segmenter carries from one push() to the next.
struct StreamState {
    StreamMode mode{StreamMode::Silence};
    int speech_run{0};
    int silence_run{0};
    std::optional<std::int64_t> open_start;  // start frame of the open segment
    std::optional<double> peak;              // running max energy
    std::int64_t next_frame{0};              // index the next frame will get
    std::int64_t rows_seen{0};               // spectrogram streams only
    StreamKind kind{StreamKind::Unset};
    std::size_t num_bands{0};
    SpectrogramScale scale{SpectrogramScale::Linear};
    bool closed{false};
};

// Streaming detector. One instance per stream and a single writer; there is
// no locking inside.
//
// Unless config.reference_level is set, the threshold follows the running
// peak, so it may rise as louder frames arrive and a prefix can be labelled
// differently from an offline run over the whole recording. With a fixed
// reference both paths agree frame for frame.
class OnlineSegmenter {
public:
    OnlineSegmenter(const DetectorConfig& config, int sample_rate);

    // Signal chunks of any length. Returns the segments closed by this chunk.
    std::vector<Segment> push(const float* samples, std::size_t n);
    std::vector<Segment> push(const std::vector<float>& samples) {
        return push(samples.data(), samples.size());
    }

    // Spectrogram rows; sample_rate must match the stream's.
    std::vector<Segment> push_rows(const Spectrogram& rows);

    // Ends the stream: processes the padded tail frames, closes the open
    // segment and returns what was finalized. The stream is terminal after.
    std::vector<Segment> flush();

    // Drops all stream state and reopens the stream.
    void reset();

    bool closed() const { return state_.closed; }
    const StreamState& state() const { return state_; }
    std::int64_t frames_processed() const { return state_.next_frame; }

    // Reference in effect for the next frame; empty before the first frame
    // of a stream without a fixed reference.
    std::optional<double> current_reference() const;

    const DetectorConfig& config() const { return config_; }
    int sample_rate() const { return sample_rate_; }

private:
    DetectorConfig config_;
    int sample_rate_;
    FrameEnergyStream energy_;
    StreamState state_;

    void ensure_open() const;
    void bind_kind(StreamKind kind, std::size_t num_bands, SpectrogramScale scale);
    void consume(const std::vector<double>& energies, std::vector<Segment>& out);
    void advance(FrameLabel label, std::vector<Segment>& out);
    void close_segment(std::int64_t end_frame, std::vector<Segment>& out);
    double stream_duration() const;
};

} // namespace sigvad
