#pragma once
#include <cstdint>
#include <utility>
#include <vector>

namespace sigvad {

// Half-open run of speech (or silence) frames, with its times in seconds.
struct Segment {
    std::int64_t start_frame{0};
    std::int64_t end_frame{0};
    double start_time{0.0};
    double end_time{0.0};

    std::int64_t num_frames() const { return end_frame - start_frame; }
    double duration() const { return end_time - start_time; }

    bool operator==(const Segment& o) const {
        return start_frame == o.start_frame && end_frame == o.end_frame &&
               start_time == o.start_time && end_time == o.end_time;
    }
    bool operator!=(const Segment& o) const { return !(*this == o); }
};

inline double frame_to_seconds(std::int64_t frame, int hop_length, int sample_rate) {
    return static_cast<double>(frame) * hop_length / static_cast<double>(sample_rate);
}

// Builds a segment from frame indices; end_time is clamped to `max_time`
// (the input duration) since the last frame may extend past the input.
inline Segment make_segment(std::int64_t start_frame, std::int64_t end_frame,
                            int hop_length, int sample_rate, double max_time) {
    Segment s;
    s.start_frame = start_frame;
    s.end_frame = end_frame;
    s.start_time = frame_to_seconds(start_frame, hop_length, sample_rate);
    const double end = frame_to_seconds(end_frame, hop_length, sample_rate);
    s.end_time = end < max_time ? end : max_time;
    return s;
}

inline std::vector<std::pair<double, double>> to_time_pairs(const std::vector<Segment>& segments) {
    std::vector<std::pair<double, double>> out;
    out.reserve(segments.size());
    for (const auto& s : segments) out.emplace_back(s.start_time, s.end_time);
    return out;
}

} // namespace sigvad
