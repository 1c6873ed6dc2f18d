#include "sigvad/config.hpp"
#include "sigvad/errors.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace sigvad {

static void reject(const std::string& msg) {
    throw DetectorError(ErrorKind::InvalidConfiguration, msg);
}

void DetectorConfig::validate() const {
    if (!std::isfinite(top_db) || top_db < 0.0) {
        reject("top_db must be a finite value >= 0, got " + std::to_string(top_db));
    }
    if (hop_length <= 0) {
        reject("hop_length must be > 0, got " + std::to_string(hop_length));
    }
    if (frame_length <= 0) {
        reject("frame_length must be > 0, got " + std::to_string(frame_length));
    }
    if (frame_length < hop_length) {
        // Frames would leave samples uncovered.
        reject("frame_length (" + std::to_string(frame_length) +
               ") must be >= hop_length (" + std::to_string(hop_length) + ")");
    }
    if (min_speech_frames < 1) {
        reject("min_speech_frames must be >= 1, got " + std::to_string(min_speech_frames));
    }
    if (min_silence_frames < 1) {
        reject("min_silence_frames must be >= 1, got " + std::to_string(min_silence_frames));
    }
    if (reference_level && (!std::isfinite(*reference_level) || *reference_level < 0.0)) {
        reject("reference_level must be a finite value >= 0");
    }
}

int frames_for_duration(double seconds, int hop_length, int sample_rate) {
    if (hop_length <= 0 || sample_rate <= 0) {
        reject("frames_for_duration needs positive hop_length and sample_rate");
    }
    if (!std::isfinite(seconds) || seconds < 0.0) {
        reject("duration must be a finite value >= 0");
    }
    const double frames = std::ceil(seconds * sample_rate / static_cast<double>(hop_length));
    if (frames > static_cast<double>(std::numeric_limits<int>::max())) {
        reject("duration of " + std::to_string(seconds) + " s is too many frames at hop " +
               std::to_string(hop_length));
    }
    return frames < 1.0 ? 1 : static_cast<int>(frames);
}

} // namespace sigvad
