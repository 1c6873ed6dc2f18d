#include "sigvad/errors.hpp"
#include "sigvad/offline_segmenter.hpp"
#include "test_signals.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <vector>

using namespace sigvad;
using namespace test_signals;

namespace {

bool expect(bool condition, const char* message) {
    if (!condition) {
        std::fprintf(stderr, "FAIL: %s\n", message);
        return false;
    }
    return true;
}

template <typename F>
bool throws_kind(F f, ErrorKind kind) {
    try {
        f();
    } catch (const DetectorError& e) {
        return e.kind() == kind;
    }
    return false;
}

bool nearly_equal(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

DetectorConfig speech_config(int min_speech, int min_silence) {
    DetectorConfig c;
    c.top_db = 25.0;
    c.frame_length = 400;
    c.hop_length = 160;
    c.min_speech_frames = min_speech;
    c.min_silence_frames = min_silence;
    return c;
}

// Non-overlapping frames of one pattern block each.
DetectorConfig block_config(int min_speech, int min_silence) {
    DetectorConfig c;
    c.top_db = 25.0;
    c.frame_length = 100;
    c.hop_length = 100;
    c.min_speech_frames = min_speech;
    c.min_silence_frames = min_silence;
    return c;
}

std::vector<FrameLabel> labels_of(const std::string& p) {
    std::vector<FrameLabel> out;
    for (char c : p) out.push_back(c == 'S' ? FrameLabel::Speech : FrameLabel::Silence);
    return out;
}

std::string string_of(const std::vector<FrameLabel>& labels) {
    std::string out;
    for (auto l : labels) out += l == FrameLabel::Speech ? 'S' : '_';
    return out;
}

}

int main() {
    bool ok = true;

    {
        // 16 kHz, tone over samples [8000, 12000). Frame 48 is the first whose
        // window [7680, 8080) reaches the tone, frame 74 the last to start inside it.
        const auto x = tone_burst();
        OfflineSegmenter seg(speech_config(2, 2));
        const auto segments = seg.get_speech_endpoint(Signal(x, kSampleRate));
        ok &= expect(segments.size() == 1, "tone burst should give one segment");
        if (segments.size() == 1) {
            ok &= expect(segments[0].start_frame == 48 && segments[0].end_frame == 75,
                         "tone burst frames should be [48, 75)");
            ok &= expect(nearly_equal(segments[0].start_time, 0.48), "tone burst should start at 0.48 s");
            ok &= expect(nearly_equal(segments[0].end_time, 0.75), "tone burst should end at 0.75 s");
        }

        const auto again = seg.get_speech_endpoint(Signal(x, kSampleRate));
        ok &= expect(again == segments, "offline detection should be deterministic");

        const auto direct = get_speech_endpoint(Signal(x, kSampleRate), 25.0, 400, 160, 2, 2);
        ok &= expect(direct == segments, "free function should match the segmenter");

        const auto labels = seg.label_frames(Signal(x, kSampleRate));
        ok &= expect(labels.size() == 100, "1 s at hop 160 should give 100 frames");
        ok &= expect(labels[47] == FrameLabel::Silence && labels[48] == FrameLabel::Speech &&
                     labels[74] == FrameLabel::Speech && labels[75] == FrameLabel::Silence,
                     "raw labels should follow the tone edges");

        const auto silence = seg.get_silence_endpoint(Signal(x, kSampleRate));
        ok &= expect(silence.size() == 2, "silence should surround the tone");
        if (silence.size() == 2) {
            ok &= expect(silence[0].start_frame == 0 && silence[0].end_frame == 48, "leading silence frames");
            ok &= expect(silence[1].start_frame == 75 && silence[1].end_frame == 100, "trailing silence frames");
            ok &= expect(nearly_equal(silence[1].end_time, 1.0), "trailing silence should end at the signal end");
        }
    }

    {
        std::vector<float> x(kSampleRate);
        std::mt19937 rng(3);
        std::uniform_real_distribution<float> noise(-0.001f, 0.001f);
        for (auto& s : x) s = noise(rng);

        DetectorConfig c = speech_config(2, 2);
        c.reference_level = 100.0;
        ok &= expect(OfflineSegmenter(c).get_speech_endpoint(Signal(x, kSampleRate)).empty(),
                     "low noise under a fixed reference should give no segment");

        std::vector<float> zeros(kSampleRate, 0.0f);
        ok &= expect(OfflineSegmenter(speech_config(1, 1)).get_speech_endpoint(Signal(zeros, kSampleRate)).empty(),
                     "digital silence should give no segment");
    }

    {
        std::vector<float> x(kSampleRate, 0.0f);
        add_tone(x, 0, x.size(), 0.5f);
        const auto segments = OfflineSegmenter(speech_config(2, 2)).get_speech_endpoint(Signal(x, kSampleRate));
        ok &= expect(segments.size() == 1, "all-speech buffer should give one segment");
        if (segments.size() == 1) {
            ok &= expect(segments[0].start_frame == 0 && segments[0].end_frame == 100, "all-speech frames");
            ok &= expect(segments[0].start_time == 0.0 && segments[0].end_time == 1.0,
                         "all-speech segment should span [0, duration)");
        }
    }

    {
        const auto spike = pattern("....X.....", 100);
        ok &= expect(OfflineSegmenter(block_config(2, 2)).get_speech_endpoint(Signal(spike, kSampleRate)).empty(),
                     "speech run shorter than min_speech_frames should be dropped");

        const auto gap = pattern("..XXX.XXX..", 100);
        const auto merged = OfflineSegmenter(block_config(2, 2)).get_speech_endpoint(Signal(gap, kSampleRate));
        ok &= expect(merged.size() == 1 && merged[0].start_frame == 2 && merged[0].end_frame == 9,
                     "gap shorter than min_silence_frames should be merged");

        const auto split = OfflineSegmenter(block_config(2, 1)).get_speech_endpoint(Signal(gap, kSampleRate));
        ok &= expect(split.size() == 2 && split[0].end_frame == 5 && split[1].start_frame == 6,
                     "gap reaching min_silence_frames should split the segment");
    }

    {
        ok &= expect(string_of(smooth_labels(labels_of("SS___"), 3, 1)) == "_____",
                     "short leading speech is dropped");
        ok &= expect(string_of(smooth_labels(labels_of("_SSS_SSS___"), 2, 2)) == "_SSSSSSS___",
                     "short gap inside speech is bridged");
        ok &= expect(string_of(smooth_labels(labels_of("SSS_"), 2, 2)) == "SSS_",
                     "trailing short silence is not bridged");
        ok &= expect(string_of(smooth_labels(labels_of("S_S_S"), 2, 2)) == "_____",
                     "gaps are only bridged once speech has started");
        ok &= expect(string_of(smooth_labels(labels_of("SSS_S___"), 3, 3)) == "SSSSS___",
                     "short speech after a bridged gap stays speech");
        ok &= expect(string_of(smooth_labels(labels_of("SSSS"), 1, 1)) == "SSSS", "all speech stays speech");
        ok &= expect(smooth_labels({}, 2, 2).empty(), "no labels in, no labels out");
        ok &= expect(throws_kind([] { smooth_labels(labels_of("S"), 0, 1); }, ErrorKind::InvalidConfiguration),
                     "zero min run is invalid configuration");

        const auto runs = label_runs(labels_of("_SS__S"), FrameLabel::Speech);
        ok &= expect(runs.size() == 2 && runs[0].first == 1 && runs[0].second == 3 &&
                     runs[1].first == 5 && runs[1].second == 6, "label runs are half-open");
    }

    {
        const auto x = tone_burst();
        const auto rows = band_rows(x, 100);
        Spectrogram spec;
        spec.data = rows.data();
        spec.num_frames = 100;
        spec.num_bands = 4;
        spec.sample_rate = kSampleRate;

        OfflineSegmenter seg(speech_config(2, 2));
        const auto from_signal = seg.get_speech_endpoint(Signal(x, kSampleRate));
        const auto from_spec = seg.get_speech_endpoint(spec);
        ok &= expect(from_signal.size() == from_spec.size(), "signal and spectrogram should agree on segment count");
        for (std::size_t i = 0; i < from_signal.size() && i < from_spec.size(); ++i) {
            ok &= expect(std::llabs(from_signal[i].start_frame - from_spec[i].start_frame) <= 1 &&
                         std::llabs(from_signal[i].end_frame - from_spec[i].end_frame) <= 1,
                         "signal and spectrogram boundaries should agree within a frame");
        }
    }

    {
        // 300 samples, shorter than one 400-sample frame.
        std::vector<float> x(300, 0.0f);
        add_tone(x, 0, x.size(), 0.5f);

        DetectorConfig padded = speech_config(1, 1);
        const auto segments = OfflineSegmenter(padded).get_speech_endpoint(Signal(x, kSampleRate));
        ok &= expect(segments.size() == 1 && segments[0].start_frame == 0 && segments[0].end_frame == 2,
                     "short input should be covered by padded frames");
        if (segments.size() == 1) {
            ok &= expect(nearly_equal(segments[0].end_time, 300.0 / kSampleRate),
                         "padded end time should be clamped to the input duration");
        }

        DetectorConfig dropped = speech_config(1, 1);
        dropped.pad_final_frame = false;
        ok &= expect(OfflineSegmenter(dropped).get_speech_endpoint(Signal(x, kSampleRate)).empty(),
                     "short input without padding should give no segment");
    }

    {
        for (unsigned seed = 1; seed <= 5; ++seed) {
            const auto x = random_bursts(seed, 40, 800);
            const auto segments = OfflineSegmenter(speech_config(3, 5)).get_speech_endpoint(Signal(x, kSampleRate));
            if (!expect(well_formed(segments), "segments should be ordered, disjoint and non-empty")) {
                dump("segments", segments);
                ok = false;
            }
        }
    }

    {
        std::vector<float> empty;
        OfflineSegmenter seg(speech_config(2, 2));
        ok &= expect(throws_kind([&] { seg.get_speech_endpoint(Signal(empty, kSampleRate)); }, ErrorKind::InvalidInput),
                     "empty signal is invalid input");

        DetectorConfig bad = speech_config(2, 2);
        bad.top_db = -3.0;
        ok &= expect(throws_kind([&] { OfflineSegmenter s(bad); }, ErrorKind::InvalidConfiguration),
                     "negative top_db is rejected at construction");
        ok &= expect(throws_kind([&] { get_speech_endpoint(Signal(empty, kSampleRate), 25.0, 100, 160, 2, 2); },
                                 ErrorKind::InvalidConfiguration),
                     "configuration is checked before the input");
    }

    if (!ok) {
        return 1;
    }

    std::fprintf(stderr, "PASSED: offline segmenter tests\n");
    return 0;
}
