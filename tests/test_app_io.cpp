#include "reference_profile.hpp"
#include "spectrogram_file.hpp"
#include "sqlite_logger.hpp"
#include "wav_file.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool expect(bool condition, const char* message) {
    if (!condition) {
        std::fprintf(stderr, "FAIL: %s\n", message);
        return false;
    }
    return true;
}

template <typename F>
bool throws_runtime(F f) {
    try {
        f();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void put(std::ofstream& out, std::uint32_t v, int bytes) {
    for (int i = 0; i < bytes; ++i) out.put(static_cast<char>((v >> (8 * i)) & 0xFF));
}

// Stereo 16-bit file with a LIST chunk between the header and fmt.
void write_stereo_wav(const std::string& path) {
    const std::int16_t frames[][2] = {{1000, 3000}, {-2000, -4000}};
    std::ofstream out(path, std::ios::binary);
    out.write("RIFF", 4);
    put(out, 4 + (8 + 4) + (8 + 16) + (8 + 8), 4);
    out.write("WAVE", 4);
    out.write("LIST", 4);
    put(out, 4, 4);
    out.write("INFO", 4);
    out.write("fmt ", 4);
    put(out, 16, 4);
    put(out, 1, 2);      // PCM
    put(out, 2, 2);      // channels
    put(out, 8000, 4);
    put(out, 8000 * 4, 4);
    put(out, 4, 2);      // block align
    put(out, 16, 2);
    out.write("data", 4);
    put(out, 8, 4);
    for (const auto& f : frames) {
        put(out, static_cast<std::uint16_t>(f[0]), 2);
        put(out, static_cast<std::uint16_t>(f[1]), 2);
    }
}

// Mono 16-bit file as written by a streaming recorder: the RIFF and data
// sizes were never patched and stay at 0xFFFFFFFF.
void write_streamed_wav(const std::string& path, std::size_t samples) {
    std::ofstream out(path, std::ios::binary);
    out.write("RIFF", 4);
    put(out, 0xFFFFFFFFu, 4);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put(out, 16, 4);
    put(out, 1, 2);      // PCM
    put(out, 1, 2);      // channels
    put(out, 16000, 4);
    put(out, 16000 * 2, 4);
    put(out, 2, 2);      // block align
    put(out, 16, 2);
    out.write("data", 4);
    put(out, 0xFFFFFFFFu, 4);
    for (std::size_t i = 0; i < samples; ++i) {
        put(out, static_cast<std::uint16_t>(static_cast<std::int16_t>(i % 2 ? -8192 : 8192)), 2);
    }
}

}

int main() {
    bool ok = true;
    const fs::path dir = fs::temp_directory_path() / "sigvad-test-app-io";
    fs::remove_all(dir);
    fs::create_directories(dir);

    {
        std::vector<float> x(480);
        for (std::size_t i = 0; i < x.size(); ++i) x[i] = static_cast<float>(0.8 * std::sin(0.05 * i));
        const std::string path = (dir / "tone.wav").string();
        write_wav_file(path, x, 16000);

        const WavAudio wav = read_wav_file(path);
        ok &= expect(wav.sample_rate == 16000 && wav.channels == 1 && wav.bits_per_sample == 16,
                     "written WAV header reads back");
        ok &= expect(wav.samples.size() == x.size(), "written WAV length reads back");
        bool close = wav.samples.size() == x.size();
        for (std::size_t i = 0; close && i < x.size(); ++i) close = std::fabs(wav.samples[i] - x[i]) < 1e-4;
        ok &= expect(close, "16-bit quantization stays within one step");
    }

    {
        const std::string path = (dir / "stereo.wav").string();
        write_stereo_wav(path);
        const WavAudio wav = read_wav_file(path);
        ok &= expect(wav.channels == 2 && wav.sample_rate == 8000, "stereo header behind a LIST chunk");
        ok &= expect(wav.samples.size() == 2, "one mono sample per frame");
        if (wav.samples.size() == 2) {
            ok &= expect(std::fabs(wav.samples[0] - 2000.0f / 32768.0f) < 1e-7 &&
                         std::fabs(wav.samples[1] + 3000.0f / 32768.0f) < 1e-7,
                         "channels are averaged to mono");
        }

        const std::string streamed = (dir / "streamed.wav").string();
        write_streamed_wav(streamed, 1600);
        const WavAudio live = read_wav_file(streamed);
        ok &= expect(live.samples.size() == 1600, "unpatched data size reads the samples actually present");
        if (live.samples.size() == 1600) {
            ok &= expect(live.samples[0] == 0.25f && live.samples[1599] == -0.25f,
                         "streamed samples decode like any other");
        }

        const std::string bad_fmt = (dir / "bad-fmt.wav").string();
        {
            std::ofstream out(bad_fmt, std::ios::binary);
            out.write("RIFF", 4);
            put(out, 36, 4);
            out.write("WAVE", 4);
            out.write("fmt ", 4);
            put(out, 0xFFFFFFFFu, 4);
            put(out, 1, 2);
            put(out, 1, 2);
        }
        ok &= expect(throws_runtime([&] { read_wav_file(bad_fmt); }), "fmt chunk longer than the file is rejected");

        const std::string junk = (dir / "junk.wav").string();
        std::ofstream(junk) << "not a wave file";
        ok &= expect(throws_runtime([&] { read_wav_file(junk); }), "non-RIFF file is rejected");
        ok &= expect(throws_runtime([&] { read_wav_file((dir / "missing.wav").string()); }),
                     "missing WAV file is rejected");
    }

    {
        const SpectrogramFile spec = parse_spectrogram_json(
            R"({"sample_rate": 16000, "hop_length": 160, "frames": [[1, 2, 3], [0, 0.5, 0]]})");
        ok &= expect(spec.num_frames == 2 && spec.num_bands == 3, "spectrogram shape");
        ok &= expect(spec.hop_length == 160 && spec.scale == sigvad::SpectrogramScale::Linear,
                     "hop and default scale");
        const sigvad::Spectrogram view = spec.view();
        ok &= expect(view.row(1)[1] == 0.5f, "rows are stored row-major");

        const SpectrogramFile mel = parse_spectrogram_json(
            R"({"sample_rate": 22050, "scale": "normalized_db", "frames": [[0.2, 0.9]]})");
        ok &= expect(mel.scale == sigvad::SpectrogramScale::NormalizedDb && mel.hop_length == 0,
                     "normalized scale and missing hop");

        ok &= expect(throws_runtime([] { parse_spectrogram_json(R"({"sample_rate": 1, "frames": [[1, 2], [3]]})"); }),
                     "ragged rows are rejected");
        ok &= expect(throws_runtime([] {
                         parse_spectrogram_json(R"({"sample_rate": 1, "scale": "mel", "frames": [[1]]})");
                     }), "unknown scale is rejected");
        ok &= expect(throws_runtime([] { parse_spectrogram_json(R"({"frames": [[1]]})"); }),
                     "missing sample rate is rejected");
        ok &= expect(throws_runtime([] { parse_spectrogram_json("{\"frames\": ["); }), "truncated JSON is rejected");
    }

    {
        ReferenceProfile profile;
        profile.reference_level = 42.5;
        profile.top_db = 30.0;
        profile.frame_length = 400;
        profile.hop_length = 160;
        profile.sample_rate = 16000;
        const std::string path = (dir / "profiles" / "room.json").string();
        save_reference_profile(path, profile);

        const ReferenceProfile loaded = load_reference_profile(path);
        ok &= expect(loaded.reference_level == 42.5 && loaded.top_db == 30.0 && loaded.frame_length == 400 &&
                     loaded.hop_length == 160 && loaded.sample_rate == 16000, "profile reads back");

        sigvad::DetectorConfig c;
        c.frame_length = 400;
        c.hop_length = 160;
        check_profile_matches(loaded, c, 16000);
        ok &= expect(throws_runtime([&] { check_profile_matches(loaded, c, 8000); }),
                     "profile at another sample rate is rejected");
        c.hop_length = 200;
        ok &= expect(throws_runtime([&] { check_profile_matches(loaded, c, 16000); }),
                     "profile with another hop is rejected");
    }

    {
        const std::string path = (dir / "db" / "sessions.db").string();
        {
            SessionLogger logger(path);
            ok &= expect(logger.path() == path, "logger keeps its path");
            const auto first = logger.start_session("take1.wav", 16000);
            const auto second = logger.start_session("mic", 16000);
            ok &= expect(second > first, "session ids increase");

            sigvad::Segment late;
            late.start_frame = 75;
            late.end_frame = 90;
            late.start_time = 0.75;
            late.end_time = 0.9;
            sigvad::Segment early;
            early.start_frame = 10;
            early.end_frame = 20;
            early.start_time = 0.1;
            early.end_time = 0.2;
            logger.log_segment(first, late);
            logger.log_segment(first, early);
            logger.log_segment(second, early);
            logger.end_session(first);

            const auto segments = logger.session_segments(first);
            ok &= expect(segments.size() == 2 && segments[0] == early && segments[1] == late,
                         "segments come back per session in start order");
        }
        SessionLogger reopened(path);
        ok &= expect(reopened.session_segments(2).size() == 1, "rows persist across connections");
    }

    {
        const std::string path = (dir / "not-a.db").string();
        {
            std::ofstream out(path, std::ios::binary);
            for (int i = 0; i < 64; ++i) out << "this file holds text, not tables\n";
        }
        ok &= expect(throws_runtime([&] { SessionLogger logger(path); }),
                     "opening a file that is not a database is rejected");
    }

    fs::remove_all(dir);

    if (!ok) {
        return 1;
    }

    std::fprintf(stderr, "PASSED: app io tests\n");
    return 0;
}
