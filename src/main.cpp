#include "audio_input.hpp"
#include "config.hpp"
#include "reference_profile.hpp"
#include "spectrogram_file.hpp"
#include "sqlite_logger.hpp"
#include "wav_file.hpp"

#include "sigvad/errors.hpp"
#include "sigvad/offline_segmenter.hpp"
#include "sigvad/online_segmenter.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

constexpr unsigned long kDefaultFramesPerBuffer = 512;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Args {
    bool list_devices = false;
    bool mic = false;
    std::optional<std::size_t> stream_chunk;   // --stream <samples>
    std::optional<std::string> mel_json;       // --mel-json <path>
    std::optional<std::string> input;          // positional WAV path
    std::optional<std::string> config_path;    // --config
    std::optional<std::string> save_ref;       // --save-ref
    bool silence = false;
    bool json = false;
    bool verbose = false;
    AppConfig cli;                             // values given on the command line
};

static void print_help() {
    std::cout << "sigvad: energy-based speech endpoint detection\n"
              << "  sigvad [options] <input.wav>           Offline detection\n"
              << "  sigvad --stream <n> <input.wav>        Online detection in chunks of n samples\n"
              << "  sigvad --mel-json <spec.json>          Offline detection on a mel spectrogram\n"
              << "  sigvad --mic                           Live detection (Ctrl+C to stop)\n"
              << "\n"
              << "  -l, --list-devices                 List input devices\n"
              << "  -d, --device <index>               Use specific input device index\n"
              << "      --sr <Hz>                      Capture sample rate (default 16000)\n"
              << "      --fpb <frames>                 Frames per buffer (default 512)\n"
              << "      --top-db <dB>                  Drop below reference still speech (default 25)\n"
              << "      --frame <samples>              Frame length (default 1024)\n"
              << "      --hop <samples>                Hop length (default 256)\n"
              << "      --min-speech <frames>          Speech run needed to open a segment\n"
              << "      --min-silence <frames>         Silence run needed to close a segment\n"
              << "      --min-speech-sec <s>           Same, in seconds (default 0.40)\n"
              << "      --min-silence-sec <s>          Same, in seconds (default 0.75)\n"
              << "      --ref <energy>                 Fixed reference level\n"
              << "      --ref-profile <path>           Fixed reference from a calibration profile\n"
              << "      --save-ref <path>              Save this input's reference as a profile\n"
              << "      --no-pad                       Drop the final partial frame\n"
              << "      --silence                      Print silence intervals instead of speech\n"
              << "      --json                         JSON output\n"
              << "      --db <path>                    Record segments in a SQLite DB\n"
              << "      --config <path>                Config file (default XDG)\n"
              << "      --verbose                      Print frame statistics to stderr\n";
}

static std::string need_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) throw UsageError(std::string("missing value for ") + argv[i]);
    return argv[++i];
}

template <typename T, typename F>
static T parse_number(const std::string& flag, const std::string& s, F conv) {
    size_t used = 0;
    try {
        T v = conv(s, &used);
        if (used == s.size()) return v;
    } catch (const std::exception&) {
    }
    throw UsageError("invalid value '" + s + "' for " + flag);
}

static int to_int(const std::string& f, const std::string& s) {
    return parse_number<int>(f, s, [](const std::string& x, size_t* u) { return std::stoi(x, u); });
}
static double to_double(const std::string& f, const std::string& s) {
    return parse_number<double>(f, s, [](const std::string& x, size_t* u) { return std::stod(x, u); });
}
static unsigned long to_ulong(const std::string& f, const std::string& s) {
    return parse_number<unsigned long>(f, s, [](const std::string& x, size_t* u) { return std::stoul(x, u); });
}

Args parse_args(int argc, char** argv) {
    Args a{};
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      (s == "--list-devices" || s == "-l") a.list_devices = true;
        else if (s == "--mic") a.mic = true;
        else if (s == "--stream") {
            const unsigned long n = to_ulong(s, need_value(argc, argv, i));
            if (n == 0) throw UsageError("--stream needs a chunk size > 0");
            a.stream_chunk = n;
        }
        else if (s == "--mel-json") a.mel_json = need_value(argc, argv, i);
        else if (s == "--config") a.config_path = need_value(argc, argv, i);
        else if (s == "--save-ref") a.save_ref = need_value(argc, argv, i);
        else if (s == "--silence") a.silence = true;
        else if (s == "--json") a.json = true;
        else if (s == "--verbose" || s == "-v") a.verbose = true;

        else if (s == "--device" || s == "-d") a.cli.device = to_int(s, need_value(argc, argv, i));
        else if (s == "--sr") a.cli.sample_rate = to_double(s, need_value(argc, argv, i));
        else if (s == "--fpb" || s == "--frames") a.cli.frames_per_buffer = to_ulong(s, need_value(argc, argv, i));
        else if (s == "--db") a.cli.db_path = expand_path(need_value(argc, argv, i));

        else if (s == "--top-db")          a.cli.top_db = to_double(s, need_value(argc, argv, i));
        else if (s == "--frame")           a.cli.frame_length = to_int(s, need_value(argc, argv, i));
        else if (s == "--hop")             a.cli.hop_length = to_int(s, need_value(argc, argv, i));
        else if (s == "--min-speech")      a.cli.min_speech_frames = to_int(s, need_value(argc, argv, i));
        else if (s == "--min-silence")     a.cli.min_silence_frames = to_int(s, need_value(argc, argv, i));
        else if (s == "--min-speech-sec")  a.cli.min_speech_sec = to_double(s, need_value(argc, argv, i));
        else if (s == "--min-silence-sec") a.cli.min_silence_sec = to_double(s, need_value(argc, argv, i));
        else if (s == "--ref")             a.cli.reference_level = to_double(s, need_value(argc, argv, i));
        else if (s == "--ref-profile")     a.cli.reference_profile = expand_path(need_value(argc, argv, i));
        else if (s == "--no-pad")          a.cli.pad_final_frame = false;

        else if (s == "--help" || s == "-h") {
            print_help();
            std::exit(0);
        }
        else if (!s.empty() && s[0] == '-') throw UsageError("unknown option " + s);
        else if (!a.input) a.input = s;
        else throw UsageError("more than one input file given");
    }

    const int modes = (a.mic ? 1 : 0) + (a.mel_json ? 1 : 0) + (a.input ? 1 : 0);
    if (!a.list_devices && modes != 1) {
        throw UsageError("give exactly one of <input.wav>, --mel-json <path> or --mic");
    }
    if (a.stream_chunk && !a.input) throw UsageError("--stream works on a WAV input");
    if (a.silence && (a.mic || a.stream_chunk)) throw UsageError("--silence needs offline detection");
    if (a.save_ref && a.mic) throw UsageError("--save-ref needs a recording, not --mic");
    return a;
}

static void print_config(const sigvad::DetectorConfig& cfg, int sample_rate) {
    std::cerr << "top_db " << cfg.top_db
              << ", frame " << cfg.frame_length << ", hop " << cfg.hop_length
              << " @ " << sample_rate << " Hz"
              << ", min speech " << cfg.min_speech_frames << " fr"
              << ", min silence " << cfg.min_silence_frames << " fr"
              << ", reference " << (cfg.reference_level ? std::to_string(*cfg.reference_level) : "peak")
              << "\n";
}

static void print_segment(const sigvad::Segment& s) {
    std::cout << std::fixed << std::setprecision(3)
              << s.start_time << "\t" << s.end_time << "\n";
}

static void print_json(const std::string& source, int sample_rate, const char* kind,
                       const std::vector<sigvad::Segment>& segments) {
    nlohmann::json out;
    out["source"] = source;
    out["sample_rate"] = sample_rate;
    out["kind"] = kind;
    out["segments"] = nlohmann::json::array();
    for (const auto& s : segments) {
        out["segments"].push_back({
            {"start", s.start_time},
            {"end", s.end_time},
            {"start_frame", s.start_frame},
            {"end_frame", s.end_frame},
        });
    }
    std::cout << out.dump(2) << "\n";
}

static void report(const Args& args, const std::string& source, int sample_rate,
                   const std::vector<sigvad::Segment>& segments) {
    const char* kind = args.silence ? "silence" : "speech";
    if (args.json) print_json(source, sample_rate, kind, segments);
    else for (const auto& s : segments) print_segment(s);
}

// Records one run in the DB when one is configured.
class RunLog {
public:
    RunLog(const std::optional<std::string>& db_path, const std::string& source, int sample_rate) {
        if (!db_path) return;
        logger_ = std::make_unique<SessionLogger>(*db_path);
        session_ = logger_->start_session(source, sample_rate);
    }
    void add(const sigvad::Segment& s) {
        if (logger_) logger_->log_segment(session_, s);
    }
    void finish() {
        if (logger_) logger_->end_session(session_);
    }

private:
    std::unique_ptr<SessionLogger> logger_;
    std::int64_t session_ = 0;
};

static void maybe_save_reference(const Args& args, const sigvad::OfflineSegmenter& seg,
                                 const sigvad::Input& input, int sample_rate) {
    if (!args.save_ref) return;
    const auto& cfg = seg.config();
    ReferenceProfile p;
    p.reference_level = sigvad::reference_level(sigvad::compute_energies(input, cfg));
    p.top_db = cfg.top_db;
    p.frame_length = cfg.frame_length;
    p.hop_length = cfg.hop_length;
    p.sample_rate = sample_rate;
    save_reference_profile(*args.save_ref, p);
    std::cerr << "Saved reference " << p.reference_level << " to " << *args.save_ref << "\n";
}

static void verbose_stats(const sigvad::OfflineSegmenter& seg, const sigvad::Input& input) {
    const auto energies = sigvad::compute_energies(input, seg.config());
    std::cerr << energies.size() << " frames";
    if (!energies.empty()) {
        const double ref = seg.reference_for(energies);
        std::cerr << ", reference " << ref
                  << ", threshold " << sigvad::threshold_from(ref, seg.config().top_db);
    }
    std::cerr << "\n";
}

static int run_offline(const Args& args, const AppConfig& conf, const std::string& source,
                       const sigvad::Input& input, int sample_rate) {
    const sigvad::DetectorConfig cfg = make_detector_config(conf, sample_rate);
    if (args.verbose) print_config(cfg, sample_rate);

    sigvad::OfflineSegmenter seg(cfg);
    if (args.verbose) verbose_stats(seg, input);

    const auto segments = args.silence ? seg.get_silence_endpoint(input) : seg.get_speech_endpoint(input);
    report(args, source, sample_rate, segments);

    if (!args.silence) {
        RunLog log(conf.db_path, source, sample_rate);
        for (const auto& s : segments) log.add(s);
        log.finish();
    }
    maybe_save_reference(args, seg, input, sample_rate);
    return 0;
}

static int run_stream_file(const Args& args, const AppConfig& conf, const WavAudio& wav) {
    const sigvad::DetectorConfig cfg = make_detector_config(conf, wav.sample_rate);
    if (args.verbose) print_config(cfg, wav.sample_rate);

    sigvad::OnlineSegmenter seg(cfg, wav.sample_rate);
    RunLog log(conf.db_path, *args.input, wav.sample_rate);
    std::vector<sigvad::Segment> all;

    const std::size_t chunk = *args.stream_chunk;
    for (std::size_t off = 0; off < wav.samples.size() && !g_stop.load(); off += chunk) {
        const std::size_t n = std::min(chunk, wav.samples.size() - off);
        for (const auto& s : seg.push(wav.samples.data() + off, n)) {
            if (!args.json) print_segment(s);
            log.add(s);
            all.push_back(s);
        }
    }
    for (const auto& s : seg.flush()) {
        if (!args.json) print_segment(s);
        log.add(s);
        all.push_back(s);
    }
    log.finish();

    if (args.json) print_json(*args.input, wav.sample_rate, "speech", all);
    if (args.verbose) {
        std::cerr << seg.frames_processed() << " frames, final reference "
                  << seg.current_reference().value_or(0.0) << "\n";
    }
    return 0;
}

static int run_mic(const Args& args, const AppConfig& conf) {
    const int sample_rate = capture_sample_rate(conf);
    const sigvad::DetectorConfig cfg = make_detector_config(conf, sample_rate);
    print_config(cfg, sample_rate);
    if (!cfg.reference_level) {
        std::cerr << "Note: no fixed reference; the threshold follows the loudest frame so far.\n"
                  << "      Calibrate one with --save-ref on a recording and pass --ref-profile.\n";
    }

    sigvad::OnlineSegmenter seg(cfg, sample_rate);
    RunLog log(conf.db_path, "mic", sample_rate);

    // Written by the PortAudio thread, drained by this one.
    std::mutex mu;
    std::vector<sigvad::Segment> ready;
    std::optional<std::string> callback_error;
    std::atomic<bool> speaking{false};

    // Declared last so the stream is aborted before anything its callback touches.
    AudioInput ai;
    const int device = ai.resolve_device(conf.device);
    std::cout << "Using input device: " << format_device(ai.device_info(device)) << "\n";

    AudioParams params;
    params.sample_rate = sample_rate;
    params.frames_per_buffer = conf.frames_per_buffer.value_or(kDefaultFramesPerBuffer);
    params.device_index = device;

    ai.open(params, [&](const float* data, std::size_t frames) {
        try {
            auto closed = seg.push(data, frames);
            speaking.store(seg.state().open_start.has_value(), std::memory_order_relaxed);
            if (!closed.empty()) {
                std::lock_guard<std::mutex> lock(mu);
                ready.insert(ready.end(), closed.begin(), closed.end());
            }
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mu);
            callback_error = e.what();
            g_stop.store(true);
        }
    });
    ai.start();

    std::cout << "Capturing mic + VAD… (Ctrl+C to stop)\n";
    auto drain = [&]() {
        std::vector<sigvad::Segment> batch;
        {
            std::lock_guard<std::mutex> lock(mu);
            batch.swap(ready);
        }
        for (const auto& s : batch) {
            std::cout << "\r[segment] ";
            print_segment(s);
            log.add(s);
        }
    };
    while (!g_stop.load()) {
        drain();
        std::cout << (speaking.load() ? "[SPEECH] " : "[silence]") << "        \r" << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cout << "\nStopping…\n";
    ai.stop();
    drain();

    if (callback_error) {
        log.finish();
        throw std::runtime_error("capture aborted: " + *callback_error);
    }
    for (const auto& s : seg.flush()) {
        std::cout << "[segment] ";
        print_segment(s);
        log.add(s);
    }
    log.finish();
    if (ai.overflow_count() > 0) {
        std::cerr << "Warning: " << ai.overflow_count()
                  << " input overflows; segment times after the first one run early.\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n(see --help)\n";
        return 2;
    }

    if (args.list_devices) {
        try {
            for (const auto& d : AudioInput::list_input_devices()) std::cout << format_device(d) << "\n";
            return 0;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    try {
        const AppConfig file_cfg = load_config_file(args.config_path.value_or(default_config_path()));
        const AppConfig conf = merge(args.cli, file_cfg);

        if (args.mic) return run_mic(args, conf);

        if (args.mel_json) {
            const SpectrogramFile spec = load_spectrogram_file(*args.mel_json);
            AppConfig mel_conf = conf;
            if (!mel_conf.hop_length && spec.hop_length > 0) mel_conf.hop_length = spec.hop_length;
            if (!mel_conf.frame_length && mel_conf.hop_length) mel_conf.frame_length = *mel_conf.hop_length;
            return run_offline(args, mel_conf, *args.mel_json, sigvad::Input(spec.view()), spec.sample_rate);
        }

        const WavAudio wav = read_wav_file(*args.input);
        if (args.verbose) {
            std::cerr << *args.input << ": " << wav.samples.size() << " samples @ " << wav.sample_rate
                      << " Hz, " << wav.channels << " ch, " << wav.bits_per_sample << " bit\n";
        }
        if (args.stream_chunk) return run_stream_file(args, conf, wav);
        return run_offline(args, conf, *args.input,
                           sigvad::Input(sigvad::Signal(wav.samples, wav.sample_rate)), wav.sample_rate);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n(see --help)\n";
        return 2;
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const sigvad::DetectorError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return e.kind() == sigvad::ErrorKind::InvalidConfiguration ? 2 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
