#include "config.hpp"
#include "reference_profile.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>

using std::string;

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline string unquote(const string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

static inline string lower(string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static string env_or_home(const char* var, const char* home_suffix) {
    const char* v = std::getenv(var);
    if (v && *v) return v;
    const char* home = std::getenv("HOME");
    return string(home && *home ? home : ".") + home_suffix;
}

std::string expand_path(const std::string& p) {
    if (p.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    return env_or_home("XDG_CONFIG_HOME", "/.config") + "/sigvad/sigvad.toml";
}

std::string default_db_path() {
    return env_or_home("XDG_DATA_HOME", "/.local/share") + "/sigvad/sigvad.db";
}

namespace {

// One `key = value` line being applied; reports errors against its location.
struct Entry {
    const string& path;
    int line;
    string key;
    string value;

    std::runtime_error bad(const char* type) const {
        return std::runtime_error(path + ":" + std::to_string(line) + ": '" + key +
                                  "' expects " + type + ", got '" + value + "'");
    }

    // std::sto* stop at the first bad character; the whole value must parse.
    template <typename T, typename Conv>
    T number(Conv conv, const char* type) const {
        size_t used = 0;
        try {
            T v = conv(value, &used);
            if (used == value.size()) return v;
        } catch (const std::exception&) {
        }
        throw bad(type);
    }

    int as_int() const {
        return number<int>([](const string& s, size_t* u) { return std::stoi(s, u); }, "an integer");
    }
    unsigned long as_ulong() const {
        return number<unsigned long>([](const string& s, size_t* u) { return std::stoul(s, u); },
                                     "an unsigned integer");
    }
    double as_double() const {
        return number<double>([](const string& s, size_t* u) { return std::stod(s, u); }, "a number");
    }
    bool as_bool() const {
        const string v = lower(value);
        if (v == "true" || v == "yes" || v == "1") return true;
        if (v == "false" || v == "no" || v == "0") return false;
        throw bad("a boolean");
    }
};

using Setter = std::function<void(AppConfig&, const Entry&)>;

struct Key {
    const char* name;
    Setter set;
};

const Key kKeys[] = {
    {"top_db",             [](AppConfig& c, const Entry& e) { c.top_db = e.as_double(); }},
    {"frame_length",       [](AppConfig& c, const Entry& e) { c.frame_length = e.as_int(); }},
    {"frame",              [](AppConfig& c, const Entry& e) { c.frame_length = e.as_int(); }},
    {"hop_length",         [](AppConfig& c, const Entry& e) { c.hop_length = e.as_int(); }},
    {"hop",                [](AppConfig& c, const Entry& e) { c.hop_length = e.as_int(); }},
    {"min_speech_frames",  [](AppConfig& c, const Entry& e) { c.min_speech_frames = e.as_int(); }},
    {"min_silence_frames", [](AppConfig& c, const Entry& e) { c.min_silence_frames = e.as_int(); }},
    {"min_speech_sec",     [](AppConfig& c, const Entry& e) { c.min_speech_sec = e.as_double(); }},
    {"min_silence_sec",    [](AppConfig& c, const Entry& e) { c.min_silence_sec = e.as_double(); }},
    {"reference_level",    [](AppConfig& c, const Entry& e) { c.reference_level = e.as_double(); }},
    {"pad_final_frame",    [](AppConfig& c, const Entry& e) { c.pad_final_frame = e.as_bool(); }},
    {"device",             [](AppConfig& c, const Entry& e) { c.device = e.as_int(); }},
    {"sample_rate",        [](AppConfig& c, const Entry& e) { c.sample_rate = e.as_double(); }},
    {"frames_per_buffer",  [](AppConfig& c, const Entry& e) { c.frames_per_buffer = e.as_ulong(); }},
    {"fpb",                [](AppConfig& c, const Entry& e) { c.frames_per_buffer = e.as_ulong(); }},
    {"db_path",            [](AppConfig& c, const Entry& e) { c.db_path = expand_path(e.value); }},
    {"reference_profile",  [](AppConfig& c, const Entry& e) { c.reference_profile = expand_path(e.value); }},
};

} // namespace

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        line = line.substr(0, std::min(line.find('#'), line.find(';')));
        trim_inplace(line);

        // 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        Entry e{path, line_no, lower(line.substr(0, sep)), line.substr(sep + 1)};
        trim_inplace(e.key);
        trim_inplace(e.value);
        if (e.key.empty() || e.value.empty()) continue;
        e.value = unquote(e.value);

        // Unknown keys are ignored.
        for (const auto& k : kKeys) {
            if (e.key == k.name) {
                k.set(cfg, e);
                break;
            }
        }
    }
    return cfg;
}

namespace {

constexpr double kDefaultTopDb = 25.0;
constexpr int kDefaultFrameLength = 1024;
constexpr int kDefaultHopLength = 256;
constexpr double kDefaultMinSpeechSec = 0.40;
constexpr double kDefaultMinSilenceSec = 0.75;
constexpr int kDefaultCaptureRate = 16000;

template <typename T>
std::optional<T> pick(const std::optional<T>& cli, const std::optional<T>& file) {
    return cli ? cli : file;
}

} // namespace

AppConfig merge(const AppConfig& cli, const AppConfig& file) {
    AppConfig m;
    m.top_db = pick(cli.top_db, file.top_db);
    m.frame_length = pick(cli.frame_length, file.frame_length);
    m.hop_length = pick(cli.hop_length, file.hop_length);
    m.min_speech_frames = pick(cli.min_speech_frames, file.min_speech_frames);
    m.min_silence_frames = pick(cli.min_silence_frames, file.min_silence_frames);
    m.min_speech_sec = pick(cli.min_speech_sec, file.min_speech_sec);
    m.min_silence_sec = pick(cli.min_silence_sec, file.min_silence_sec);
    m.reference_level = pick(cli.reference_level, file.reference_level);
    m.pad_final_frame = pick(cli.pad_final_frame, file.pad_final_frame);
    m.device = pick(cli.device, file.device);
    m.sample_rate = pick(cli.sample_rate, file.sample_rate);
    m.frames_per_buffer = pick(cli.frames_per_buffer, file.frames_per_buffer);
    m.db_path = pick(cli.db_path, file.db_path);
    m.reference_profile = pick(cli.reference_profile, file.reference_profile);
    return m;
}

sigvad::DetectorConfig make_detector_config(const AppConfig& c, int sample_rate) {
    sigvad::DetectorConfig cfg;
    cfg.top_db = c.top_db.value_or(kDefaultTopDb);
    cfg.frame_length = c.frame_length.value_or(kDefaultFrameLength);
    cfg.hop_length = c.hop_length.value_or(kDefaultHopLength);
    cfg.pad_final_frame = c.pad_final_frame.value_or(true);
    cfg.validate();

    cfg.min_speech_frames = c.min_speech_frames
        ? *c.min_speech_frames
        : sigvad::frames_for_duration(c.min_speech_sec.value_or(kDefaultMinSpeechSec), cfg.hop_length, sample_rate);
    cfg.min_silence_frames = c.min_silence_frames
        ? *c.min_silence_frames
        : sigvad::frames_for_duration(c.min_silence_sec.value_or(kDefaultMinSilenceSec), cfg.hop_length, sample_rate);

    if (c.reference_profile && c.reference_level) {
        throw ConfigError("--ref and --ref-profile are mutually exclusive");
    }
    if (c.reference_profile) {
        const ReferenceProfile profile = load_reference_profile(*c.reference_profile);
        check_profile_matches(profile, cfg, sample_rate);
        cfg.reference_level = profile.reference_level;
    } else if (c.reference_level) {
        cfg.reference_level = c.reference_level;
    }
    cfg.validate();
    return cfg;
}

int capture_sample_rate(const AppConfig& conf) {
    if (!conf.sample_rate) return kDefaultCaptureRate;
    const double sr = *conf.sample_rate;
    if (!std::isfinite(sr) || sr < 1.0 || sr > static_cast<double>(std::numeric_limits<int>::max()) ||
        sr != std::floor(sr)) {
        throw ConfigError("sample rate must be a whole number of Hz in [1, " +
                          std::to_string(std::numeric_limits<int>::max()) + "], got " + std::to_string(sr));
    }
    return static_cast<int>(sr);
}
