#pragma once
#include "sigvad/config.hpp"
#include <optional>
#include <stdexcept>
#include <string>

struct AppConfig {
    std::optional<double> top_db;              // --top-db
    std::optional<int> frame_length;           // --frame
    std::optional<int> hop_length;             // --hop
    std::optional<int> min_speech_frames;      // --min-speech
    std::optional<int> min_silence_frames;     // --min-silence
    std::optional<double> min_speech_sec;      // --min-speech-sec
    std::optional<double> min_silence_sec;     // --min-silence-sec
    std::optional<double> reference_level;     // --ref
    std::optional<bool> pad_final_frame;       // --no-pad

    std::optional<int> device;                 // -d / --device
    std::optional<double> sample_rate;         // --sr
    std::optional<unsigned long> frames_per_buffer; // --fpb / --frames

    std::optional<std::string> db_path;        // --db
    std::optional<std::string> reference_profile; // --ref-profile
};

// Returns $XDG_CONFIG_HOME/sigvad/sigvad.toml or ~/.config/sigvad/sigvad.toml
std::string default_config_path();

// Returns $XDG_DATA_HOME/sigvad/sigvad.db or ~/.local/share/sigvad/sigvad.db
std::string default_db_path();

// Load config file if it exists. Simple TOML/INI-like: key = value
// Supports comments starting with '#' or ';'. Strings may be quoted.
// Missing file returns an empty AppConfig (all optionals disengaged).
// A value that does not parse for its key throws std::runtime_error.
AppConfig load_config_file(const std::string& path);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

// Settings that conflict or cannot be used as given; the CLI reports these
// like bad arguments.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Per-field: command line over config file. Built-in defaults apply later,
// in make_detector_config and capture_sample_rate.
AppConfig merge(const AppConfig& cli, const AppConfig& file);

// Detector settings for input at `sample_rate`. Frame counts win over
// durations in seconds; a reference profile must match frame, hop and rate.
sigvad::DetectorConfig make_detector_config(const AppConfig& conf, int sample_rate);

// Capture rate in Hz, 16000 when unset. Throws ConfigError unless it is a
// whole number in [1, INT_MAX].
int capture_sample_rate(const AppConfig& conf);
