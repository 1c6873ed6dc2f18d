#include "reference_profile.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>

using JsonValue = nlohmann::json;

void save_reference_profile(const std::string& path, const ReferenceProfile& profile) {
    JsonValue json = {
        {"reference_level", profile.reference_level},
        {"top_db", profile.top_db},
        {"frame_length", profile.frame_length},
        {"hop_length", profile.hop_length},
        {"sample_rate", profile.sample_rate},
    };

    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write reference profile: " + path);
    }
    out << json.dump(2) << "\n";
}

ReferenceProfile load_reference_profile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open reference profile: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    ReferenceProfile profile;
    try {
        JsonValue json = JsonValue::parse(content);
        profile.reference_level = json.at("reference_level").get<double>();
        profile.top_db = json.value("top_db", 0.0);
        profile.frame_length = json.at("frame_length").get<int>();
        profile.hop_length = json.at("hop_length").get<int>();
        profile.sample_rate = json.at("sample_rate").get<int>();
    } catch (const JsonValue::exception& e) {
        throw std::runtime_error("Malformed reference profile " + path + ": " + e.what());
    }
    if (!std::isfinite(profile.reference_level) || profile.reference_level < 0.0) {
        throw std::runtime_error("Reference profile " + path + " has an invalid reference_level");
    }
    return profile;
}

void check_profile_matches(const ReferenceProfile& profile,
                           const sigvad::DetectorConfig& config, int sample_rate) {
    if (profile.frame_length != config.frame_length || profile.hop_length != config.hop_length) {
        throw std::runtime_error("Reference profile was calibrated with frame/hop " +
                                 std::to_string(profile.frame_length) + "/" +
                                 std::to_string(profile.hop_length) + ", active config uses " +
                                 std::to_string(config.frame_length) + "/" +
                                 std::to_string(config.hop_length));
    }
    if (profile.sample_rate != sample_rate) {
        throw std::runtime_error("Reference profile was calibrated at " +
                                 std::to_string(profile.sample_rate) + " Hz, input is " +
                                 std::to_string(sample_rate) + " Hz");
    }
}
