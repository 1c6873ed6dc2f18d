#include "spectrogram_file.hpp"
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>

using JsonValue = nlohmann::json;

SpectrogramFile parse_spectrogram_json(const std::string& text) {
    JsonValue json;
    try {
        json = JsonValue::parse(text);
    } catch (const JsonValue::parse_error& e) {
        throw std::runtime_error(std::string("Spectrogram JSON parse error: ") + e.what());
    }

    if (!json.is_object() || !json.contains("frames") || !json["frames"].is_array()) {
        throw std::runtime_error("Spectrogram JSON needs a \"frames\" array");
    }
    if (!json.contains("sample_rate")) {
        throw std::runtime_error("Spectrogram JSON needs \"sample_rate\"");
    }

    SpectrogramFile out;
    try {
        out.sample_rate = json.at("sample_rate").get<int>();
        out.hop_length = json.value("hop_length", 0);

        const std::string scale = json.value("scale", std::string("linear"));
        if (scale == "linear") out.scale = sigvad::SpectrogramScale::Linear;
        else if (scale == "normalized_db") out.scale = sigvad::SpectrogramScale::NormalizedDb;
        else throw std::runtime_error("Unknown spectrogram scale \"" + scale + "\"");

        const auto& frames = json["frames"];
        out.num_frames = frames.size();
        for (const auto& row : frames) {
            if (!row.is_array()) throw std::runtime_error("Spectrogram frame is not an array");
            if (out.data.empty()) {
                out.num_bands = row.size();
                out.data.reserve(out.num_frames * out.num_bands);
            } else if (row.size() != out.num_bands) {
                throw std::runtime_error("Spectrogram rows differ in length (" +
                                         std::to_string(row.size()) + " vs " +
                                         std::to_string(out.num_bands) + ")");
            }
            for (const auto& v : row) out.data.push_back(v.get<float>());
        }
    } catch (const JsonValue::exception& e) {
        throw std::runtime_error(std::string("Malformed spectrogram JSON: ") + e.what());
    }
    return out;
}

SpectrogramFile load_spectrogram_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open spectrogram file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parse_spectrogram_json(content);
}
