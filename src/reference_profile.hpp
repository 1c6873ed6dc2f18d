#pragma once
#include "sigvad/config.hpp"
#include <string>

// Fixed reference level calibrated on a previous recording, so a live
// stream can be thresholded the way an offline run over that recording was.
struct ReferenceProfile {
    double reference_level = 0.0;
    double top_db = 0.0;
    int frame_length = 0;
    int hop_length = 0;
    int sample_rate = 0;
};

void save_reference_profile(const std::string& path, const ReferenceProfile& profile);
ReferenceProfile load_reference_profile(const std::string& path);

// Throws std::runtime_error when the profile's energies are not comparable
// with frames produced under `config` at `sample_rate`.
void check_profile_matches(const ReferenceProfile& profile,
                           const sigvad::DetectorConfig& config, int sample_rate);
