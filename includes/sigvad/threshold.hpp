#pragma once
#include <vector>

namespace sigvad {

enum class FrameLabel : unsigned char { Silence = 0, Speech = 1 };

// Lowest energy the threshold is derived from, so an all-zero reference
// does not turn digital silence into speech.
constexpr double kEnergyFloor = 1e-10;

// Peak of the energies. Throws InvalidInput when empty.
double reference_level(const std::vector<double>& energies);

// reference * 10^(-top_db / 10). The energies are squared amplitudes, so the
// conversion is in the power domain; a different energy definition needs a
// different exponent.
double threshold_from(double reference, double top_db);

// Ties count as speech.
inline FrameLabel classify(double energy, double threshold) {
    return energy >= threshold ? FrameLabel::Speech : FrameLabel::Silence;
}

std::vector<FrameLabel> classify_frames(const std::vector<double>& energies, double threshold);

// Level of `energy` in dB relative to `reference`, both floored at kEnergyFloor.
double power_to_db(double energy, double reference);

} // namespace sigvad
