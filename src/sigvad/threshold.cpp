#include "sigvad/threshold.hpp"
#include "sigvad/errors.hpp"
#include <algorithm>
#include <cmath>

namespace sigvad {

double reference_level(const std::vector<double>& energies) {
    if (energies.empty()) {
        throw DetectorError(ErrorKind::InvalidInput, "no frame energies to take a reference from");
    }
    return *std::max_element(energies.begin(), energies.end());
}

double threshold_from(double reference, double top_db) {
    if (!std::isfinite(top_db) || top_db < 0.0) {
        throw DetectorError(ErrorKind::InvalidConfiguration, "top_db must be a finite value >= 0");
    }
    if (!std::isfinite(reference) || reference < 0.0) {
        throw DetectorError(ErrorKind::InvalidInput, "reference level must be a finite value >= 0");
    }
    return std::max(reference, kEnergyFloor) * std::pow(10.0, -top_db / 10.0);
}

std::vector<FrameLabel> classify_frames(const std::vector<double>& energies, double threshold) {
    std::vector<FrameLabel> labels;
    labels.reserve(energies.size());
    for (double e : energies) labels.push_back(classify(e, threshold));
    return labels;
}

double power_to_db(double energy, double reference) {
    return 10.0 * std::log10(std::max(energy, kEnergyFloor)) -
           10.0 * std::log10(std::max(reference, kEnergyFloor));
}

} // namespace sigvad
