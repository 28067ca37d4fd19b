#include "FluxAggregator.hpp"
#include "FluxMethods.hpp"
#include "SensorPair.hpp"
#include "ThermalProperties.hpp"
#include <sstream>

namespace VFLUX {

// =============================================================================
// FluxReport
// =============================================================================

const FluxEstimate& FluxReport::estimate(FluxMethod method) const {
    auto it = estimates.find(method);
    if (it == estimates.end()) {
        throw std::out_of_range("No estimate for method " + fluxMethodName(method));
    }
    return it->second;
}

std::map<std::string, double> FluxReport::fluxMetersPerSecond() const {
    std::map<std::string, double> result;
    for (const auto& entry : estimates) {
        result[fluxMethodName(entry.first)] = entry.second.velocity;
    }
    return result;
}

std::map<std::string, double> FluxReport::fluxMillimetersPerDay() const {
    std::map<std::string, double> result;
    for (const auto& entry : estimates) {
        result[fluxMethodName(entry.first)] = entry.second.velocityMmPerDay();
    }
    return result;
}

int FluxReport::definedCount() const {
    int count = 0;
    for (const auto& entry : estimates) {
        if (entry.second.isDefined()) count++;
    }
    return count;
}

// =============================================================================
// Aggregation
// =============================================================================

FluxReport computeAllMethods(const HarmonicSignal& shallow,
                             const HarmonicSignal& deep,
                             const ThermalMedium& medium,
                             double depth_difference,
                             double angular_frequency) {
    if (!(angular_frequency > 0.0)) {
        std::ostringstream msg;
        msg << "Angular frequency must be positive (got " << angular_frequency << ")";
        throw DomainError(msg.str());
    }
    validateThermalMedium(medium);

    FluxReport report;
    report.thermal_diffusivity = medium.thermal_diffusivity;
    report.depth_difference = depth_difference;
    report.angular_frequency = angular_frequency;
    report.observation = difference(shallow, deep, depth_difference);

    const double alpha = medium.thermal_diffusivity;
    const double B_s = shallow.amplitude;
    const double B_d = deep.amplitude;
    const double phi_s = shallow.phase;
    const double phi_d = deep.phase;

    report.estimates[FluxMethod::HATCH_AMPLITUDE] =
        hatchAmplitudeFlux(B_s, B_d, depth_difference, alpha);
    report.estimates[FluxMethod::HATCH_PHASE] =
        hatchPhaseFlux(phi_s, phi_d, depth_difference, medium, angular_frequency);
    report.estimates[FluxMethod::KEERY] =
        keeryFlux(B_s, B_d, phi_s, phi_d, depth_difference, alpha, angular_frequency);
    report.estimates[FluxMethod::MCCALLUM] =
        mccallumFlux(B_s, B_d, phi_s, phi_d, depth_difference, alpha, angular_frequency);
    report.estimates[FluxMethod::LUCE] =
        luceFlux(B_s, B_d, depth_difference, angular_frequency);

    return report;
}

FluxReport analyzeSensorPair(const std::vector<double>& time,
                             const std::vector<double>& temperature_shallow,
                             const std::vector<double>& temperature_deep,
                             const ThermalMedium& medium,
                             double depth_difference,
                             const HarmonicFitOptions& options) {
    HarmonicExtractor extractor(options);
    HarmonicSignal shallow = extractor.extract(time, temperature_shallow);
    HarmonicSignal deep = extractor.extract(time, temperature_deep);
    return computeAllMethods(shallow, deep, medium, depth_difference);
}

} // namespace VFLUX
