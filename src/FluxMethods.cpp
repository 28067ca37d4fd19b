#include "FluxMethods.hpp"
#include "SensorPair.hpp"
#include "ThermalProperties.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace VFLUX {

namespace {

void requirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        std::ostringstream msg;
        msg << name << " must be positive (got " << value << ")";
        throw DomainError(msg.str());
    }
}

FluxEstimate computed(FluxMethod method, double velocity) {
    FluxEstimate est;
    est.method = method;
    est.velocity = velocity;
    est.status = FluxStatus::COMPUTED;
    est.reason = UndefinedReason::NONE;
    return est;
}

FluxEstimate undefinedEstimate(FluxMethod method, UndefinedReason reason) {
    FluxEstimate est;
    est.method = method;
    est.velocity = undefinedValue();
    est.status = FluxStatus::UNDEFINED;
    est.reason = reason;
    return est;
}

// Amplitude checks shared by the ratio-based methods
UndefinedReason amplitudeRatioReason(double amplitude_shallow, double amplitude_deep) {
    if (!(amplitude_shallow > 0.0) || !(amplitude_deep > 0.0)) {
        return UndefinedReason::NON_POSITIVE_AMPLITUDE;
    }
    if (amplitude_shallow / amplitude_deep <= 1.0) {
        return UndefinedReason::NO_ATTENUATION;
    }
    return UndefinedReason::NONE;
}

} // namespace

// =============================================================================
// Method names
// =============================================================================

std::vector<FluxMethod> allFluxMethods() {
    return {FluxMethod::HATCH_AMPLITUDE, FluxMethod::HATCH_PHASE, FluxMethod::KEERY,
            FluxMethod::MCCALLUM, FluxMethod::LUCE};
}

std::string fluxMethodName(FluxMethod method) {
    switch (method) {
        case FluxMethod::HATCH_AMPLITUDE: return "Hatch_Amplitude";
        case FluxMethod::HATCH_PHASE: return "Hatch_Phase";
        case FluxMethod::KEERY: return "Keery";
        case FluxMethod::MCCALLUM: return "McCallum";
        case FluxMethod::LUCE: return "Luce";
    }
    return "Unknown";
}

FluxMethod parseFluxMethod(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    std::replace(upper.begin(), upper.end(), '-', '_');

    if (upper == "HATCH_AMPLITUDE" || upper == "AMPLITUDE") return FluxMethod::HATCH_AMPLITUDE;
    if (upper == "HATCH_PHASE" || upper == "PHASE") return FluxMethod::HATCH_PHASE;
    if (upper == "KEERY") return FluxMethod::KEERY;
    if (upper == "MCCALLUM") return FluxMethod::MCCALLUM;
    if (upper == "LUCE") return FluxMethod::LUCE;

    throw std::invalid_argument("Unknown flux method: " + name);
}

std::string fluxStatusName(FluxStatus status) {
    switch (status) {
        case FluxStatus::COMPUTED: return "computed";
        case FluxStatus::UNDEFINED: return "undefined";
        case FluxStatus::FALLBACK: return "fallback";
    }
    return "unknown";
}

std::string undefinedReasonName(UndefinedReason reason) {
    switch (reason) {
        case UndefinedReason::NONE: return "";
        case UndefinedReason::NON_POSITIVE_AMPLITUDE: return "non-positive amplitude";
        case UndefinedReason::NO_ATTENUATION: return "amplitude ratio <= 1";
        case UndefinedReason::NO_ADVECTIVE_LAG: return "no advective phase lag";
        case UndefinedReason::NEGATIVE_DISCRIMINANT: return "negative discriminant";
    }
    return "unknown";
}

// =============================================================================
// Hatch-Amplitude
// =============================================================================

FluxEstimate hatchAmplitudeFlux(double amplitude_shallow, double amplitude_deep,
                                double depth_difference, double thermal_diffusivity) {
    requirePositive(depth_difference, "depth difference");
    requirePositive(thermal_diffusivity, "thermal diffusivity");

    UndefinedReason reason = amplitudeRatioReason(amplitude_shallow, amplitude_deep);
    if (reason != UndefinedReason::NONE) {
        return undefinedEstimate(FluxMethod::HATCH_AMPLITUDE, reason);
    }

    double log_ratio = amplitudeLogRatio(amplitude_shallow, amplitude_deep);
    return computed(FluxMethod::HATCH_AMPLITUDE,
                    thermal_diffusivity / depth_difference * log_ratio);
}

// =============================================================================
// Hatch-Phase
// =============================================================================

FluxEstimate hatchPhaseFlux(double phase_shallow, double phase_deep,
                            double depth_difference, const ThermalMedium& medium,
                            double angular_frequency) {
    requirePositive(depth_difference, "depth difference");
    requirePositive(medium.thermal_diffusivity, "thermal diffusivity");
    requirePositive(medium.thermal_conductivity, "thermal conductivity");
    requirePositive(medium.heat_capacity_water, "water heat capacity");
    requirePositive(angular_frequency, "angular frequency");

    double lag = phaseLag(phaseDifference(phase_shallow, phase_deep));
    double conductive = conductivePhaseLag(depth_difference, medium.thermal_diffusivity,
                                           angular_frequency);
    double advective = lag - conductive;

    if (!(advective > 0.0)) {
        return undefinedEstimate(FluxMethod::HATCH_PHASE, UndefinedReason::NO_ADVECTIVE_LAG);
    }

    double velocity = advective / depth_difference *
                      (2.0 * medium.thermal_conductivity / medium.heat_capacity_water);
    return computed(FluxMethod::HATCH_PHASE, velocity);
}

// =============================================================================
// Keery
// =============================================================================

FluxEstimate keeryFlux(double amplitude_shallow, double amplitude_deep,
                       double phase_shallow, double phase_deep,
                       double depth_difference, double thermal_diffusivity,
                       double angular_frequency) {
    requirePositive(depth_difference, "depth difference");
    requirePositive(thermal_diffusivity, "thermal diffusivity");
    requirePositive(angular_frequency, "angular frequency");

    FluxEstimate est;
    double log_ratio = amplitudeLogRatio(amplitude_shallow, amplitude_deep);
    if (std::isnan(log_ratio)) {
        est = undefinedEstimate(FluxMethod::KEERY, UndefinedReason::NON_POSITIVE_AMPLITUDE);
    } else {
        double lag = phaseLag(phaseDifference(phase_shallow, phase_deep));
        double beta = std::sqrt(angular_frequency / (2.0 * thermal_diffusivity));
        double beta_dz = beta * depth_difference;
        double velocity = 2.0 * thermal_diffusivity / depth_difference *
                          (log_ratio + beta_dz - lag / beta_dz);
        est = computed(FluxMethod::KEERY, velocity);
    }
    est.provisional = true;
    return est;
}

// =============================================================================
// McCallum
// =============================================================================

FluxEstimate mccallumFlux(double amplitude_shallow, double amplitude_deep,
                          double phase_shallow, double phase_deep,
                          double depth_difference, double thermal_diffusivity,
                          double angular_frequency) {
    requirePositive(depth_difference, "depth difference");
    requirePositive(thermal_diffusivity, "thermal diffusivity");
    requirePositive(angular_frequency, "angular frequency");

    FluxEstimate est;
    double log_ratio = amplitudeLogRatio(amplitude_shallow, amplitude_deep);
    if (std::isnan(log_ratio)) {
        est = undefinedEstimate(FluxMethod::MCCALLUM, UndefinedReason::NON_POSITIVE_AMPLITUDE);
        est.provisional = true;
        return est;
    }

    double lag = phaseLag(phaseDifference(phase_shallow, phase_deep));
    double discriminant = log_ratio * log_ratio +
                          angular_frequency * depth_difference * depth_difference /
                              (4.0 * thermal_diffusivity) -
                          lag * lag;

    if (discriminant < 0.0) {
        FluxEstimate fallback = hatchAmplitudeFlux(amplitude_shallow, amplitude_deep,
                                                   depth_difference, thermal_diffusivity);
        est.method = FluxMethod::MCCALLUM;
        est.velocity = fallback.velocity;
        est.fallback_used = true;
        if (fallback.isDefined()) {
            est.status = FluxStatus::FALLBACK;
            est.reason = UndefinedReason::NEGATIVE_DISCRIMINANT;
        } else {
            est.status = FluxStatus::UNDEFINED;
            est.reason = fallback.reason;
        }
    } else {
        est = computed(FluxMethod::MCCALLUM, thermal_diffusivity / depth_difference *
                                                 (log_ratio + std::sqrt(discriminant)));
    }
    est.provisional = true;
    return est;
}

// =============================================================================
// Luce
// =============================================================================

FluxEstimate luceFlux(double amplitude_shallow, double amplitude_deep,
                      double depth_difference, double angular_frequency) {
    requirePositive(depth_difference, "depth difference");
    requirePositive(angular_frequency, "angular frequency");

    UndefinedReason reason = amplitudeRatioReason(amplitude_shallow, amplitude_deep);
    if (reason != UndefinedReason::NONE) {
        return undefinedEstimate(FluxMethod::LUCE, reason);
    }

    double log_ratio = amplitudeLogRatio(amplitude_shallow, amplitude_deep);
    return computed(FluxMethod::LUCE,
                    angular_frequency * depth_difference / (2.0 * log_ratio));
}

} // namespace VFLUX
