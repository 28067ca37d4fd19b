#ifndef FLUX_METHODS_HPP
#define FLUX_METHODS_HPP

#include "VFLUX.hpp"
#include <string>
#include <vector>

namespace VFLUX {

// =============================================================================
// Method names
// =============================================================================

/// All methods in report order
std::vector<FluxMethod> allFluxMethods();

std::string fluxMethodName(FluxMethod method);
FluxMethod parseFluxMethod(const std::string& name);
std::string fluxStatusName(FluxStatus status);
std::string undefinedReasonName(UndefinedReason reason);

// =============================================================================
// Analytical inversions
// =============================================================================
//
// Shared conventions: amplitudes in degC, phases in rad as fitted (the
// difference is normalized internally), dz = z_deep - z_shallow > 0 [m],
// alpha [m^2/s], w [rad/s]. Velocities are positive downward.
//
// A non-positive dz, alpha or w throws DomainError. Inputs for which the
// governing equation has no physical solution return an estimate with a NaN
// velocity, status UNDEFINED and a reason code.

/**
 * @brief Hatch et al. (2006), amplitude ratio
 *
 * v = (alpha / dz) ln(Ar), Ar = B_shallow / B_deep. Undefined when Ar <= 1.
 */
FluxEstimate hatchAmplitudeFlux(double amplitude_shallow, double amplitude_deep,
                                double depth_difference, double thermal_diffusivity);

/**
 * @brief Hatch et al. (2006), phase lag
 *
 * The measured lag is split into a conductive part sqrt(w dz^2 / (4 alpha))
 * and an advective remainder phi_adv; v = (phi_adv / dz)(2 lambda / Cw).
 * Undefined (NO_ADVECTIVE_LAG) when phi_adv <= 0.
 */
FluxEstimate hatchPhaseFlux(double phase_shallow, double phase_deep,
                            double depth_difference, const ThermalMedium& medium,
                            double angular_frequency);

/**
 * @brief Keery et al. (2007), combined amplitude and phase
 *
 * beta = sqrt(w / (2 alpha));
 * v = (2 alpha / dz) [ln(Ar) + beta dz - lag / (beta dz)].
 * Uses the published phase term and is flagged provisional.
 */
FluxEstimate keeryFlux(double amplitude_shallow, double amplitude_deep,
                       double phase_shallow, double phase_deep,
                       double depth_difference, double thermal_diffusivity,
                       double angular_frequency);

/**
 * @brief McCallum et al. (2012), combined amplitude and phase
 *
 * D = dA^2 + w dz^2 / (4 alpha) - lag^2, v = (alpha / dz)(dA + sqrt(D)).
 * When D < 0 the estimate is the Hatch-Amplitude value for the same inputs,
 * with fallback_used set. Flagged provisional.
 */
FluxEstimate mccallumFlux(double amplitude_shallow, double amplitude_deep,
                          double phase_shallow, double phase_deep,
                          double depth_difference, double thermal_diffusivity,
                          double angular_frequency);

/**
 * @brief Luce et al. (2013), amplitude only
 *
 * v = w dz / (2 ln(Ar)). Undefined when Ar <= 1.
 */
FluxEstimate luceFlux(double amplitude_shallow, double amplitude_deep,
                      double depth_difference, double angular_frequency);

} // namespace VFLUX

#endif // FLUX_METHODS_HPP
