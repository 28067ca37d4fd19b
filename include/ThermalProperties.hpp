#ifndef THERMAL_PROPERTIES_HPP
#define THERMAL_PROPERTIES_HPP

#include "VFLUX.hpp"

namespace VFLUX {

/**
 * @brief Thermal diffusivity alpha = lambda / C
 * @param conductivity Thermal conductivity [W/(m K)]
 * @param heat_capacity Volumetric heat capacity [J/(m^3 K)]
 * @return Diffusivity [m^2/s]
 * @throws DomainError if either argument is not positive
 */
double diffusivity(double conductivity, double heat_capacity);

/**
 * @brief Build a validated medium; the diffusivity uses the sediment heat capacity
 * @throws DomainError if any constant is not positive
 */
ThermalMedium makeThermalMedium(double thermal_conductivity,
                                double heat_capacity_sediment,
                                double heat_capacity_water);

/**
 * @brief Check a medium filled in by hand
 * @throws DomainError if any of the four constants is not positive
 */
void validateThermalMedium(const ThermalMedium& medium);

// Saturated sand defaults
ThermalMedium defaultThermalMedium();

/// Conductive-only phase lag over dz (Stallman): sqrt(w dz^2 / (4 alpha))
double conductivePhaseLag(double depth_difference, double thermal_diffusivity,
                          double angular_frequency);

/// Advective phase lag over dz produced by flux v: v Cw dz / (2 lambda)
double advectivePhaseLag(double velocity, double depth_difference,
                         const ThermalMedium& medium);

} // namespace VFLUX

#endif // THERMAL_PROPERTIES_HPP
