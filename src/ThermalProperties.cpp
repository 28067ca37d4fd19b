#include "ThermalProperties.hpp"
#include <sstream>

namespace VFLUX {

namespace {

void requirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        std::ostringstream msg;
        msg << name << " must be positive and finite (got " << value << ")";
        throw DomainError(msg.str());
    }
}

} // namespace

double diffusivity(double conductivity, double heat_capacity) {
    requirePositive(conductivity, "thermal conductivity");
    requirePositive(heat_capacity, "heat capacity");
    return conductivity / heat_capacity;
}

ThermalMedium makeThermalMedium(double thermal_conductivity,
                                double heat_capacity_sediment,
                                double heat_capacity_water) {
    requirePositive(heat_capacity_water, "water heat capacity");

    ThermalMedium medium;
    medium.thermal_conductivity = thermal_conductivity;
    medium.heat_capacity_sediment = heat_capacity_sediment;
    medium.heat_capacity_water = heat_capacity_water;
    medium.thermal_diffusivity = diffusivity(thermal_conductivity, heat_capacity_sediment);
    return medium;
}

void validateThermalMedium(const ThermalMedium& medium) {
    requirePositive(medium.thermal_conductivity, "thermal conductivity");
    requirePositive(medium.heat_capacity_sediment, "sediment heat capacity");
    requirePositive(medium.heat_capacity_water, "water heat capacity");
    requirePositive(medium.thermal_diffusivity, "thermal diffusivity");
}

ThermalMedium defaultThermalMedium() {
    return makeThermalMedium(2.0, 2.5e6, 4.18e6);
}

double conductivePhaseLag(double depth_difference, double thermal_diffusivity,
                          double angular_frequency) {
    requirePositive(depth_difference, "depth difference");
    requirePositive(thermal_diffusivity, "thermal diffusivity");
    requirePositive(angular_frequency, "angular frequency");
    return std::sqrt(angular_frequency * depth_difference * depth_difference /
                     (4.0 * thermal_diffusivity));
}

double advectivePhaseLag(double velocity, double depth_difference,
                         const ThermalMedium& medium) {
    return velocity * medium.heat_capacity_water * depth_difference /
           (2.0 * medium.thermal_conductivity);
}

} // namespace VFLUX
