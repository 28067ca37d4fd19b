#ifndef FLUX_AGGREGATOR_HPP
#define FLUX_AGGREGATOR_HPP

#include "VFLUX.hpp"
#include "HarmonicAnalysis.hpp"
#include <map>
#include <string>
#include <vector>

namespace VFLUX {

/**
 * @brief All five flux estimates for one sensor pair
 */
struct FluxReport {
    double thermal_diffusivity;       // [m^2/s]
    double depth_difference;          // [m]
    double angular_frequency;         // Frequency used by the methods [rad/s]
    SensorPairObservation observation;
    std::map<FluxMethod, FluxEstimate> estimates;

    /// Estimate of one method; throws std::out_of_range if absent
    const FluxEstimate& estimate(FluxMethod method) const;

    /// {method name -> m/s}, NaN for undefined methods
    std::map<std::string, double> fluxMetersPerSecond() const;

    /// {method name -> mm/day}, NaN for undefined methods
    std::map<std::string, double> fluxMillimetersPerDay() const;

    int definedCount() const;
};

/**
 * @brief Run every method on two fitted signals
 *
 * Each method is evaluated independently; an undefined result never blocks the
 * others. The phase term of every method uses angular_frequency, not the
 * fitted frequencies.
 *
 * @throws DomainError if depth_difference or angular_frequency is not positive,
 *         or if the medium carries a non-positive constant
 */
FluxReport computeAllMethods(const HarmonicSignal& shallow,
                             const HarmonicSignal& deep,
                             const ThermalMedium& medium,
                             double depth_difference,
                             double angular_frequency = DIURNAL_ANGULAR_FREQUENCY);

/**
 * @brief Fit both series and compute all methods
 *
 * The series share one time vector in the options' time unit. The methods use
 * the diurnal angular frequency.
 *
 * @throws FitConvergenceError if either fit fails
 */
FluxReport analyzeSensorPair(const std::vector<double>& time,
                             const std::vector<double>& temperature_shallow,
                             const std::vector<double>& temperature_deep,
                             const ThermalMedium& medium,
                             double depth_difference,
                             const HarmonicFitOptions& options = HarmonicFitOptions());

} // namespace VFLUX

#endif // FLUX_AGGREGATOR_HPP
