#ifndef SYNTHETIC_DATA_HPP
#define SYNTHETIC_DATA_HPP

#include "VFLUX.hpp"
#include "TemperatureRecord.hpp"
#include <string>
#include <vector>

namespace VFLUX {

/**
 * @brief Parameters of an analytic streambed temperature record
 *
 * Sensor 0 is the reference. Deeper sensor i has
 *   B_i   = B_0 exp(-v (z_i - z_0) / alpha)
 *   phi_i = phi_0 + (z_i - z_0)(sqrt(w / (4 alpha)) + v Cw / (2 lambda))
 * so the amplitude methods and the Hatch phase method both invert to v.
 */
struct SyntheticConfig {
    double flux;                          // Target velocity [m/s], positive downward
    std::vector<std::string> names;
    std::vector<double> depths;           // [m]
    std::vector<double> base_temperatures; // Mean per sensor [degC]
    double surface_amplitude;             // B_0 [degC]
    double surface_phase;                 // phi_0 [rad]
    double angular_frequency;             // [rad/s]
    double duration;                      // [s]
    double interval;                      // [s]
    double start_epoch;                   // Absolute start time [s]
    double noise_std;                     // Gaussian noise [degC], 0 for none
    unsigned int seed;

    SyntheticConfig();

    /**
     * @brief Replace the sensor layout
     *
     * Base temperatures are reset to 20 degC at the first sensor, one degree
     * cooler per sensor below it.
     * @throws DomainError if the names and depths differ in length or are empty
     */
    void setSensors(const std::vector<std::string>& sensor_names,
                    const std::vector<double>& sensor_depths);
};

struct SyntheticDataset {
    TemperatureRecord record;
    std::vector<HarmonicSignal> expected;  // Exact signal per sensor
};

/**
 * @brief Generate the record and the signals it was built from
 * @throws DomainError on inconsistent sizes or non-positive parameters
 */
SyntheticDataset generateSynthetic(const ThermalMedium& medium, const SyntheticConfig& config);

/// Write in the per-sensor layout with time columns fecha1, fecha2, ...
void writeSyntheticCSV(const std::string& path, const SyntheticDataset& dataset);

} // namespace VFLUX

#endif // SYNTHETIC_DATA_HPP
