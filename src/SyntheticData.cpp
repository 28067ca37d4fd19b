#include "SyntheticData.hpp"
#include "HarmonicAnalysis.hpp"
#include "ThermalProperties.hpp"
#include <random>

namespace VFLUX {

SyntheticConfig::SyntheticConfig()
    : flux(5.0 / MM_PER_DAY_PER_M_PER_S),
      names({"temp1", "temp2", "temp3"}),
      depths({0.10, 0.20, 0.30}),
      base_temperatures({20.0, 19.0, 18.0}),
      surface_amplitude(3.0),
      surface_phase(0.0),
      angular_frequency(DIURNAL_ANGULAR_FREQUENCY),
      duration(3.0 * SECONDS_PER_DAY),
      interval(900.0),
      start_epoch(1735689600.0),   // 2025-01-01 00:00:00 UTC
      noise_std(0.0),
      seed(42) {}

void SyntheticConfig::setSensors(const std::vector<std::string>& sensor_names,
                                 const std::vector<double>& sensor_depths) {
    if (sensor_depths.empty() || sensor_names.size() != sensor_depths.size()) {
        throw DomainError("Synthetic sensors need one name per depth");
    }

    names = sensor_names;
    depths = sensor_depths;
    base_temperatures.resize(depths.size());
    for (size_t i = 0; i < depths.size(); ++i) {
        base_temperatures[i] = 20.0 - static_cast<double>(i);
    }
}

SyntheticDataset generateSynthetic(const ThermalMedium& medium, const SyntheticConfig& config) {
    const size_t n_sensors = config.depths.size();
    if (n_sensors == 0 || config.names.size() != n_sensors ||
        config.base_temperatures.size() != n_sensors) {
        throw DomainError("Synthetic sensors need one name, depth and base temperature each");
    }
    if (!(config.interval > 0.0) || !(config.duration > 0.0)) {
        throw DomainError("Synthetic duration and interval must be positive");
    }
    if (!(config.surface_amplitude > 0.0) || !(config.angular_frequency > 0.0)) {
        throw DomainError("Synthetic amplitude and frequency must be positive");
    }
    if (config.noise_std < 0.0) {
        throw DomainError("Noise standard deviation must not be negative");
    }

    const double alpha = medium.thermal_diffusivity;
    const double phase_rate = std::sqrt(config.angular_frequency / (4.0 * alpha));

    SyntheticDataset dataset;
    dataset.record.start_epoch = config.start_epoch;
    dataset.record.names = config.names;

    // 3 days at 15 min gives 288 samples, the end point excluded
    const size_t n_samples = static_cast<size_t>(config.duration / config.interval + 1e-9);
    dataset.record.time.resize(n_samples);
    for (size_t k = 0; k < n_samples; ++k) {
        dataset.record.time[k] = k * config.interval;
    }

    std::mt19937 rng(config.seed);
    std::normal_distribution<double> noise(0.0, config.noise_std > 0.0 ? config.noise_std : 1.0);

    for (size_t i = 0; i < n_sensors; ++i) {
        const double dz = config.depths[i] - config.depths[0];

        HarmonicSignal signal;
        signal.mean = config.base_temperatures[i];
        signal.amplitude = config.surface_amplitude * std::exp(-config.flux * dz / alpha);
        signal.angular_frequency = config.angular_frequency;
        signal.phase = wrapPhase(config.surface_phase + dz * phase_rate +
                                 advectivePhaseLag(config.flux, dz, medium));
        signal.samples = static_cast<int>(n_samples);
        dataset.expected.push_back(signal);

        std::vector<double> values(n_samples);
        for (size_t k = 0; k < n_samples; ++k) {
            values[k] = evaluateHarmonic(signal, dataset.record.time[k]);
            if (config.noise_std > 0.0) values[k] += noise(rng);
        }
        dataset.record.temperatures.push_back(values);
    }

    return dataset;
}

void writeSyntheticCSV(const std::string& path, const SyntheticDataset& dataset) {
    std::vector<std::string> time_columns;
    for (size_t i = 0; i < dataset.record.sensorCount(); ++i) {
        time_columns.push_back("fecha" + std::to_string(i + 1));
    }
    writeTemperatureCSV(path, dataset.record, time_columns);
}

} // namespace VFLUX
