#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "VFLUX.hpp"
#include "HarmonicAnalysis.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <utility>
#include <vector>
#include <fstream>
#include <sstream>

namespace VFLUX {

/**
 * @brief INI-style configuration reader for a flux analysis run
 *
 * Sections: [MEDIUM], [SENSORS], [ANALYSIS], [FIT], [INPUT], [OUTPUT].
 * Numeric values may carry a unit ("10 cm", "24 hr", "2.5 MJ/(m3-K)") and are
 * converted to SI. Missing sections and keys fall back to defaults.
 */
class ConfigReader {
public:
    // =========================================================================
    // Configuration Structures
    // =========================================================================

    struct MediumConfig {
        double thermal_conductivity;     // [W/(m K)]
        double heat_capacity_sediment;   // [J/(m^3 K)]
        double heat_capacity_water;      // [J/(m^3 K)]

        MediumConfig() : thermal_conductivity(2.0), heat_capacity_sediment(2.5e6),
                         heat_capacity_water(4.18e6) {}
    };

    struct SensorConfig {
        std::vector<std::string> names;
        std::vector<double> depths;                  // [m], positive downward
        std::vector<std::pair<int, int>> pairs;      // Zero-based sensor indices

        SensorConfig() : names({"temp1", "temp2", "temp3"}), depths({0.10, 0.20, 0.30}) {}
    };

    struct AnalysisConfig {
        double period;                   // Expected period [s]
        std::string frequency_init;      // KNOWN_PERIOD or FFT_PEAK
        double angular_frequency;        // Frequency used by the methods [rad/s]

        AnalysisConfig() : period(SECONDS_PER_DAY), frequency_init("KNOWN_PERIOD"),
                           angular_frequency(DIURNAL_ANGULAR_FREQUENCY) {}
    };

    struct FitConfig {
        int max_iterations;
        double gradient_atol;
        double gradient_rtol;
        double regularizer_weight;
        double time_unit;                // Length of the fit time unit [s]

        FitConfig() : max_iterations(200), gradient_atol(1e-10), gradient_rtol(1e-14),
                      regularizer_weight(1e-8), time_unit(SECONDS_PER_HOUR) {}
    };

    struct InputConfig {
        std::string file;
        std::vector<std::string> time_columns;         // One shared or one per sensor
        std::vector<std::string> temperature_columns;
        double resample_interval;                      // [s]

        InputConfig() : time_columns({"fecha1", "fecha2", "fecha3"}),
                        temperature_columns({"temp1", "temp2", "temp3"}),
                        resample_interval(900.0) {}
    };

    struct OutputConfig {
        std::string file;                // CSV path, empty for console only
        std::string flux_unit;

        OutputConfig() : flux_unit("mm/day") {}
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    // =========================================================================
    // Constructor/Destructor
    // =========================================================================

    ConfigReader();
    ~ConfigReader() = default;

    bool loadFile(const std::string& filename);

    /// Parse configuration text directly (same syntax as a file)
    bool loadString(const std::string& content);

    // =========================================================================
    // Section Parsing
    // =========================================================================
    //
    // Each parser fills the structure (defaults for anything missing) and
    // returns whether the section was present.

    bool parseMediumConfig(MediumConfig& config) const;
    bool parseSensorConfig(SensorConfig& config) const;
    bool parseAnalysisConfig(AnalysisConfig& config) const;
    bool parseFitConfig(FitConfig& config) const;
    bool parseInputConfig(InputConfig& config) const;
    bool parseOutputConfig(OutputConfig& config) const;

    /**
     * @brief Build a validated medium from the [MEDIUM] section
     * @throws DomainError on non-positive constants
     */
    ThermalMedium buildMedium() const;

    /// Harmonic fit options from [ANALYSIS] and [FIT]
    HarmonicFitOptions buildFitOptions() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;
    std::vector<std::string> getStringArray(const std::string& section,
                                            const std::string& key) const;

    // =========================================================================
    // Unit-Aware Value Accessors (converts to SI base units)
    // =========================================================================

    /**
     * @brief Get double value with automatic unit conversion to SI
     * @param default_val Default value (in SI units)
     * @param default_unit Unit assumed when the value carries none
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                             double default_val = 0.0,
                             const std::string& default_unit = "") const;

    std::vector<double> getDoubleArrayWithUnit(const std::string& section,
                                               const std::string& key,
                                               const std::string& default_unit = "") const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation and Validation
    // =========================================================================

    /// Write an annotated configuration with every key at its default
    static void generateTemplate(const std::string& filename);

    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    UnitSystem unit_system_;

    bool parseStream(std::istream& input);

    // Section names are case-insensitive
    std::string sectionKey(const std::string& section) const;

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;

    // "1-2, 2-3" -> {(0,1), (1,2)}; malformed entries are reported and skipped
    std::vector<std::pair<int, int>> parsePairs(const std::string& value) const;
};

} // namespace VFLUX

#endif // CONFIG_READER_HPP
