#include "ConfigReader.hpp"
#include "ThermalProperties.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <set>

namespace VFLUX {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    bool ok = parseStream(file);
    file.close();
    return ok;
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream input(content);
    return parseStream(input);
}

bool ConfigReader::parseStream(std::istream& input) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = sectionKey(trim(line.substr(1, line.length() - 2)));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find_first_of("#;");
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::sectionKey(const std::string& section) const {
    std::string key = section;
    std::transform(key.begin(), key.end(), key.begin(), ::toupper);
    return key;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(sectionKey(section));
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer, using " << default_val << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double, using " << default_val << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    for (const auto& token : split(val, ',')) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

std::vector<std::string> ConfigReader::getStringArray(const std::string& section,
                                                      const std::string& key) const {
    return split(getString(section, key), ',');
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& default_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    double parsed_value;
    std::string parsed_unit;
    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "', using default" << std::endl;
        return default_val;
    }

    std::string unit = parsed_unit.empty() ? default_unit : parsed_unit;
    if (unit.empty()) {
        return parsed_value;
    }

    if (!unit_system_.hasUnit(unit)) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - unknown unit '" << unit << "'" << std::endl;
        return default_val;
    }
    if (!default_unit.empty() && !unit_system_.areCompatible(unit, default_unit)) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - '" << unit << "' is not compatible with '"
                  << default_unit << "'" << std::endl;
        return default_val;
    }

    return unit_system_.toBase(parsed_value, unit);
}

std::vector<double> ConfigReader::getDoubleArrayWithUnit(const std::string& section,
                                                         const std::string& key,
                                                         const std::string& default_unit) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    for (const auto& token : split(val, ',')) {
        double parsed_value;
        std::string parsed_unit;

        if (!unit_system_.parseValueWithUnit(token, parsed_value, parsed_unit)) {
            std::cerr << "Warning: Cannot parse '" << token << "' in [" << section
                      << "]:" << key << std::endl;
            continue;
        }

        std::string unit = parsed_unit.empty() ? default_unit : parsed_unit;
        if (unit.empty()) {
            result.push_back(parsed_value);
        } else if (unit_system_.hasUnit(unit)) {
            result.push_back(unit_system_.toBase(parsed_value, unit));
        } else {
            std::cerr << "Warning: Cannot convert '" << token << "': unknown unit '"
                      << unit << "'" << std::endl;
        }
    }

    return result;
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(sectionKey(section)) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(sectionKey(section));
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(sectionKey(section));
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Section Parsing
// =============================================================================

bool ConfigReader::parseMediumConfig(MediumConfig& config) const {
    config = MediumConfig();
    config.thermal_conductivity = getDoubleWithUnit("MEDIUM", "thermal_conductivity",
                                                    config.thermal_conductivity, "W/(m-K)");
    config.heat_capacity_sediment = getDoubleWithUnit("MEDIUM", "heat_capacity_sediment",
                                                      config.heat_capacity_sediment, "J/(m3-K)");
    config.heat_capacity_water = getDoubleWithUnit("MEDIUM", "heat_capacity_water",
                                                   config.heat_capacity_water, "J/(m3-K)");
    return hasSection("MEDIUM");
}

std::vector<std::pair<int, int>> ConfigReader::parsePairs(const std::string& value) const {
    std::vector<std::pair<int, int>> pairs;

    for (const auto& token : split(value, ',')) {
        auto ends = split(token, '-');
        if (ends.size() != 2) {
            std::cerr << "Warning: Invalid sensor pair '" << token << "'" << std::endl;
            continue;
        }
        try {
            pairs.emplace_back(std::stoi(ends[0]) - 1, std::stoi(ends[1]) - 1);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid sensor pair '" << token << "'" << std::endl;
        }
    }

    return pairs;
}

bool ConfigReader::parseSensorConfig(SensorConfig& config) const {
    config = SensorConfig();

    auto names = getStringArray("SENSORS", "names");
    if (!names.empty()) config.names = names;

    // Bare depths are in meters
    if (hasKey("SENSORS", "depths")) {
        config.depths = getDoubleArrayWithUnit("SENSORS", "depths", "m");
    }

    if (hasKey("SENSORS", "pairs")) {
        config.pairs = parsePairs(getString("SENSORS", "pairs"));
    } else {
        const int n = static_cast<int>(config.depths.size());
        for (int i = 0; i < n; ++i) {
            for (int j = i + 1; j < n; ++j) {
                config.pairs.emplace_back(i, j);
            }
        }
    }

    return hasSection("SENSORS");
}

bool ConfigReader::parseAnalysisConfig(AnalysisConfig& config) const {
    config = AnalysisConfig();

    // Bare periods are in hours
    config.period = getDoubleWithUnit("ANALYSIS", "period", config.period, "hr");
    config.frequency_init = getString("ANALYSIS", "frequency_init", config.frequency_init);
    config.angular_frequency = getDoubleWithUnit("ANALYSIS", "angular_frequency",
                                                 config.angular_frequency, "rad/s");
    return hasSection("ANALYSIS");
}

bool ConfigReader::parseFitConfig(FitConfig& config) const {
    config = FitConfig();

    config.max_iterations = getInt("FIT", "max_iterations", config.max_iterations);
    config.gradient_atol = getDouble("FIT", "gradient_atol", config.gradient_atol);
    config.gradient_rtol = getDouble("FIT", "gradient_rtol", config.gradient_rtol);
    config.regularizer_weight = getDouble("FIT", "regularizer_weight", config.regularizer_weight);

    // Either a unit name ("hr") or a duration ("30 min")
    std::string time_unit = getString("FIT", "time_unit");
    if (!time_unit.empty()) {
        if (unit_system_.hasUnit(time_unit) && unit_system_.areCompatible(time_unit, "s")) {
            config.time_unit = unit_system_.toBase(1.0, time_unit);
        } else {
            config.time_unit = getDoubleWithUnit("FIT", "time_unit", config.time_unit, "s");
        }
    }

    return hasSection("FIT");
}

bool ConfigReader::parseInputConfig(InputConfig& config) const {
    config = InputConfig();

    config.file = getString("INPUT", "file", config.file);

    auto temperature_columns = getStringArray("INPUT", "temperature_columns");
    if (!temperature_columns.empty()) {
        config.temperature_columns = temperature_columns;
    } else {
        SensorConfig sensors;
        parseSensorConfig(sensors);
        config.temperature_columns = sensors.names;
    }

    auto time_columns = getStringArray("INPUT", "time_columns");
    if (!time_columns.empty()) {
        config.time_columns = time_columns;
    } else {
        config.time_columns.clear();
        for (size_t i = 0; i < config.temperature_columns.size(); ++i) {
            config.time_columns.push_back("fecha" + std::to_string(i + 1));
        }
    }

    // Bare intervals are in minutes
    config.resample_interval = getDoubleWithUnit("INPUT", "resample_interval",
                                                 config.resample_interval, "min");
    return hasSection("INPUT");
}

bool ConfigReader::parseOutputConfig(OutputConfig& config) const {
    config = OutputConfig();

    config.file = getString("OUTPUT", "file", config.file);
    config.flux_unit = getString("OUTPUT", "flux_unit", config.flux_unit);
    return hasSection("OUTPUT");
}

ThermalMedium ConfigReader::buildMedium() const {
    MediumConfig config;
    parseMediumConfig(config);
    return makeThermalMedium(config.thermal_conductivity, config.heat_capacity_sediment,
                             config.heat_capacity_water);
}

HarmonicFitOptions ConfigReader::buildFitOptions() const {
    AnalysisConfig analysis;
    FitConfig fit;
    parseAnalysisConfig(analysis);
    parseFitConfig(fit);

    HarmonicFitOptions options;
    options.frequency_init = parseFrequencyInit(analysis.frequency_init);
    options.time_unit_seconds = fit.time_unit;
    options.period_hint = analysis.period / fit.time_unit;
    options.max_iterations = fit.max_iterations;
    options.gradient_atol = fit.gradient_atol;
    options.gradient_rtol = fit.gradient_rtol;
    options.regularizer_weight = fit.regularizer_weight;
    return options;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write configuration template: " + filename);
    }

    file << "# VFLUX Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n";
    file << "# Numeric values may carry a unit, e.g. '10 cm' or '24 hr'\n\n";

    file << "[MEDIUM]\n";
    file << "thermal_conductivity = 2.0 W/(m-K)       # lambda\n";
    file << "heat_capacity_sediment = 2.5e6 J/(m3-K)  # Cs, saturated sediment\n";
    file << "heat_capacity_water = 4.18e6 J/(m3-K)    # Cw\n\n";

    file << "[SENSORS]\n";
    file << "names = temp1, temp2, temp3\n";
    file << "depths = 10 cm, 20 cm, 30 cm             # Positive downward\n";
    file << "pairs = 1-2, 2-3, 1-3                    # One-based; default all pairs\n\n";

    file << "[ANALYSIS]\n";
    file << "period = 24 hr                           # Expected period of the signal\n";
    file << "frequency_init = KNOWN_PERIOD            # KNOWN_PERIOD or FFT_PEAK\n";
    file << "# angular_frequency = 7.2722e-5 rad/s    # Used by the flux methods\n\n";

    file << "[FIT]\n";
    file << "max_iterations = 200\n";
    file << "gradient_atol = 1.0e-10\n";
    file << "gradient_rtol = 1.0e-14\n";
    file << "regularizer_weight = 1.0e-8\n";
    file << "time_unit = hr                           # Time unit of the fit\n\n";

    file << "[INPUT]\n";
    file << "file = temperatures.csv\n";
    file << "time_columns = fecha1, fecha2, fecha3    # One shared column or one per sensor\n";
    file << "temperature_columns = temp1, temp2, temp3\n";
    file << "resample_interval = 15 min\n\n";

    file << "[OUTPUT]\n";
    file << "file = flux_results.csv                  # Leave empty for console only\n";
    file << "flux_unit = mm/day\n";

    file.close();
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto error = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    const char* sections[] = {"MEDIUM", "SENSORS", "ANALYSIS", "FIT", "INPUT", "OUTPUT"};
    for (const char* section : sections) {
        if (!hasSection(section)) {
            result.warnings.push_back(std::string("No [") + section + "] section found - using defaults");
        }
    }

    MediumConfig medium;
    parseMediumConfig(medium);
    if (!(medium.thermal_conductivity > 0.0)) error("Thermal conductivity must be positive");
    if (!(medium.heat_capacity_sediment > 0.0)) error("Sediment heat capacity must be positive");
    if (!(medium.heat_capacity_water > 0.0)) error("Water heat capacity must be positive");

    SensorConfig sensors;
    parseSensorConfig(sensors);
    const int n_sensors = static_cast<int>(sensors.depths.size());
    if (sensors.names.size() != sensors.depths.size()) {
        error("Number of sensor names (" + std::to_string(sensors.names.size()) +
              ") does not match number of depths (" + std::to_string(n_sensors) + ")");
    }
    if (n_sensors < 2) {
        error("At least two sensor depths are required");
    }
    std::set<double> unique_depths(sensors.depths.begin(), sensors.depths.end());
    if (static_cast<int>(unique_depths.size()) != n_sensors) {
        error("Sensor depths must be distinct");
    }
    for (const auto& pair : sensors.pairs) {
        if (pair.first < 0 || pair.first >= n_sensors ||
            pair.second < 0 || pair.second >= n_sensors) {
            error("Sensor pair " + std::to_string(pair.first + 1) + "-" +
                  std::to_string(pair.second + 1) + " refers to a missing sensor");
        } else if (pair.first == pair.second) {
            error("Sensor pair " + std::to_string(pair.first + 1) + "-" +
                  std::to_string(pair.second + 1) + " pairs a sensor with itself");
        }
    }
    if (hasKey("SENSORS", "pairs") && sensors.pairs.empty()) {
        result.warnings.push_back("No valid sensor pairs configured");
    }

    AnalysisConfig analysis;
    parseAnalysisConfig(analysis);
    if (!(analysis.period > 0.0)) error("Analysis period must be positive");
    if (!(analysis.angular_frequency > 0.0)) error("Angular frequency must be positive");
    std::string init = analysis.frequency_init;
    std::transform(init.begin(), init.end(), init.begin(), ::toupper);
    if (init != "KNOWN_PERIOD" && init != "PERIOD" && init != "FFT_PEAK" && init != "FFT") {
        error("Unknown frequency_init '" + analysis.frequency_init + "'");
    }
    if (std::abs(analysis.period - SECONDS_PER_DAY) > 0.05 * SECONDS_PER_DAY) {
        result.warnings.push_back("Analysis period is not diurnal; the flux methods still use " +
                                  unit_system_.formatValue(analysis.angular_frequency, "rad/s"));
    }

    FitConfig fit;
    parseFitConfig(fit);
    if (fit.max_iterations <= 0) error("max_iterations must be positive");
    if (!(fit.time_unit > 0.0)) error("Fit time unit must be positive");
    if (fit.gradient_atol < 0.0 || fit.gradient_rtol < 0.0) {
        error("Gradient tolerances must not be negative");
    }

    InputConfig input;
    parseInputConfig(input);
    if (!(input.resample_interval > 0.0)) error("Resample interval must be positive");
    if (input.time_columns.size() != 1 &&
        input.time_columns.size() != input.temperature_columns.size()) {
        error("Give one shared time column or one per temperature column");
    }
    if (input.temperature_columns.size() != sensors.names.size()) {
        error("Number of temperature columns does not match number of sensors");
    }

    OutputConfig output;
    parseOutputConfig(output);
    if (!unit_system_.areCompatible(output.flux_unit, "m/s")) {
        error("Flux unit '" + output.flux_unit + "' is not a velocity unit");
    }

    return result;
}

} // namespace VFLUX
