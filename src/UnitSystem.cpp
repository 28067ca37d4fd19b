#include "UnitSystem.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace VFLUX {

// =============================================================================
// Dimension
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    const double exponents[4] = {L, M, T, Theta};
    const char* symbols[4] = {"L", "M", "T", "Theta"};

    bool first = true;
    for (int k = 0; k < 4; ++k) {
        if (std::abs(exponents[k]) < 1e-10) continue;
        if (!first) ss << " ";
        ss << symbols[k];
        if (std::abs(exponents[k] - 1.0) > 1e-10) ss << "^" << exponents[k];
        first = false;
    }

    return first ? "dimensionless" : ss.str();
}

// =============================================================================
// UnitSystem
// =============================================================================

UnitSystem::UnitSystem() {
    initializeDatabase();
}

void UnitSystem::initializeDatabase() {
    addLengthUnits();
    addTimeUnits();
    addVelocityUnits();
    addAngleUnits();
    addAngularFrequencyUnits();
    addTemperatureUnits();
    addThermalUnits();
}

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0, 0, 0);

    registerUnit(Unit("meter", "m", length, 1.0, "length"));
    registerUnit(Unit("centimeter", "cm", length, 0.01, "length"));
    registerUnit(Unit("millimeter", "mm", length, 0.001, "length"));
    registerUnit(Unit("foot", "ft", length, 0.3048, "length"));
    registerUnit(Unit("inch", "in", length, 0.0254, "length"));
}

void UnitSystem::addTimeUnits() {
    Dimension time(0, 0, 1, 0);

    registerUnit(Unit("second", "s", time, 1.0, "time"));
    registerUnit(Unit("minute", "min", time, 60.0, "time"));

    Unit hour("hour", "hr", time, 3600.0, "time");
    hour.aliases = {"h", "hours"};
    registerUnit(hour);

    Unit day("day", "day", time, 86400.0, "time");
    day.aliases = {"d", "days"};
    registerUnit(day);
}

void UnitSystem::addVelocityUnits() {
    Dimension velocity(1, 0, -1, 0);

    registerUnit(Unit("meter per second", "m/s", velocity, 1.0, "velocity"));
    registerUnit(Unit("centimeter per second", "cm/s", velocity, 0.01, "velocity"));
    registerUnit(Unit("meter per day", "m/day", velocity, 1.0 / 86400.0, "velocity"));
    registerUnit(Unit("centimeter per day", "cm/day", velocity, 0.01 / 86400.0, "velocity"));

    Unit mm_day("millimeter per day", "mm/day", velocity, 0.001 / 86400.0, "velocity");
    mm_day.aliases = {"mm/d"};
    registerUnit(mm_day);
}

void UnitSystem::addAngleUnits() {
    Dimension angle(0, 0, 0, 0);

    registerUnit(Unit("radian", "rad", angle, 1.0, "angle"));
    registerUnit(Unit("degree", "deg", angle, M_PI / 180.0, "angle"));
}

void UnitSystem::addAngularFrequencyUnits() {
    Dimension rate(0, 0, -1, 0);

    registerUnit(Unit("radian per second", "rad/s", rate, 1.0, "angular_frequency"));
    registerUnit(Unit("radian per hour", "rad/hr", rate, 1.0 / 3600.0, "angular_frequency"));
    registerUnit(Unit("radian per day", "rad/day", rate, 1.0 / 86400.0, "angular_frequency"));
}

void UnitSystem::addTemperatureUnits() {
    Dimension temperature(0, 0, 0, 1);

    registerUnit(Unit("kelvin", "K", temperature, 1.0, "temperature"));

    // 0 degC = 273.15 K
    Unit celsius("celsius", "degC", temperature, 1.0, "temperature");
    celsius.offset = 273.15;
    celsius.aliases = {"C"};
    registerUnit(celsius);

    // 0 degF = 459.67 degR = 255.372 K
    Unit fahrenheit("fahrenheit", "degF", temperature, 5.0 / 9.0, "temperature");
    fahrenheit.offset = 459.67;
    registerUnit(fahrenheit);
}

void UnitSystem::addThermalUnits() {
    // W/(m K) = kg m s^-3 K^-1
    Dimension conductivity(1, 1, -3, -1);
    registerUnit(Unit("watt per meter kelvin", "W/(m-K)", conductivity, 1.0,
                      "thermal_conductivity"));
    registerUnit(Unit("BTU per hour foot fahrenheit", "BTU/(hr-ft-degF)",
                      conductivity, 1.7307346563862, "thermal_conductivity"));

    // J/(m^3 K) = kg m^-1 s^-2 K^-1
    Dimension heat_capacity(-1, 1, -2, -1);
    registerUnit(Unit("joule per cubic meter kelvin", "J/(m3-K)", heat_capacity, 1.0,
                      "volumetric_heat_capacity"));
    registerUnit(Unit("megajoule per cubic meter kelvin", "MJ/(m3-K)", heat_capacity, 1.0e6,
                      "volumetric_heat_capacity"));

    Dimension diffusivity(2, 0, -1, 0);
    registerUnit(Unit("square meter per second", "m2/s", diffusivity, 1.0, "diffusivity"));
    registerUnit(Unit("square centimeter per second", "cm2/s", diffusivity, 1.0e-4, "diffusivity"));
    registerUnit(Unit("square meter per day", "m2/day", diffusivity, 1.0 / 86400.0, "diffusivity"));
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    std::string key = toLowerCase(unit.name);
    units_[key] = unit;

    // Symbols are stored as written and in lowercase
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
        units_[toLowerCase(unit.symbol)] = unit;
    }

    for (const auto& alias : unit.aliases) {
        units_[alias] = unit;
        units_[toLowerCase(alias)] = unit;
    }

    if (!unit.category.empty()) {
        categories_[unit.category].push_back(key);
    }
}

std::string UnitSystem::toLowerCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string UnitSystem::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    std::string key = trim(name_or_symbol);

    auto it = units_.find(key);
    if (it != units_.end()) {
        return &(it->second);
    }

    it = units_.find(toLowerCase(key));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);

    if (!from) {
        throw std::runtime_error("Unknown source unit: " + from_unit);
    }
    if (!to) {
        throw std::runtime_error("Unknown destination unit: " + to_unit);
    }

    if (from->dimension != to->dimension) {
        throw std::runtime_error("Incompatible dimensions: " +
                                 from->dimension.toString() + " vs " +
                                 to->dimension.toString());
    }

    return to->convertFromBase(from->convertToBase(value));
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + from_unit);
    }
    return unit->convertToBase(value);
}

double UnitSystem::fromBase(double value, const std::string& to_unit) const {
    const Unit* unit = getUnit(to_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + to_unit);
    }
    return unit->convertFromBase(value);
}

// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    const char* begin = trimmed.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (end == begin) return false;

    // strtod also accepts "inf" and "nan"; only plain numbers are values here
    if (!std::isfinite(parsed)) return false;

    value = parsed;
    unit = trim(std::string(end));
    return true;
}

double UnitSystem::parseAndConvertToBase(const std::string& value_with_unit) const {
    double value;
    std::string unit;

    if (!parseValueWithUnit(value_with_unit, value, unit)) {
        throw std::runtime_error("Failed to parse: " + value_with_unit);
    }

    if (unit.empty()) {
        return value;
    }

    return toBase(value, unit);
}

// =============================================================================
// Dimensional Analysis
// =============================================================================

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* u1 = getUnit(unit1);
    const Unit* u2 = getUnit(unit2);

    if (!u1 || !u2) return false;
    return u1->dimension == u2->dimension;
}

// =============================================================================
// Formatting
// =============================================================================

std::string UnitSystem::formatValue(double value, const std::string& unit,
                                    int precision) const {
    std::stringstream ss;
    ss << std::setprecision(precision) << value << " " << unit;
    return ss.str();
}

} // namespace VFLUX
