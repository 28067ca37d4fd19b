#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <stdexcept>
#include <cmath>

namespace VFLUX {

/**
 * @brief Unit dimension as exponents of Length, Mass, Time and Temperature
 *
 * Angles are dimensionless, so rad/s and 1/s share a dimension.
 */
struct Dimension {
    double L;      // Length exponent
    double M;      // Mass exponent
    double T;      // Time exponent
    double Theta;  // Temperature exponent

    Dimension(double length = 0, double mass = 0, double time = 0, double temperature = 0)
        : L(length), M(mass), T(time), Theta(temperature) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(M - other.M) < 1e-10 &&
                std::abs(T - other.T) < 1e-10 &&
                std::abs(Theta - other.Theta) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    std::string toString() const;
};

/**
 * @brief Unit definition with conversion to base SI (m, kg, s, K)
 *
 * base = (value + offset) * to_base. The offset is non-zero only for the
 * relative temperature scales.
 */
struct Unit {
    std::string name;           // Full name (e.g., "millimeter per day")
    std::string symbol;         // Short symbol (e.g., "mm/day")
    Dimension dimension;
    double to_base;
    double offset;
    std::string category;
    std::vector<std::string> aliases;

    Unit() : to_base(1.0), offset(0.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "")
        : name(n), symbol(s), dimension(d), to_base(factor), offset(0.0), category(cat) {}

    double convertToBase(double value) const {
        return (value + offset) * to_base;
    }

    double convertFromBase(double value) const {
        return value / to_base - offset;
    }
};

/**
 * @brief Unit database for streambed heat-tracing quantities
 *
 * Covers length, time, velocity (including mm/day), angle, angular
 * frequency, temperature, thermal conductivity, volumetric heat capacity and
 * thermal diffusivity. Values such as "10 cm" or "24 hr" are parsed and
 * converted to base SI.
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Get unit by name, symbol or alias
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    bool hasUnit(const std::string& name_or_symbol) const;

    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws std::runtime_error if a unit is unknown or the dimensions differ
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    /// Convert value to base SI
    double toBase(double value, const std::string& from_unit) const;

    /// Convert value from base SI
    double fromBase(double value, const std::string& to_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Split "<number> <unit>" into its parts
     * @param[out] value Number as written (not converted)
     * @param[out] unit Unit string, empty if none was given
     * @return false if no number could be read
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    /**
     * @brief Parse "<number> [unit]" and convert to base SI
     *
     * A bare number is taken to be in base SI already.
     * @throws std::runtime_error on a malformed value or unknown unit
     */
    double parseAndConvertToBase(const std::string& value_with_unit) const;

    // =========================================================================
    // Dimensional Analysis
    // =========================================================================

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    // =========================================================================
    // Formatting
    // =========================================================================

    std::string formatValue(double value, const std::string& unit,
                            int precision = 6) const;

private:
    std::map<std::string, Unit> units_;
    std::map<std::string, std::vector<std::string>> categories_;

    void initializeDatabase();

    void addLengthUnits();
    void addTimeUnits();
    void addVelocityUnits();
    void addAngleUnits();
    void addAngularFrequencyUnits();
    void addTemperatureUnits();
    void addThermalUnits();

    void registerUnit(const Unit& unit);

    std::string toLowerCase(const std::string& str) const;
    std::string trim(const std::string& str) const;
};

/**
 * @brief Global unit system instance
 */
class UnitSystemManager {
public:
    static UnitSystem& getInstance() {
        static UnitSystem instance;
        return instance;
    }

private:
    UnitSystemManager() = default;
};

inline double toSI(double value, const std::string& unit) {
    return UnitSystemManager::getInstance().toBase(value, unit);
}

inline double fromSI(double value, const std::string& unit) {
    return UnitSystemManager::getInstance().fromBase(value, unit);
}

} // namespace VFLUX

#endif // UNIT_SYSTEM_HPP
