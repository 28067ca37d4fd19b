#ifndef VFLUX_HPP
#define VFLUX_HPP

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace VFLUX {

// =============================================================================
// Constants
// =============================================================================

constexpr double SECONDS_PER_HOUR = 3600.0;
constexpr double SECONDS_PER_DAY = 86400.0;

/// One diurnal cycle, 2*pi/86400 rad/s
constexpr double DIURNAL_ANGULAR_FREQUENCY = 2.0 * M_PI / SECONDS_PER_DAY;

/// Factor taking a velocity in m/s to mm/day
constexpr double MM_PER_DAY_PER_M_PER_S = 1000.0 * SECONDS_PER_DAY;

inline double undefinedValue() {
    return std::numeric_limits<double>::quiet_NaN();
}

// =============================================================================
// Errors
// =============================================================================

/**
 * @brief Non-physical input (non-positive heat capacity, depth difference,
 * diffusivity or frequency). Fatal to the single call.
 */
class DomainError : public std::invalid_argument {
public:
    explicit DomainError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief The nonlinear harmonic fit did not converge within its budget.
 *
 * Carries the Tao converged reason and the number of iterations performed so
 * the caller can decide whether to retry with another initial guess.
 */
class FitConvergenceError : public std::runtime_error {
public:
    FitConvergenceError(const std::string& what, int reason, int iterations)
        : std::runtime_error(what), reason_(reason), iterations_(iterations) {}

    int reason() const { return reason_; }
    int iterations() const { return iterations_; }

private:
    int reason_;
    int iterations_;
};

// =============================================================================
// Enumerations
// =============================================================================

enum class FluxMethod {
    HATCH_AMPLITUDE,
    HATCH_PHASE,
    KEERY,
    MCCALLUM,
    LUCE
};

enum class FluxStatus {
    COMPUTED,    ///< Governing equation solved directly
    UNDEFINED,   ///< No physical solution for these inputs (velocity is NaN)
    FALLBACK     ///< Value taken from the method's defined fallback
};

enum class UndefinedReason {
    NONE,
    NON_POSITIVE_AMPLITUDE,  ///< A fitted amplitude is <= 0
    NO_ATTENUATION,          ///< Amplitude ratio <= 1
    NO_ADVECTIVE_LAG,        ///< Measured lag does not exceed the conductive lag
    NEGATIVE_DISCRIMINANT    ///< McCallum discriminant < 0
};

/**
 * @brief How the extractor seeds the angular frequency before refinement
 */
enum class FrequencyInit {
    KNOWN_PERIOD,   ///< Caller-supplied expected period (default 24 h)
    FFT_PEAK        ///< Dominant positive bin of the DFT magnitude spectrum
};

// =============================================================================
// Value types
// =============================================================================

/**
 * @brief Thermal properties of the saturated sediment
 *
 * Build with makeThermalMedium(), which rejects non-positive constants.
 */
struct ThermalMedium {
    double thermal_conductivity;     // lambda [W/(m K)]
    double heat_capacity_sediment;   // Cs [J/(m^3 K)]
    double heat_capacity_water;      // Cw [J/(m^3 K)]
    double thermal_diffusivity;      // alpha = lambda / Cs [m^2/s]
};

/**
 * @brief Harmonic parameters of one sensor: T(t) = A + B sin(w t + phi)
 */
struct HarmonicSignal {
    double mean;                  // A [degC]
    double amplitude;             // B [degC], never negative
    double angular_frequency;     // w [rad/s]
    double phase;                 // phi [rad], in [0, 2 pi)

    // Fit diagnostics
    int samples;
    int iterations;
    double rms_residual;          // [degC]
    FrequencyInit frequency_init;

    HarmonicSignal()
        : mean(0.0), amplitude(0.0), angular_frequency(DIURNAL_ANGULAR_FREQUENCY),
          phase(0.0), samples(0), iterations(0), rms_residual(0.0),
          frequency_init(FrequencyInit::KNOWN_PERIOD) {}

    double period() const { return 2.0 * M_PI / angular_frequency; }
};

/**
 * @brief Differenced quantities between a shallow and a deep sensor
 */
struct SensorPairObservation {
    double depth_difference;      // dz > 0 [m]
    double amplitude_log_ratio;   // dA = ln(B_shallow / B_deep), NaN if undefined
    double phase_difference;      // dphi = phi_deep - phi_shallow in (-pi, pi]
    bool frequency_mismatch;      // fitted w differ by more than 5 %
};

/**
 * @brief One method's flux, positive downward (infiltration)
 */
struct FluxEstimate {
    FluxMethod method;
    double velocity;              // [m/s], NaN when undefined
    FluxStatus status;
    UndefinedReason reason;
    bool fallback_used;
    bool provisional;             // Published phase term not yet verified

    FluxEstimate()
        : method(FluxMethod::HATCH_AMPLITUDE), velocity(undefinedValue()),
          status(FluxStatus::UNDEFINED), reason(UndefinedReason::NONE),
          fallback_used(false), provisional(false) {}

    bool isDefined() const { return std::isfinite(velocity); }
    double velocityMmPerDay() const { return velocity * MM_PER_DAY_PER_M_PER_S; }
};

} // namespace VFLUX

#endif // VFLUX_HPP
