#ifndef SENSOR_PAIR_HPP
#define SENSOR_PAIR_HPP

#include "VFLUX.hpp"

namespace VFLUX {

/// ln(B_shallow / B_deep), NaN if either amplitude is not positive
double amplitudeLogRatio(double amplitude_shallow, double amplitude_deep);

/// Map an angle into (-pi, pi]
double normalizePhase(double phase);

/// normalizePhase(phi_deep - phi_shallow); positive when the deep sensor lags
double phaseDifference(double phase_shallow, double phase_deep);

/**
 * @brief Non-negative lag in [0, 2 pi)
 *
 * Normalized differences below zero are shifted by 2 pi. The phase methods
 * assume the deep signal trails the shallow one.
 */
double phaseLag(double phase_difference);

/// Relative spread of the two fitted frequencies above which a pair is flagged
const double FREQUENCY_MISMATCH_TOLERANCE = 0.05;

/**
 * @brief Difference two fitted signals over a depth interval
 * @param shallow Signal of the upper sensor
 * @param deep Signal of the lower sensor
 * @param depth_difference z_deep - z_shallow [m]
 * @throws DomainError if depth_difference is not positive
 *
 * Sets frequency_mismatch when the two angular frequencies differ by more
 * than FREQUENCY_MISMATCH_TOLERANCE. That usually means the series were
 * fitted with different time units; the caller decides how to report it.
 */
SensorPairObservation difference(const HarmonicSignal& shallow,
                                 const HarmonicSignal& deep,
                                 double depth_difference);

} // namespace VFLUX

#endif // SENSOR_PAIR_HPP
