#include "SensorPair.hpp"
#include <algorithm>
#include <sstream>

namespace VFLUX {

double amplitudeLogRatio(double amplitude_shallow, double amplitude_deep) {
    if (!(amplitude_shallow > 0.0) || !(amplitude_deep > 0.0)) {
        return undefinedValue();
    }
    return std::log(amplitude_shallow / amplitude_deep);
}

double normalizePhase(double phase) {
    // Values already in range are returned untouched so the map is exactly
    // idempotent
    if (phase > -M_PI && phase <= M_PI) return phase;

    double wrapped = std::fmod(phase + M_PI, 2.0 * M_PI);
    if (wrapped <= 0.0) wrapped += 2.0 * M_PI;
    return wrapped - M_PI;
}

double phaseDifference(double phase_shallow, double phase_deep) {
    return normalizePhase(phase_deep - phase_shallow);
}

double phaseLag(double phase_difference) {
    double lag = normalizePhase(phase_difference);
    if (lag < 0.0) lag += 2.0 * M_PI;
    return lag;
}

SensorPairObservation difference(const HarmonicSignal& shallow,
                                 const HarmonicSignal& deep,
                                 double depth_difference) {
    if (!(depth_difference > 0.0) || !std::isfinite(depth_difference)) {
        std::ostringstream msg;
        msg << "Depth difference must be positive (got " << depth_difference << ")";
        throw DomainError(msg.str());
    }

    double w_s = shallow.angular_frequency;
    double w_d = deep.angular_frequency;

    SensorPairObservation obs;
    obs.frequency_mismatch = w_s > 0.0 && w_d > 0.0 &&
        std::abs(w_s - w_d) > FREQUENCY_MISMATCH_TOLERANCE * std::max(w_s, w_d);
    obs.depth_difference = depth_difference;
    obs.amplitude_log_ratio = amplitudeLogRatio(shallow.amplitude, deep.amplitude);
    obs.phase_difference = phaseDifference(shallow.phase, deep.phase);
    return obs;
}

} // namespace VFLUX
