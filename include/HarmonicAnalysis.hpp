#ifndef HARMONIC_ANALYSIS_HPP
#define HARMONIC_ANALYSIS_HPP

#include "VFLUX.hpp"
#include <petsc.h>
#include <petsctao.h>
#include <string>
#include <vector>

namespace VFLUX {

FrequencyInit parseFrequencyInit(const std::string& name);
std::string frequencyInitName(FrequencyInit init);

/**
 * @brief Options for the single-frequency harmonic fit
 *
 * Times passed to the extractor are in an arbitrary unit whose length in
 * seconds is time_unit_seconds (hours by default). The period hint is given
 * in that same unit.
 */
struct HarmonicFitOptions {
    FrequencyInit frequency_init;
    double period_hint;              // Expected period [time units]
    double time_unit_seconds;        // Seconds per time unit

    // Tao budget and tolerances
    int max_iterations;
    double gradient_atol;
    double gradient_rtol;
    double regularizer_weight;       // TAOBRGN proximal weight
    std::string options_prefix;      // Command-line prefix, e.g. -harmonic_tao_monitor

    HarmonicFitOptions()
        : frequency_init(FrequencyInit::KNOWN_PERIOD), period_hint(24.0),
          time_unit_seconds(SECONDS_PER_HOUR), max_iterations(200),
          gradient_atol(1e-10), gradient_rtol(1e-14), regularizer_weight(1e-8),
          options_prefix("harmonic_") {}
};

/**
 * @brief One-sided amplitude spectrum of a mean-removed series
 *
 * Frequencies are in cycles per time unit of the sampling interval; only
 * strictly positive bins are kept. Amplitudes are scaled as 2|Y_k|/n so that
 * a pure sinusoid of amplitude B shows a peak of height B.
 *
 * Power-of-two lengths use a radix-2 FFT, O(n log n). Other lengths are
 * summed directly in O(n^2); resample records much longer than 10^4 samples
 * to a power-of-two length before using FrequencyInit::FFT_PEAK.
 */
struct Spectrum {
    std::vector<double> frequencies;
    std::vector<double> amplitudes;
};

Spectrum computeSpectrum(const std::vector<double>& values, double sampling_interval);

/// Frequency of the largest positive bin [cycles per time unit]
double dominantFrequency(const std::vector<double>& values, double sampling_interval);

/// A + B sin(w t + phi), all in consistent units
double harmonicModel(double t, double mean, double amplitude,
                     double angular_frequency, double phase);

/// Evaluate a fitted signal at time t [s]
double evaluateHarmonic(const HarmonicSignal& signal, double t_seconds);

/// Wrap an angle into [0, 2 pi)
double wrapPhase(double phase);

/**
 * @brief Canonical form of a harmonic parameter set
 *
 * A negative frequency is flipped (w -> |w|, phi -> -phi, B -> -B), then a
 * negative amplitude becomes |B| with phi + pi. The phase is wrapped into
 * [0, 2 pi). The model values are unchanged. Frequency units are preserved.
 */
HarmonicSignal normalizeHarmonic(double mean, double amplitude,
                                 double angular_frequency, double phase);

/**
 * @brief Fits T(t) = A + B sin(w t + phi) to one sensor's series
 *
 * The frequency is seeded from the selected policy, (A, B, phi) from a linear
 * least-squares solve at that frequency, and all four parameters are refined
 * with Tao's regularized Gauss-Newton solver (TAOBRGN). PETSc must be
 * initialized by the caller. Each call owns its Tao objects on PETSC_COMM_SELF.
 */
class HarmonicExtractor {
public:
    HarmonicExtractor();
    explicit HarmonicExtractor(const HarmonicFitOptions& options);

    void setOptions(const HarmonicFitOptions& options) { options_ = options; }
    const HarmonicFitOptions& getOptions() const { return options_; }

    /**
     * @brief Fit one series
     * @param time Strictly increasing sample times [time units]
     * @param temperature Temperatures [degC], same length
     * @return Normalized signal with the angular frequency in rad/s
     * @throws DomainError on invalid input
     * @throws FitConvergenceError if Tao does not converge
     */
    HarmonicSignal extract(const std::vector<double>& time,
                           const std::vector<double>& temperature) const;

    /// Initial angular frequency [rad per time unit] under the current policy
    double initialAngularFrequency(const std::vector<double>& time,
                                   const std::vector<double>& temperature) const;

    /**
     * @brief Linear least-squares (A, B, phi) at a fixed frequency
     * @return {A, B, w, phi} with B >= 0
     */
    std::vector<double> linearInitialGuess(const std::vector<double>& time,
                                           const std::vector<double>& temperature,
                                           double angular_frequency) const;

private:
    HarmonicFitOptions options_;

    void validateInput(const std::vector<double>& time,
                       const std::vector<double>& temperature) const;

    PetscErrorCode solve(const std::vector<double>& time,
                         const std::vector<double>& temperature,
                         std::vector<double>& params,
                         TaoConvergedReason& reason,
                         PetscInt& iterations,
                         PetscReal& residual_norm) const;
};

/**
 * @brief Convenience wrapper around HarmonicExtractor
 */
HarmonicSignal extractHarmonic(const std::vector<double>& time,
                               const std::vector<double>& temperature,
                               const HarmonicFitOptions& options = HarmonicFitOptions());

} // namespace VFLUX

#endif // HARMONIC_ANALYSIS_HPP
