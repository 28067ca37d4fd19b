#include "HarmonicAnalysis.hpp"
#include <algorithm>
#include <cctype>
#include <complex>
#include <iostream>
#include <numeric>
#include <sstream>

namespace VFLUX {

// =============================================================================
// Policy names
// =============================================================================

FrequencyInit parseFrequencyInit(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "KNOWN_PERIOD" || upper == "PERIOD") return FrequencyInit::KNOWN_PERIOD;
    if (upper == "FFT_PEAK" || upper == "FFT") return FrequencyInit::FFT_PEAK;

    throw std::invalid_argument("Unknown frequency initialization: " + name);
}

std::string frequencyInitName(FrequencyInit init) {
    switch (init) {
        case FrequencyInit::KNOWN_PERIOD: return "KNOWN_PERIOD";
        case FrequencyInit::FFT_PEAK: return "FFT_PEAK";
    }
    return "UNKNOWN";
}

// =============================================================================
// Spectrum
// =============================================================================

namespace {

bool isPowerOfTwo(int n) {
    return n > 0 && (n & (n - 1)) == 0;
}

// Cooley-Tukey, n a power of two
void fftRadix2(const double* input, std::complex<double>* output, int n) {
    if (n == 1) {
        output[0] = std::complex<double>(input[0], 0.0);
        return;
    }

    std::vector<double> even(n / 2), odd(n / 2);
    for (int i = 0; i < n / 2; ++i) {
        even[i] = input[2 * i];
        odd[i] = input[2 * i + 1];
    }

    std::vector<std::complex<double>> even_ft(n / 2), odd_ft(n / 2);
    fftRadix2(even.data(), even_ft.data(), n / 2);
    fftRadix2(odd.data(), odd_ft.data(), n / 2);

    for (int k = 0; k < n / 2; ++k) {
        double angle = -2.0 * M_PI * k / n;
        std::complex<double> w(std::cos(angle), std::sin(angle));
        output[k] = even_ft[k] + w * odd_ft[k];
        output[k + n / 2] = even_ft[k] - w * odd_ft[k];
    }
}

// Single bin k of the DFT, O(n)
std::complex<double> dftBin(const std::vector<double>& x, int k) {
    const int n = static_cast<int>(x.size());
    std::complex<double> sum(0.0, 0.0);
    for (int i = 0; i < n; ++i) {
        double angle = -2.0 * M_PI * static_cast<double>(k) * i / n;
        sum += x[i] * std::complex<double>(std::cos(angle), std::sin(angle));
    }
    return sum;
}

} // namespace

Spectrum computeSpectrum(const std::vector<double>& values, double sampling_interval) {
    if (!(sampling_interval > 0.0)) {
        throw DomainError("Sampling interval must be positive");
    }

    Spectrum spectrum;
    const int n = static_cast<int>(values.size());
    if (n < 2) return spectrum;

    double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
    std::vector<double> centered(values.size());
    for (int i = 0; i < n; ++i) centered[i] = values[i] - mean;

    // Positive bins k = 1 .. ceil(n/2) - 1, matching numpy's fftfreq > 0
    const int n_positive = (n + 1) / 2 - 1;
    spectrum.frequencies.reserve(n_positive);
    spectrum.amplitudes.reserve(n_positive);

    // Padding would move the bins off k / (n dt), so other lengths fall back
    // to the direct sum
    std::vector<std::complex<double>> transform;
    if (isPowerOfTwo(n)) {
        transform.resize(n);
        fftRadix2(centered.data(), transform.data(), n);
    }

    for (int k = 1; k <= n_positive; ++k) {
        std::complex<double> y = transform.empty() ? dftBin(centered, k) : transform[k];
        spectrum.frequencies.push_back(k / (n * sampling_interval));
        spectrum.amplitudes.push_back(2.0 / n * std::abs(y));
    }

    return spectrum;
}

double dominantFrequency(const std::vector<double>& values, double sampling_interval) {
    Spectrum spectrum = computeSpectrum(values, sampling_interval);
    if (spectrum.amplitudes.empty()) {
        throw DomainError("Series too short for a spectrum");
    }

    auto peak = std::max_element(spectrum.amplitudes.begin(), spectrum.amplitudes.end());
    return spectrum.frequencies[std::distance(spectrum.amplitudes.begin(), peak)];
}

// =============================================================================
// Model
// =============================================================================

double harmonicModel(double t, double mean, double amplitude,
                     double angular_frequency, double phase) {
    return mean + amplitude * std::sin(angular_frequency * t + phase);
}

double evaluateHarmonic(const HarmonicSignal& signal, double t_seconds) {
    return harmonicModel(t_seconds, signal.mean, signal.amplitude,
                         signal.angular_frequency, signal.phase);
}

double wrapPhase(double phase) {
    double wrapped = std::fmod(phase, 2.0 * M_PI);
    if (wrapped < 0.0) wrapped += 2.0 * M_PI;
    // fmod of a tiny negative value can land exactly on 2 pi
    if (wrapped >= 2.0 * M_PI) wrapped = 0.0;
    return wrapped;
}

HarmonicSignal normalizeHarmonic(double mean, double amplitude,
                                 double angular_frequency, double phase) {
    // sin(-|w| t + phi) = -sin(|w| t - phi)
    if (angular_frequency < 0.0) {
        angular_frequency = -angular_frequency;
        phase = -phase;
        amplitude = -amplitude;
    }

    // -B sin(x) = B sin(x + pi)
    if (amplitude < 0.0) {
        amplitude = -amplitude;
        phase += M_PI;
    }

    HarmonicSignal signal;
    signal.mean = mean;
    signal.amplitude = amplitude;
    signal.angular_frequency = angular_frequency;
    signal.phase = wrapPhase(phase);
    return signal;
}

// =============================================================================
// Tao callbacks
// =============================================================================

namespace {

struct FitContext {
    const double* t;
    const double* y;
    PetscInt n;
};

// r_i = A + B sin(w t_i + phi) - y_i, parameters x = [A, B, w, phi]
PetscErrorCode HarmonicResidual(Tao tao, Vec X, Vec F, void* ptr) {
    FitContext* ctx = static_cast<FitContext*>(ptr);
    const PetscScalar* x;
    PetscScalar* f;

    PetscFunctionBeginUser;
    (void)tao;
    PetscCall(VecGetArrayRead(X, &x));
    PetscCall(VecGetArray(F, &f));

    for (PetscInt i = 0; i < ctx->n; ++i) {
        f[i] = x[0] + x[1] * PetscSinReal(x[2] * ctx->t[i] + x[3]) - ctx->y[i];
    }

    PetscCall(VecRestoreArray(F, &f));
    PetscCall(VecRestoreArrayRead(X, &x));
    PetscFunctionReturn(0);
}

PetscErrorCode HarmonicJacobian(Tao tao, Vec X, Mat J, Mat Jpre, void* ptr) {
    FitContext* ctx = static_cast<FitContext*>(ptr);
    const PetscScalar* x;
    PetscScalar* a;
    PetscInt lda;

    PetscFunctionBeginUser;
    (void)tao;
    (void)Jpre;
    PetscCall(VecGetArrayRead(X, &x));
    PetscCall(MatDenseGetLDA(J, &lda));
    PetscCall(MatDenseGetArray(J, &a));

    // Column-major dense storage
    for (PetscInt i = 0; i < ctx->n; ++i) {
        PetscReal arg = x[2] * ctx->t[i] + x[3];
        PetscReal s = PetscSinReal(arg);
        PetscReal c = PetscCosReal(arg);
        a[i + 0 * lda] = 1.0;
        a[i + 1 * lda] = s;
        a[i + 2 * lda] = x[1] * ctx->t[i] * c;
        a[i + 3 * lda] = x[1] * c;
    }

    PetscCall(MatDenseRestoreArray(J, &a));
    PetscCall(VecRestoreArrayRead(X, &x));
    PetscCall(MatAssemblyBegin(J, MAT_FINAL_ASSEMBLY));
    PetscCall(MatAssemblyEnd(J, MAT_FINAL_ASSEMBLY));
    PetscFunctionReturn(0);
}

// Solve the small dense system M p = b in place with partial pivoting.
// Returns false if the system is singular.
bool solveDense3(double M[3][3], double b[3], double p[3]) {
    for (int col = 0; col < 3; ++col) {
        int pivot = col;
        for (int row = col + 1; row < 3; ++row) {
            if (std::abs(M[row][col]) > std::abs(M[pivot][col])) pivot = row;
        }
        if (std::abs(M[pivot][col]) < 1e-12) return false;

        if (pivot != col) {
            for (int k = 0; k < 3; ++k) std::swap(M[col][k], M[pivot][k]);
            std::swap(b[col], b[pivot]);
        }

        for (int row = col + 1; row < 3; ++row) {
            double factor = M[row][col] / M[col][col];
            for (int k = col; k < 3; ++k) M[row][k] -= factor * M[col][k];
            b[row] -= factor * b[col];
        }
    }

    for (int row = 2; row >= 0; --row) {
        double sum = b[row];
        for (int k = row + 1; k < 3; ++k) sum -= M[row][k] * p[k];
        p[row] = sum / M[row][row];
    }
    return true;
}

} // namespace

// =============================================================================
// HarmonicExtractor
// =============================================================================

HarmonicExtractor::HarmonicExtractor() {}

HarmonicExtractor::HarmonicExtractor(const HarmonicFitOptions& options)
    : options_(options) {}

void HarmonicExtractor::validateInput(const std::vector<double>& time,
                                      const std::vector<double>& temperature) const {
    if (time.size() != temperature.size()) {
        std::ostringstream msg;
        msg << "Time and temperature lengths differ (" << time.size()
            << " vs " << temperature.size() << ")";
        throw DomainError(msg.str());
    }
    if (time.size() < 4) {
        throw DomainError("At least 4 samples are needed for a harmonic fit");
    }
    for (size_t i = 0; i < time.size(); ++i) {
        if (!std::isfinite(time[i]) || !std::isfinite(temperature[i])) {
            throw DomainError("Non-finite value in series at index " + std::to_string(i));
        }
        if (i > 0 && !(time[i] > time[i - 1])) {
            throw DomainError("Time must be strictly increasing (index " + std::to_string(i) + ")");
        }
    }
    if (!(options_.time_unit_seconds > 0.0)) {
        throw DomainError("Time unit must be positive");
    }
    if (options_.frequency_init == FrequencyInit::KNOWN_PERIOD && !(options_.period_hint > 0.0)) {
        throw DomainError("Period hint must be positive");
    }
}

double HarmonicExtractor::initialAngularFrequency(const std::vector<double>& time,
                                                  const std::vector<double>& temperature) const {
    if (options_.frequency_init == FrequencyInit::FFT_PEAK) {
        double interval = (time.back() - time.front()) / (time.size() - 1);
        return 2.0 * M_PI * dominantFrequency(temperature, interval);
    }
    return 2.0 * M_PI / options_.period_hint;
}

std::vector<double> HarmonicExtractor::linearInitialGuess(const std::vector<double>& time,
                                                          const std::vector<double>& temperature,
                                                          double angular_frequency) const {
    // Normal equations for y ~ A + a sin(w t) + b cos(w t)
    double M[3][3] = {{0.0}};
    double rhs[3] = {0.0, 0.0, 0.0};

    for (size_t i = 0; i < time.size(); ++i) {
        double basis[3] = {1.0,
                           std::sin(angular_frequency * time[i]),
                           std::cos(angular_frequency * time[i])};
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 3; ++c) M[r][c] += basis[r] * basis[c];
            rhs[r] += basis[r] * temperature[i];
        }
    }

    double p[3];
    if (!solveDense3(M, rhs, p)) {
        // Degenerate sampling: half the range about the mean, zero phase
        auto range = std::minmax_element(temperature.begin(), temperature.end());
        double mean = std::accumulate(temperature.begin(), temperature.end(), 0.0) /
                      temperature.size();
        return {mean, 0.5 * (*range.second - *range.first), angular_frequency, 0.0};
    }

    // a sin + b cos = B sin(w t + phi), B cos(phi) = a, B sin(phi) = b
    double amplitude = std::hypot(p[1], p[2]);
    double phase = std::atan2(p[2], p[1]);
    return {p[0], amplitude, angular_frequency, phase};
}

namespace {

// Objects created here are handed back through the references, so the caller
// can destroy them whether or not a later step fails
PetscErrorCode runHarmonicFit(const HarmonicFitOptions& options, FitContext& ctx,
                              std::vector<double>& params, Tao& tao, Vec& x, Vec& r,
                              Mat& J, TaoConvergedReason& reason, PetscInt& iterations,
                              PetscReal& residual_norm) {
    Tao subsolver;
    PetscScalar* xa;
    PetscReal f, gnorm, cnorm, xdiff;

    PetscFunctionBeginUser;

    PetscCall(VecCreateSeq(PETSC_COMM_SELF, 4, &x));
    PetscCall(VecCreateSeq(PETSC_COMM_SELF, ctx.n, &r));
    PetscCall(MatCreateSeqDense(PETSC_COMM_SELF, ctx.n, 4, nullptr, &J));

    PetscCall(VecGetArray(x, &xa));
    for (int k = 0; k < 4; ++k) xa[k] = params[k];
    PetscCall(VecRestoreArray(x, &xa));

    PetscCall(TaoCreate(PETSC_COMM_SELF, &tao));
    PetscCall(TaoSetType(tao, TAOBRGN));
    PetscCall(TaoSetOptionsPrefix(tao, options.options_prefix.c_str()));
    PetscCall(TaoSetSolution(tao, x));
    PetscCall(TaoSetResidualRoutine(tao, r, HarmonicResidual, &ctx));
    PetscCall(TaoSetJacobianResidualRoutine(tao, J, J, HarmonicJacobian, &ctx));
    PetscCall(TaoBRGNSetRegularizerWeight(tao, options.regularizer_weight));
    PetscCall(TaoSetTolerances(tao, options.gradient_atol, options.gradient_rtol, 0.0));
    PetscCall(TaoSetMaximumIterations(tao, options.max_iterations));
    PetscCall(TaoSetFromOptions(tao));

    // The Gauss-Newton steps are taken by the inner Newton solver
    PetscCall(TaoBRGNGetSubsolver(tao, &subsolver));
    PetscCall(TaoSetTolerances(subsolver, options.gradient_atol, options.gradient_rtol, 0.0));
    PetscCall(TaoSetMaximumIterations(subsolver, options.max_iterations));

    PetscCall(TaoSolve(tao));

    PetscCall(TaoGetSolutionStatus(tao, &iterations, &f, &gnorm, &cnorm, &xdiff, &reason));
    if (reason == TAO_CONTINUE_ITERATING) {
        PetscCall(TaoGetSolutionStatus(subsolver, &iterations, &f, &gnorm, &cnorm, &xdiff, &reason));
    }
    PetscCall(PetscInfo(tao, "Harmonic fit: %s after %" PetscInt_FMT " iterations, |g| = %g\n",
                        TaoConvergedReasons[reason], iterations, (double)gnorm));

    PetscCall(VecGetArray(x, &xa));
    for (int k = 0; k < 4; ++k) params[k] = PetscRealPart(xa[k]);
    PetscCall(VecRestoreArray(x, &xa));

    PetscCall(HarmonicResidual(tao, x, r, &ctx));
    PetscCall(VecNorm(r, NORM_2, &residual_norm));
    PetscFunctionReturn(0);
}

} // namespace

PetscErrorCode HarmonicExtractor::solve(const std::vector<double>& time,
                                        const std::vector<double>& temperature,
                                        std::vector<double>& params,
                                        TaoConvergedReason& reason,
                                        PetscInt& iterations,
                                        PetscReal& residual_norm) const {
    Tao tao = nullptr;
    Vec x = nullptr, r = nullptr;
    Mat J = nullptr;
    FitContext ctx;

    PetscFunctionBeginUser;

    ctx.t = time.data();
    ctx.y = temperature.data();
    ctx.n = static_cast<PetscInt>(time.size());

    PetscErrorCode ierr = runHarmonicFit(options_, ctx, params, tao, x, r, J,
                                         reason, iterations, residual_norm);

    // Destroy on every path; a null handle is a no-op
    PetscCall(TaoDestroy(&tao));
    PetscCall(MatDestroy(&J));
    PetscCall(VecDestroy(&r));
    PetscCall(VecDestroy(&x));
    PetscCall(ierr);
    PetscFunctionReturn(0);
}

HarmonicSignal HarmonicExtractor::extract(const std::vector<double>& time,
                                          const std::vector<double>& temperature) const {
    validateInput(time, temperature);

    double omega0 = initialAngularFrequency(time, temperature);
    if (!(omega0 > 0.0) || !std::isfinite(omega0)) {
        throw DomainError("Initial angular frequency must be positive");
    }

    // Fit in units of the seed period so the Jacobian columns are of similar
    // size whatever the caller's time unit. t = 0 is unchanged, so is phi.
    const double period_scale = 2.0 * M_PI / omega0;
    std::vector<double> tau(time.size());
    for (size_t i = 0; i < time.size(); ++i) {
        tau[i] = time[i] / period_scale;
    }

    std::vector<double> params = linearInitialGuess(tau, temperature, 2.0 * M_PI);

    TaoConvergedReason reason = TAO_CONTINUE_ITERATING;
    PetscInt iterations = 0;
    PetscReal residual_norm = 0.0;

    PetscErrorCode ierr = solve(tau, temperature, params, reason, iterations, residual_norm);
    if (ierr) {
        throw FitConvergenceError("PETSc error " + std::to_string(static_cast<int>(ierr)) +
                                  " during harmonic fit",
                                  static_cast<int>(reason), static_cast<int>(iterations));
    }

    if (reason <= 0) {
        std::ostringstream msg;
        msg << "Harmonic fit did not converge: " << TaoConvergedReasons[reason]
            << " after " << iterations << " iterations";
        throw FitConvergenceError(msg.str(), static_cast<int>(reason),
                                  static_cast<int>(iterations));
    }

    for (double p : params) {
        if (!std::isfinite(p)) {
            throw FitConvergenceError("Harmonic fit produced non-finite parameters",
                                      static_cast<int>(reason), static_cast<int>(iterations));
        }
    }
    if (params[2] == 0.0) {
        throw FitConvergenceError("Harmonic fit collapsed to zero frequency",
                                  static_cast<int>(reason), static_cast<int>(iterations));
    }

    HarmonicSignal signal = normalizeHarmonic(params[0], params[1], params[2], params[3]);
    signal.angular_frequency /= period_scale * options_.time_unit_seconds;
    signal.samples = static_cast<int>(time.size());
    signal.iterations = static_cast<int>(iterations);
    signal.rms_residual = residual_norm / std::sqrt(static_cast<double>(time.size()));
    signal.frequency_init = options_.frequency_init;
    return signal;
}

HarmonicSignal extractHarmonic(const std::vector<double>& time,
                               const std::vector<double>& temperature,
                               const HarmonicFitOptions& options) {
    HarmonicExtractor extractor(options);
    return extractor.extract(time, temperature);
}

} // namespace VFLUX
