/**
 * @file test_harmonic_analysis.cpp
 * @brief Unit tests for the single-frequency harmonic extractor
 *
 * Tests cover:
 * - Amplitude and frequency sign normalization
 * - Spectrum (radix-2 and direct) and dominant frequency
 * - Linear initial guess
 * - Tao Gauss-Newton refinement under both frequency policies
 * - Records of one and a half cycles and less
 * - Input validation and convergence failure reporting
 */

#include <gtest/gtest.h>
#include "HarmonicAnalysis.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace VFLUX;

class HarmonicAnalysisTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Three days every 15 min, time in hours
        for (int k = 0; k < 288; ++k) {
            hours.push_back(0.25 * k);
        }
    }

    std::vector<double> sinusoid(double mean, double amplitude, double period_hours,
                                 double phase) const {
        std::vector<double> values;
        for (double t : hours) {
            values.push_back(mean + amplitude * std::sin(2.0 * M_PI / period_hours * t + phase));
        }
        return values;
    }

    std::vector<double> hours;
};

// =============================================================================
// Normalization
// =============================================================================

TEST_F(HarmonicAnalysisTest, NegativeAmplitudePreservesModelValues) {
    const double mean = 12.0, amplitude = -2.5, omega = 0.26, phase = 0.7;
    HarmonicSignal s = normalizeHarmonic(mean, amplitude, omega, phase);

    EXPECT_GT(s.amplitude, 0.0);
    EXPECT_GE(s.phase, 0.0);
    EXPECT_LT(s.phase, 2.0 * M_PI);
    for (double t = 0.0; t < 48.0; t += 1.7) {
        EXPECT_NEAR(harmonicModel(t, s.mean, s.amplitude, s.angular_frequency, s.phase),
                    harmonicModel(t, mean, amplitude, omega, phase), 1e-12);
    }
}

TEST_F(HarmonicAnalysisTest, NegativeFrequencyPreservesModelValues) {
    const double mean = 8.0, amplitude = 1.5, omega = -0.26, phase = 2.1;
    HarmonicSignal s = normalizeHarmonic(mean, amplitude, omega, phase);

    EXPECT_GT(s.angular_frequency, 0.0);
    EXPECT_GT(s.amplitude, 0.0);
    for (double t = 0.0; t < 48.0; t += 1.3) {
        EXPECT_NEAR(harmonicModel(t, s.mean, s.amplitude, s.angular_frequency, s.phase),
                    harmonicModel(t, mean, amplitude, omega, phase), 1e-12);
    }
}

TEST_F(HarmonicAnalysisTest, WrapPhaseRange) {
    EXPECT_NEAR(wrapPhase(-0.5), 2.0 * M_PI - 0.5, 1e-12);
    EXPECT_NEAR(wrapPhase(7.0), 7.0 - 2.0 * M_PI, 1e-12);
    EXPECT_DOUBLE_EQ(wrapPhase(0.0), 0.0);
    EXPECT_LT(wrapPhase(-1e-18), 2.0 * M_PI);
}

// =============================================================================
// Spectrum
// =============================================================================

TEST_F(HarmonicAnalysisTest, SpectrumPeakAtSignalFrequency) {
    auto values = sinusoid(15.0, 2.0, 24.0, 0.3);
    Spectrum spectrum = computeSpectrum(values, 0.25);

    // ceil(288/2) - 1 positive bins
    EXPECT_EQ(spectrum.frequencies.size(), 143u);

    auto peak = std::max_element(spectrum.amplitudes.begin(), spectrum.amplitudes.end());
    size_t k = std::distance(spectrum.amplitudes.begin(), peak);
    EXPECT_NEAR(spectrum.frequencies[k], 1.0 / 24.0, 1e-12);
    EXPECT_NEAR(*peak, 2.0, 1e-9);

    EXPECT_NEAR(dominantFrequency(values, 0.25), 1.0 / 24.0, 1e-12);
}

TEST_F(HarmonicAnalysisTest, PowerOfTwoSpectrumMatchesDirectSum) {
    // 256 samples: two tones off-bin and a drift
    std::vector<double> values;
    for (int i = 0; i < 256; ++i) {
        double t = 0.25 * i;
        values.push_back(3.0 + 1.5 * std::sin(2.0 * M_PI * t / 23.0 + 0.4) +
                         0.6 * std::cos(2.0 * M_PI * t / 7.3) + 0.01 * t);
    }
    Spectrum spectrum = computeSpectrum(values, 0.25);
    ASSERT_EQ(spectrum.frequencies.size(), 127u);

    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= values.size();

    for (int k = 1; k <= 127; ++k) {
        double re = 0.0, im = 0.0;
        for (int i = 0; i < 256; ++i) {
            double angle = -2.0 * M_PI * k * i / 256.0;
            re += (values[i] - mean) * std::cos(angle);
            im += (values[i] - mean) * std::sin(angle);
        }
        EXPECT_NEAR(spectrum.frequencies[k - 1], k / 64.0, 1e-14);
        EXPECT_NEAR(spectrum.amplitudes[k - 1], 2.0 / 256.0 * std::hypot(re, im), 1e-10);
    }
}

TEST_F(HarmonicAnalysisTest, PowerOfTwoSpectrumPeak) {
    // 64 h record, a 16 h tone falls on bin 4
    std::vector<double> short_hours(hours.begin(), hours.begin() + 256);
    std::vector<double> values;
    for (double t : short_hours) values.push_back(10.0 + 2.0 * std::sin(2.0 * M_PI / 16.0 * t));

    Spectrum spectrum = computeSpectrum(values, 0.25);
    EXPECT_NEAR(spectrum.amplitudes[3], 2.0, 1e-10);
    for (size_t k = 0; k < spectrum.amplitudes.size(); ++k) {
        if (k != 3) EXPECT_LT(spectrum.amplitudes[k], 1e-10);
    }
    EXPECT_NEAR(dominantFrequency(values, 0.25), 1.0 / 16.0, 1e-14);
}

TEST_F(HarmonicAnalysisTest, SpectrumRejectsBadInterval) {
    auto values = sinusoid(15.0, 2.0, 24.0, 0.3);
    EXPECT_THROW(computeSpectrum(values, 0.0), DomainError);
}

// =============================================================================
// Initial guess
// =============================================================================

TEST_F(HarmonicAnalysisTest, LinearGuessExactAtTrueFrequency) {
    auto values = sinusoid(18.0, 1.2, 24.0, 4.0);
    HarmonicExtractor extractor;
    auto guess = extractor.linearInitialGuess(hours, values, 2.0 * M_PI / 24.0);

    ASSERT_EQ(guess.size(), 4u);
    EXPECT_NEAR(guess[0], 18.0, 1e-9);
    EXPECT_NEAR(guess[1], 1.2, 1e-9);
    EXPECT_NEAR(wrapPhase(guess[3]), 4.0, 1e-9);
}

TEST_F(HarmonicAnalysisTest, InitialFrequencyFollowsPolicy) {
    auto values = sinusoid(18.0, 1.2, 12.0, 0.0);

    HarmonicFitOptions options;
    HarmonicExtractor extractor(options);
    EXPECT_NEAR(extractor.initialAngularFrequency(hours, values), 2.0 * M_PI / 24.0, 1e-12);

    options.frequency_init = FrequencyInit::FFT_PEAK;
    extractor.setOptions(options);
    EXPECT_NEAR(extractor.initialAngularFrequency(hours, values), 2.0 * M_PI / 12.0, 1e-12);
}

// =============================================================================
// Nonlinear fit
// =============================================================================

TEST_F(HarmonicAnalysisTest, RecoversNoiseFreeParameters) {
    auto values = sinusoid(20.0, 3.0, 24.0, 1.3);
    HarmonicSignal s = extractHarmonic(hours, values);

    EXPECT_NEAR(s.mean, 20.0, 1e-6);
    EXPECT_NEAR(s.amplitude, 3.0, 1e-6);
    EXPECT_NEAR(s.angular_frequency, DIURNAL_ANGULAR_FREQUENCY, 1e-10);
    EXPECT_NEAR(s.phase, 1.3, 1e-6);
    EXPECT_NEAR(s.period(), 86400.0, 1e-3);
    EXPECT_EQ(s.samples, 288);
    EXPECT_LT(s.rms_residual, 1e-6);
}

TEST_F(HarmonicAnalysisTest, RefinesFrequencyFromOffsetHint) {
    // True period 23 h, seeded with the default 24 h
    auto values = sinusoid(10.0, 2.0, 23.0, 0.4);
    HarmonicSignal s = extractHarmonic(hours, values);

    EXPECT_NEAR(s.angular_frequency * SECONDS_PER_HOUR, 2.0 * M_PI / 23.0, 1e-6);
    EXPECT_NEAR(s.amplitude, 2.0, 1e-5);
    EXPECT_NEAR(s.phase, 0.4, 1e-4);
}

TEST_F(HarmonicAnalysisTest, RecoversFromOneAndAHalfCycles) {
    // 36 h of 15 min samples, true period 23 h, seeded with 24 h
    std::vector<double> short_hours(hours.begin(), hours.begin() + 144);
    std::vector<double> values;
    for (double t : short_hours) {
        values.push_back(12.0 + 2.5 * std::sin(2.0 * M_PI / 23.0 * t + 2.2));
    }

    HarmonicSignal s = extractHarmonic(short_hours, values);

    EXPECT_NEAR(s.angular_frequency * SECONDS_PER_HOUR, 2.0 * M_PI / 23.0, 1e-6);
    EXPECT_NEAR(s.mean, 12.0, 1e-5);
    EXPECT_NEAR(s.amplitude, 2.5, 1e-5);
    EXPECT_NEAR(s.phase, 2.2, 1e-4);
    EXPECT_EQ(s.samples, 144);
}

TEST_F(HarmonicAnalysisTest, SubCycleRecordFitsOrReportsFailure) {
    // 10 h of a 24 h cycle: the frequency is poorly constrained
    std::vector<double> short_hours(hours.begin(), hours.begin() + 40);
    std::vector<double> values;
    for (double t : short_hours) {
        values.push_back(15.0 + 2.0 * std::sin(2.0 * M_PI / 24.0 * t + 0.7));
    }

    HarmonicFitOptions options;
    options.max_iterations = 50;

    try {
        HarmonicSignal s = extractHarmonic(short_hours, values, options);
        EXPECT_TRUE(std::isfinite(s.mean));
        EXPECT_GT(s.amplitude, 0.0);
        EXPECT_GT(s.angular_frequency, 0.0);
        EXPECT_LE(s.iterations, options.max_iterations);
        EXPECT_TRUE(std::isfinite(s.rms_residual));
    } catch (const FitConvergenceError& e) {
        EXPECT_LE(e.iterations(), options.max_iterations);
    }
}

TEST_F(HarmonicAnalysisTest, FftPeakPolicyRecoversFrequency) {
    auto values = sinusoid(15.0, 2.0, 12.0, 2.5);

    HarmonicFitOptions options;
    options.frequency_init = FrequencyInit::FFT_PEAK;
    HarmonicSignal s = extractHarmonic(hours, values, options);

    EXPECT_NEAR(s.period(), 12.0 * SECONDS_PER_HOUR, 1e-2);
    EXPECT_NEAR(s.amplitude, 2.0, 1e-6);
    EXPECT_EQ(s.frequency_init, FrequencyInit::FFT_PEAK);
}

TEST_F(HarmonicAnalysisTest, TimeUnitSetsFrequencyUnits) {
    std::vector<double> seconds;
    for (double t : hours) seconds.push_back(t * SECONDS_PER_HOUR);
    auto values = sinusoid(15.0, 2.0, 24.0, 0.9);

    HarmonicFitOptions options;
    options.time_unit_seconds = 1.0;
    options.period_hint = SECONDS_PER_DAY;
    HarmonicSignal s = extractHarmonic(seconds, values, options);

    EXPECT_NEAR(s.angular_frequency, DIURNAL_ANGULAR_FREQUENCY, 1e-10);
    EXPECT_NEAR(s.phase, 0.9, 1e-6);
}

TEST_F(HarmonicAnalysisTest, NegativeSlopeDataGivesPositiveAmplitude) {
    // -2 sin(x) fits as 2 sin(x + pi)
    auto values = sinusoid(5.0, -2.0, 24.0, 0.0);
    HarmonicSignal s = extractHarmonic(hours, values);

    EXPECT_NEAR(s.amplitude, 2.0, 1e-6);
    EXPECT_NEAR(s.phase, M_PI, 1e-6);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(HarmonicAnalysisTest, InvalidInputRejected) {
    auto values = sinusoid(15.0, 2.0, 24.0, 0.0);
    HarmonicExtractor extractor;

    std::vector<double> short_time(hours.begin(), hours.begin() + 3);
    std::vector<double> short_values(values.begin(), values.begin() + 3);
    EXPECT_THROW(extractor.extract(short_time, short_values), DomainError);

    std::vector<double> mismatched(values.begin(), values.end() - 1);
    EXPECT_THROW(extractor.extract(hours, mismatched), DomainError);

    std::vector<double> with_nan = values;
    with_nan[10] = std::nan("");
    EXPECT_THROW(extractor.extract(hours, with_nan), DomainError);

    std::vector<double> repeated = hours;
    repeated[5] = repeated[4];
    EXPECT_THROW(extractor.extract(repeated, values), DomainError);

    HarmonicFitOptions options;
    options.period_hint = 0.0;
    EXPECT_THROW(extractHarmonic(hours, values, options), DomainError);
}

TEST_F(HarmonicAnalysisTest, ExhaustedBudgetRaisesConvergenceError) {
    auto values = sinusoid(15.0, 2.0, 24.0, 0.5);

    HarmonicFitOptions options;
    options.period_hint = 7.0;
    options.max_iterations = 1;

    try {
        extractHarmonic(hours, values, options);
        FAIL() << "Expected FitConvergenceError";
    } catch (const FitConvergenceError& e) {
        EXPECT_LE(e.reason(), 0);
        EXPECT_LE(e.iterations(), 1);
    }
}

TEST_F(HarmonicAnalysisTest, FailedSolverSetupIsRecoverable) {
    auto values = sinusoid(15.0, 2.0, 24.0, 0.5);

    HarmonicFitOptions options;
    options.options_prefix = "broken_";
    ASSERT_EQ(PetscOptionsSetValue(nullptr, "-broken_tao_type", "no_such_solver"), 0);
    ASSERT_EQ(PetscPushErrorHandler(PetscReturnErrorHandler, nullptr), 0);

    // TaoSetFromOptions fails after the vectors, matrix and solver exist
    for (int k = 0; k < 3; ++k) {
        try {
            extractHarmonic(hours, values, options);
            ADD_FAILURE() << "Expected FitConvergenceError";
        } catch (const FitConvergenceError& e) {
            EXPECT_EQ(e.reason(), static_cast<int>(TAO_CONTINUE_ITERATING));
            EXPECT_NE(std::string(e.what()).find("PETSc error"), std::string::npos);
        }
    }

    ASSERT_EQ(PetscPopErrorHandler(), 0);
    ASSERT_EQ(PetscOptionsClearValue(nullptr, "-broken_tao_type"), 0);

    HarmonicSignal s = extractHarmonic(hours, values, options);
    EXPECT_NEAR(s.amplitude, 2.0, 1e-6);
}

TEST_F(HarmonicAnalysisTest, FrequencyInitNames) {
    EXPECT_EQ(parseFrequencyInit("fft_peak"), FrequencyInit::FFT_PEAK);
    EXPECT_EQ(parseFrequencyInit("KNOWN_PERIOD"), FrequencyInit::KNOWN_PERIOD);
    EXPECT_EQ(frequencyInitName(FrequencyInit::FFT_PEAK), "FFT_PEAK");
    EXPECT_THROW(parseFrequencyInit("wavelet"), std::invalid_argument);
}
