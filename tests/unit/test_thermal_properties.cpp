/**
 * @file test_thermal_properties.cpp
 * @brief Unit tests for the thermal property resolver
 */

#include <gtest/gtest.h>
#include "ThermalProperties.hpp"
#include <limits>

using namespace VFLUX;

class ThermalPropertiesTest : public ::testing::Test {
protected:
    const double lambda = 2.0;
    const double Cs = 2.5e6;
    const double Cw = 4.18e6;
};

TEST_F(ThermalPropertiesTest, DiffusivityOfSaturatedSand) {
    EXPECT_DOUBLE_EQ(diffusivity(lambda, Cs), 8.0e-7);
}

TEST_F(ThermalPropertiesTest, DiffusivityIncreasesWithConductivity) {
    double previous = 0.0;
    for (double k = 0.5; k <= 4.0; k += 0.5) {
        double alpha = diffusivity(k, Cs);
        EXPECT_GT(alpha, previous);
        previous = alpha;
    }
}

TEST_F(ThermalPropertiesTest, DiffusivityDecreasesWithHeatCapacity) {
    double previous = diffusivity(lambda, 1.0e6);
    for (double c = 1.5e6; c <= 4.0e6; c += 0.5e6) {
        double alpha = diffusivity(lambda, c);
        EXPECT_LT(alpha, previous);
        previous = alpha;
    }
}

TEST_F(ThermalPropertiesTest, NonPositiveInputsRejected) {
    EXPECT_THROW(diffusivity(lambda, 0.0), DomainError);
    EXPECT_THROW(diffusivity(lambda, -1.0), DomainError);
    EXPECT_THROW(diffusivity(0.0, Cs), DomainError);
    EXPECT_THROW(diffusivity(-2.0, Cs), DomainError);
}

TEST_F(ThermalPropertiesTest, DomainErrorIsInvalidArgument) {
    EXPECT_THROW(diffusivity(lambda, 0.0), std::invalid_argument);
}

TEST_F(ThermalPropertiesTest, MediumCarriesDerivedDiffusivity) {
    ThermalMedium medium = makeThermalMedium(lambda, Cs, Cw);
    EXPECT_DOUBLE_EQ(medium.thermal_conductivity, lambda);
    EXPECT_DOUBLE_EQ(medium.heat_capacity_sediment, Cs);
    EXPECT_DOUBLE_EQ(medium.heat_capacity_water, Cw);
    EXPECT_DOUBLE_EQ(medium.thermal_diffusivity, lambda / Cs);

    EXPECT_THROW(makeThermalMedium(lambda, Cs, 0.0), DomainError);
    EXPECT_THROW(makeThermalMedium(lambda, -Cs, Cw), DomainError);
}

TEST_F(ThermalPropertiesTest, HandFilledMediumValidated) {
    EXPECT_NO_THROW(validateThermalMedium(defaultThermalMedium()));

    ThermalMedium medium = defaultThermalMedium();
    medium.heat_capacity_water = 0.0;
    EXPECT_THROW(validateThermalMedium(medium), DomainError);

    medium = defaultThermalMedium();
    medium.thermal_conductivity = -lambda;
    EXPECT_THROW(validateThermalMedium(medium), DomainError);

    medium = defaultThermalMedium();
    medium.thermal_diffusivity = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validateThermalMedium(medium), DomainError);
}

TEST_F(ThermalPropertiesTest, DefaultMedium) {
    ThermalMedium medium = defaultThermalMedium();
    EXPECT_DOUBLE_EQ(medium.thermal_diffusivity, 8.0e-7);
    EXPECT_DOUBLE_EQ(medium.heat_capacity_water, Cw);
}

TEST_F(ThermalPropertiesTest, ConductivePhaseLagOverTenCentimeters) {
    // sqrt(w dz^2 / (4 alpha)) with w = 2 pi / 86400
    double lag = conductivePhaseLag(0.10, 8.0e-7, DIURNAL_ANGULAR_FREQUENCY);
    EXPECT_NEAR(lag, 0.4767142, 1e-6);
    EXPECT_THROW(conductivePhaseLag(0.0, 8.0e-7, DIURNAL_ANGULAR_FREQUENCY), DomainError);
}

TEST_F(ThermalPropertiesTest, AdvectivePhaseLagIsLinearInFlux) {
    ThermalMedium medium = defaultThermalMedium();
    double v = 5.0 / MM_PER_DAY_PER_M_PER_S;
    double lag = advectivePhaseLag(v, 0.10, medium);
    EXPECT_NEAR(lag, v * Cw * 0.10 / (2.0 * lambda), 1e-15);
    EXPECT_NEAR(advectivePhaseLag(2.0 * v, 0.10, medium), 2.0 * lag, 1e-15);
    EXPECT_LT(advectivePhaseLag(-v, 0.10, medium), 0.0);
}
