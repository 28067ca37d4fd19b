/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include <mpi.h>
#include <algorithm>
#include <cstdio>
#include <fstream>

using namespace VFLUX;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
        test_config_file = "test_config_unit_" + std::to_string(rank) + ".config";

        std::ofstream config(test_config_file);
        config << "# Streambed sensor string\n";
        config << "[medium]\n";
        config << "thermal_conductivity = 1.8\n";
        config << "heat_capacity_sediment = 2.6 MJ/(m3-K)\n";
        config << "heat_capacity_water = 4.18e6   ; water\n";
        config << "\n[SENSORS]\n";
        config << "names = T10, T20, T35\n";
        config << "depths = 10 cm, 20 cm, 0.35\n";
        config << "pairs = 1-2, 2-3\n";
        config << "\n[analysis]\n";
        config << "period = 24\n";
        config << "frequency_init = fft_peak\n";
        config << "\n[FIT]\n";
        config << "max_iterations = 50\n";
        config << "time_unit = s\n";
        config << "\n[INPUT]\n";
        config << "file = temps.csv\n";
        config << "time_columns = time\n";
        config << "resample_interval = 30\n";
        config << "\n[OUTPUT]\n";
        config << "flux_unit = cm/day\n";
        config.close();
    }

    void TearDown() override {
        std::remove(test_config_file.c_str());
    }

    std::string test_config_file;
    int rank;
};

TEST_F(ConfigReaderTest, LoadFile) {
    ConfigReader reader;
    EXPECT_TRUE(reader.loadFile(test_config_file));
    EXPECT_TRUE(reader.hasSection("MEDIUM"));
    EXPECT_TRUE(reader.hasSection("sensors"));
    EXPECT_TRUE(reader.hasKey("Fit", "time_unit"));
    EXPECT_EQ(reader.getSections().size(), 6u);
}

TEST_F(ConfigReaderTest, MissingFileFails) {
    ConfigReader reader;
    EXPECT_FALSE(reader.loadFile("no_such_file.config"));
}

TEST_F(ConfigReaderTest, MediumWithUnits) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::MediumConfig medium;
    EXPECT_TRUE(reader.parseMediumConfig(medium));
    EXPECT_DOUBLE_EQ(medium.thermal_conductivity, 1.8);
    EXPECT_DOUBLE_EQ(medium.heat_capacity_sediment, 2.6e6);
    EXPECT_DOUBLE_EQ(medium.heat_capacity_water, 4.18e6);

    ThermalMedium built = reader.buildMedium();
    EXPECT_DOUBLE_EQ(built.thermal_diffusivity, 1.8 / 2.6e6);
}

TEST_F(ConfigReaderTest, SensorsAndPairs) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::SensorConfig sensors;
    EXPECT_TRUE(reader.parseSensorConfig(sensors));
    ASSERT_EQ(sensors.names.size(), 3u);
    EXPECT_EQ(sensors.names[2], "T35");
    ASSERT_EQ(sensors.depths.size(), 3u);
    EXPECT_NEAR(sensors.depths[0], 0.10, 1e-12);
    EXPECT_NEAR(sensors.depths[1], 0.20, 1e-12);
    EXPECT_NEAR(sensors.depths[2], 0.35, 1e-12);

    ASSERT_EQ(sensors.pairs.size(), 2u);
    EXPECT_EQ(sensors.pairs[0], std::make_pair(0, 1));
    EXPECT_EQ(sensors.pairs[1], std::make_pair(1, 2));
}

TEST_F(ConfigReaderTest, FitOptionsFromAnalysisAndFit) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::AnalysisConfig analysis;
    reader.parseAnalysisConfig(analysis);
    EXPECT_DOUBLE_EQ(analysis.period, 86400.0);
    EXPECT_DOUBLE_EQ(analysis.angular_frequency, DIURNAL_ANGULAR_FREQUENCY);

    HarmonicFitOptions options = reader.buildFitOptions();
    EXPECT_EQ(options.frequency_init, FrequencyInit::FFT_PEAK);
    EXPECT_DOUBLE_EQ(options.time_unit_seconds, 1.0);
    EXPECT_DOUBLE_EQ(options.period_hint, 86400.0);
    EXPECT_EQ(options.max_iterations, 50);
}

TEST_F(ConfigReaderTest, InputColumnsDefaultToSensorNames) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::InputConfig input;
    EXPECT_TRUE(reader.parseInputConfig(input));
    EXPECT_EQ(input.file, "temps.csv");
    ASSERT_EQ(input.time_columns.size(), 1u);
    EXPECT_EQ(input.time_columns[0], "time");
    ASSERT_EQ(input.temperature_columns.size(), 3u);
    EXPECT_EQ(input.temperature_columns[0], "T10");
    EXPECT_DOUBLE_EQ(input.resample_interval, 1800.0);

    ConfigReader::OutputConfig output;
    reader.parseOutputConfig(output);
    EXPECT_EQ(output.flux_unit, "cm/day");
    EXPECT_TRUE(output.file.empty());
}

TEST_F(ConfigReaderTest, ValidConfigPasses) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, DefaultsWithoutSections) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString(""));

    ConfigReader::SensorConfig sensors;
    EXPECT_FALSE(reader.parseSensorConfig(sensors));
    EXPECT_EQ(sensors.depths.size(), 3u);
    // All i < j pairs
    EXPECT_EQ(sensors.pairs.size(), 3u);

    ConfigReader::InputConfig input;
    reader.parseInputConfig(input);
    ASSERT_EQ(input.time_columns.size(), 3u);
    EXPECT_EQ(input.time_columns[2], "fecha3");
    EXPECT_DOUBLE_EQ(input.resample_interval, 900.0);

    HarmonicFitOptions options = reader.buildFitOptions();
    EXPECT_DOUBLE_EQ(options.period_hint, 24.0);
    EXPECT_DOUBLE_EQ(options.time_unit_seconds, SECONDS_PER_HOUR);

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.warnings.size(), 6u);
}

TEST_F(ConfigReaderTest, ValidationCatchesErrors) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString(
        "[MEDIUM]\n"
        "heat_capacity_sediment = -1\n"
        "[SENSORS]\n"
        "names = a, b\n"
        "depths = 0.1, 0.1, 0.2\n"
        "pairs = 1-4, 2-2\n"
        "[ANALYSIS]\n"
        "frequency_init = wavelet\n"
        "[FIT]\n"
        "max_iterations = 0\n"
        "[OUTPUT]\n"
        "flux_unit = degC\n"));

    auto result = reader.validate();
    EXPECT_FALSE(result.valid);

    auto has_error = [&result](const std::string& fragment) {
        return std::any_of(result.errors.begin(), result.errors.end(),
                           [&fragment](const std::string& e) {
                               return e.find(fragment) != std::string::npos;
                           });
    };
    EXPECT_TRUE(has_error("Sediment heat capacity"));
    EXPECT_TRUE(has_error("does not match number of depths"));
    EXPECT_TRUE(has_error("distinct"));
    EXPECT_TRUE(has_error("missing sensor"));
    EXPECT_TRUE(has_error("itself"));
    EXPECT_TRUE(has_error("frequency_init"));
    EXPECT_TRUE(has_error("max_iterations"));
    EXPECT_TRUE(has_error("not a velocity"));
}

TEST_F(ConfigReaderTest, BadValuesFallBackToDefaults) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString(
        "[ANALYSIS]\n"
        "period = 24 m\n"
        "[FIT]\n"
        "max_iterations = many\n"));

    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("ANALYSIS", "period", 86400.0, "hr"), 86400.0);
    EXPECT_EQ(reader.getInt("FIT", "max_iterations", 200), 200);
    EXPECT_TRUE(reader.getBool("FIT", "missing", true));
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    std::string template_file = "test_template_" + std::to_string(rank) + ".config";
    ConfigReader::generateTemplate(template_file);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(template_file));
    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(reader.hasSection("MEDIUM"));
    EXPECT_TRUE(reader.hasSection("OUTPUT"));

    std::remove(template_file.c_str());
}
