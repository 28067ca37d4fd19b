#include "VFLUX.hpp"
#include "ConfigReader.hpp"
#include "FluxAggregator.hpp"
#include "HarmonicAnalysis.hpp"
#include "ReportWriter.hpp"
#include "SyntheticData.hpp"
#include "TemperatureRecord.hpp"
#include <petsc.h>
#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static char help[] = "VFLUX - Streambed flux from diurnal temperature signals\n"
                    "Usage: vflux [options]\n\n"
                    "Options:\n"
                    "  -c <file>                    Configuration file (.config)\n"
                    "  -i <file>                    Temperature CSV (overrides [INPUT] file)\n"
                    "  -o <file>                    Results CSV (overrides [OUTPUT] file)\n"
                    "  -generate_config <file>      Write a template configuration\n"
                    "  -generate_synthetic <file>   Write a synthetic temperature CSV\n"
                    "  -flux <mm/day>               Target flux of the synthetic record (5.0)\n"
                    "  -noise <degC>                Noise standard deviation (0)\n"
                    "  -seed <n>                    Noise seed (42)\n"
                    "  -harmonic_tao_monitor        Monitor the harmonic fits\n\n"
                    "Examples:\n"
                    "  vflux -generate_config site.config\n"
                    "  vflux -generate_synthetic synthetic.csv -flux 5.0\n"
                    "  vflux -c site.config -i synthetic.csv -o flux.csv\n\n";

static void printBlock(MPI_Comm comm, const std::string& text) {
    PetscPrintf(comm, "%s", text.c_str());
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); if (ierr) return ierr;

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            int status = 0;
            if (rank == 0) {
                try {
                    VFLUX::ConfigReader::generateTemplate(generate_config);
                    PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                } catch (const std::exception& e) {
                    std::cerr << "Error: " << e.what() << std::endl;
                    status = 1;
                }
            }
            ierr = PetscFinalize();
            return status;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        char input_file[PETSC_MAX_PATH_LEN] = "";
        char output_file[PETSC_MAX_PATH_LEN] = "";
        char synthetic_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool input_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool gen_synthetic = PETSC_FALSE;
        PetscReal flux_mm_day = 5.0;
        PetscReal noise = 0.0;
        PetscInt seed = 42;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-i", input_file,
                                     sizeof(input_file), &input_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_file,
                                     sizeof(output_file), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_synthetic", synthetic_file,
                                     sizeof(synthetic_file), &gen_synthetic); CHKERRQ(ierr);
        ierr = PetscOptionsGetReal(nullptr, nullptr, "-flux", &flux_mm_day, nullptr); CHKERRQ(ierr);
        ierr = PetscOptionsGetReal(nullptr, nullptr, "-noise", &noise, nullptr); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-seed", &seed, nullptr); CHKERRQ(ierr);

        if (!config_provided && !input_provided && !gen_synthetic) {
            PetscPrintf(comm, "Error: Configuration file (-c) or temperature file (-i) required\n");
            PetscPrintf(comm, "Run with -help for usage information\n");
            PetscPrintf(comm, "Generate template: vflux -generate_config template.config\n");
            ierr = PetscFinalize();
            return 1;
        }

        VFLUX::ConfigReader config;
        if (config_provided && !config.loadFile(config_file)) {
            ierr = PetscFinalize();
            return 1;
        }

        VFLUX::ConfigReader::ValidationResult validation = config.validate();
        if (rank == 0 && config_provided) {
            for (const auto& warning : validation.warnings) {
                std::cerr << "Warning: " << warning << std::endl;
            }
        }
        if (rank == 0) {
            for (const auto& error : validation.errors) {
                std::cerr << "Error: " << error << std::endl;
            }
        }
        if (!validation.valid) {
            ierr = PetscFinalize();
            return 1;
        }

        int status = 0;
        if (rank == 0) {
            try {
                VFLUX::ThermalMedium medium = config.buildMedium();

                if (gen_synthetic) {
                    VFLUX::ConfigReader::SensorConfig sensors;
                    config.parseSensorConfig(sensors);

                    VFLUX::SyntheticConfig synth;
                    synth.flux = flux_mm_day / VFLUX::MM_PER_DAY_PER_M_PER_S;
                    synth.noise_std = noise;
                    synth.seed = static_cast<unsigned int>(seed);
                    if (!sensors.depths.empty()) {
                        synth.setSensors(sensors.names, sensors.depths);
                    }

                    VFLUX::SyntheticDataset dataset = VFLUX::generateSynthetic(medium, synth);
                    VFLUX::writeSyntheticCSV(synthetic_file, dataset);

                    PetscPrintf(comm, "Synthetic record for %.3f mm/day written to: %s\n",
                                (double)flux_mm_day, synthetic_file);
                    std::ostringstream table;
                    VFLUX::ReportWriter().printSignals(table, dataset.record.names, dataset.expected);
                    printBlock(comm, table.str());
                } else {
                    VFLUX::ConfigReader::SensorConfig sensors;
                    VFLUX::ConfigReader::InputConfig input;
                    VFLUX::ConfigReader::OutputConfig output;
                    VFLUX::ConfigReader::AnalysisConfig analysis;
                    config.parseSensorConfig(sensors);
                    config.parseInputConfig(input);
                    config.parseOutputConfig(output);
                    config.parseAnalysisConfig(analysis);
                    if (input_provided) input.file = input_file;
                    if (output_provided) output.file = output_file;

                    if (input.file.empty()) {
                        throw std::runtime_error("No temperature file given ([INPUT] file or -i)");
                    }

                    PetscPrintf(comm, "\n");
                    PetscPrintf(comm, "============================================================\n");
                    PetscPrintf(comm, "  VFLUX - Vertical flux from temperature time series\n");
                    PetscPrintf(comm, "============================================================\n");
                    PetscPrintf(comm, "\n");
                    if (config_provided) {
                        PetscPrintf(comm, "Config file:   %s\n", config_file);
                    }
                    PetscPrintf(comm, "Input file:    %s\n", input.file.c_str());
                    PetscPrintf(comm, "Diffusivity:   %.4e m2/s\n", medium.thermal_diffusivity);

                    auto series = VFLUX::loadCSV(input.file, input.time_columns,
                                                 input.temperature_columns);
                    VFLUX::TemperatureRecord record =
                        VFLUX::alignAndResample(series, input.resample_interval);
                    PetscPrintf(comm, "Samples:       %d every %.1f min\n",
                                (int)record.size(), input.resample_interval / 60.0);

                    VFLUX::HarmonicFitOptions options = config.buildFitOptions();
                    VFLUX::HarmonicExtractor extractor(options);
                    std::vector<double> time = record.timeIn(options.time_unit_seconds);

                    // Fit every sensor; a failed fit only removes that sensor
                    std::vector<VFLUX::HarmonicSignal> signals(record.sensorCount());
                    std::vector<bool> fitted(record.sensorCount(), false);
                    std::vector<std::string> fitted_names;
                    std::vector<VFLUX::HarmonicSignal> fitted_signals;
                    for (size_t s = 0; s < record.sensorCount(); ++s) {
                        try {
                            signals[s] = extractor.extract(time, record.temperatures[s]);
                            fitted[s] = true;
                            fitted_names.push_back(sensors.names[s]);
                            fitted_signals.push_back(signals[s]);
                        } catch (const VFLUX::FitConvergenceError& e) {
                            PetscPrintf(comm, "Sensor %s skipped: %s\n",
                                        sensors.names[s].c_str(), e.what());
                        } catch (const VFLUX::DomainError& e) {
                            PetscPrintf(comm, "Sensor %s skipped: %s\n",
                                        sensors.names[s].c_str(), e.what());
                        }
                    }

                    VFLUX::ReportWriter writer(output.flux_unit);
                    std::ostringstream table;
                    writer.printSignals(table, fitted_names, fitted_signals);
                    printBlock(comm, table.str());

                    std::vector<VFLUX::PairResult> rows;
                    for (const auto& pair : sensors.pairs) {
                        int a = pair.first, b = pair.second;
                        if (sensors.depths[a] > sensors.depths[b]) std::swap(a, b);

                        std::string label = sensors.names[a] + "-" + sensors.names[b];
                        if (!fitted[a] || !fitted[b]) {
                            PetscPrintf(comm, "\nSensor pair %s skipped: a fit failed\n",
                                        label.c_str());
                            continue;
                        }

                        VFLUX::PairResult row;
                        row.label = label;
                        row.depth_shallow = sensors.depths[a];
                        row.depth_deep = sensors.depths[b];
                        row.report = VFLUX::computeAllMethods(signals[a], signals[b], medium,
                                                              row.depth_deep - row.depth_shallow,
                                                              analysis.angular_frequency);

                        std::ostringstream pair_table;
                        writer.printReport(pair_table, label, row.report);
                        printBlock(comm, pair_table.str());
                        rows.push_back(row);
                    }

                    if (!output.file.empty()) {
                        writer.writeCSV(output.file, rows);
                        PetscPrintf(comm, "\nResults written to: %s\n", output.file.c_str());
                    }
                    PetscPrintf(comm, "\n============================================================\n");
                }
            } catch (const std::exception& e) {
                std::cerr << "\nError: " << e.what() << std::endl;
                status = 1;
            }
        }

        ierr = PetscFinalize();
        return status;
    }
}
