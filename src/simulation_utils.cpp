/*
 * Simulation Utilities Implementation
 */

#include "../include/simulation_utils.h"
#include "../include/io/diagnostic_utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>

std::vector<double> expand_scan(const IO::ScanConfig& scan, const std::string& name) {
    switch (scan.type) {
        case IO::ScanConfig::SINGLE:
            return {scan.value};

        case IO::ScanConfig::LIST:
            if (scan.values.empty()) {
                throw IO::ConfigurationError("Empty " + name + " list");
            }
            return scan.values;

        case IO::ScanConfig::SCAN: {
            if (!(scan.step > 0.0) || scan.max_value < scan.min_value) {
                throw IO::ConfigurationError("Invalid " + name + " range: need step > 0 and max >= min");
            }
            std::vector<double> grid;
            int num_points = static_cast<int>(std::floor((scan.max_value - scan.min_value) / scan.step + 0.5)) + 1;
            grid.reserve(num_points);
            for (int n = 0; n < num_points; n++) {
                grid.push_back(scan.min_value + n * scan.step);
            }
            return grid;
        }
    }
    throw IO::ConfigurationError("Unknown " + name + " scan type");
}

SimulationParameters create_parameters_from_config(const IO::SimulationConfig& config,
                                                   double T, double h, long int seed) {
    SimulationParameters params;
    params.lattice_size = config.lattice_size;
    params.temperature = T;
    params.coupling_J = config.coupling_J;
    params.field_h = h;
    params.equilibration_sweeps = config.monte_carlo.warmup_steps;
    params.measurement_sweeps = config.monte_carlo.measurement_steps;
    params.seed = seed;
    params.site_selection = site_selection_from_string(config.monte_carlo.site_selection);
    return params;
}

MeasurementOptions create_measurement_options_from_config(const IO::SimulationConfig& config,
                                                         int rank,
                                                         const std::string& dump_dir) {
    MeasurementOptions options;
    options.sampling_frequency = config.monte_carlo.sampling_frequency;
    options.measure_correlations = true;
    options.max_separation = config.correlation.max_separation;
    options.estimate_autocorrelation = config.diagnostics.estimate_autocorrelation;
    options.enable_profiling = config.diagnostics.enable_profiling;
    options.verbose = config.output.verbose && rank == 0;

    bool dump_this_rank = config.diagnostics.should_dump_rank(rank);
    options.dump_configurations = config.diagnostics.enable_config_dump && dump_this_rank;
    options.write_observable_evolution = config.diagnostics.enable_observable_evolution && dump_this_rank;
    options.dump_every_n_measurements = config.diagnostics.dump_every_n_measurements;
    options.dump_dir = dump_dir;
    options.rank = rank;
    return options;
}

UmbrellaSettings create_umbrella_settings_from_config(const IO::SimulationConfig& config) {
    const IO::UmbrellaConfig& uc = config.umbrella;
    UmbrellaSettings settings;

    if (!uc.targets.empty()) {
        settings.targets = uc.targets;
    } else {
        settings.targets = evenly_spaced_targets(uc.num_windows, uc.min_target, uc.max_target);
    }

    if (!uc.spring_constants.empty()) {
        settings.spring_constants = uc.spring_constants;
    } else if (uc.spring_constant >= 0.0) {
        settings.spring_constants = {uc.spring_constant};
    } else {
        settings.spring_constants = {default_spring_constant(config.lattice_size)};
    }

    if (uc.num_bins > 0) {
        double lower = uc.explicit_bin_edges ? uc.bin_min : -1.0;
        double upper = uc.explicit_bin_edges ? uc.bin_max : 1.0;
        settings.bins = HistogramBins(lower, upper, uc.num_bins);
    } else if (uc.explicit_bin_edges) {
        // Edges given without a count: one bin per attainable m spacing
        const int N = config.lattice_size * config.lattice_size;
        int bins = std::max(1, static_cast<int>(std::lround((uc.bin_max - uc.bin_min) * N / 2.0)));
        settings.bins = HistogramBins(uc.bin_min, uc.bin_max, bins);
    } else {
        settings.bins = HistogramBins::for_lattice(config.lattice_size);
    }

    settings.overlap_threshold = uc.overlap_threshold;
    settings.equilibration_sweeps = uc.warmup_steps;
    settings.measurement_sweeps = uc.measurement_steps;
    settings.verbose = config.output.verbose;

    settings.validate();
    return settings;
}

WhamOptions create_wham_options_from_config(const IO::SimulationConfig& config) {
    WhamOptions options;
    options.tolerance = config.wham.tolerance;
    options.max_iterations = config.wham.max_iterations;
    options.validate();
    return options;
}

InitialConfiguration create_initial_configuration_from_config(const IO::SimulationConfig& config) {
    InitialConfiguration initial;
    switch (config.initialization.type) {
        case IO::InitializationConfig::UP:
            initial.type = InitialState::ALL_UP;
            break;
        case IO::InitializationConfig::DOWN:
            initial.type = InitialState::ALL_DOWN;
            break;
        case IO::InitializationConfig::FILE: {
            int dumped_size = 0;
            initial.spins = IO::load_lattice_from_file(config.initialization.file, dumped_size);
            if (dumped_size != config.lattice_size) {
                throw IO::ConfigurationError("Initial configuration " + config.initialization.file +
                                             " has L = " + std::to_string(dumped_size) +
                                             ", expected L = " + std::to_string(config.lattice_size));
            }
            initial.type = InitialState::CUSTOM;
            std::cout << "Loaded initial configuration from " << config.initialization.file << std::endl;
            break;
        }
        case IO::InitializationConfig::RANDOM:
        default:
            initial.type = InitialState::RANDOM;
            break;
    }
    return initial;
}
