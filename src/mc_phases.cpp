/*
 * Monte Carlo Simulation Phases Implementation
 *
 * This module contains the warmup and measurement phases that are common
 * to every unbiased run. Both functions modify the lattice in place,
 * evolving the spin configuration through Metropolis sweeps.
 */

#include "../include/mc_phases.h"
#include "../include/energy.h"
#include "../include/io/diagnostic_utils.h"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <cmath>
#include <fstream>

/**
 * Run the warmup/equilibration phase of a Monte Carlo simulation
 *
 * Purpose:
 *   - Equilibrate the system from its initial configuration
 *   - Allow the simulation to "forget" the initial state
 *   - Optionally profile sweep timing for performance diagnostics
 *
 * Side effects:
 *   - MODIFIES lattice IN-PLACE
 *   - Advances the random source
 *   - Prints progress to stdout if verbose
 *
 * @return Pair of (warmup_time_seconds, sweep_time_estimate_seconds)
 */
std::pair<double, double> run_warmup_phase(
    MetropolisSampler& sampler,
    IsingLattice& lattice,
    RandomSource& rng,
    int warmup_steps,
    bool enable_profiling,
    bool verbose
) {
    if (verbose) {
        std::cout << "Warmup phase" << std::endl;
        std::cout << " Energy of the initial configuration: " << std::fixed << std::setprecision(6)
                  << total_energy(lattice, sampler.get_coupling(), sampler.get_field()) << std::endl;
    }

    auto warmup_start = std::chrono::high_resolution_clock::now();
    double sweep_time_estimate = 0.0;

    int profiled_sweeps = 0;
    if (enable_profiling && warmup_steps >= 1000) {
        // Time the first 1000 sweeps for the performance report
        auto timing_start = std::chrono::high_resolution_clock::now();
        for (; profiled_sweeps < 1000; profiled_sweeps++) {
            sampler.run_sweep(lattice, rng);
        }
        auto timing_end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = timing_end - timing_start;
        sweep_time_estimate = elapsed.count() / 1000.0;
    }

    for (int sweep = profiled_sweeps; sweep < warmup_steps; sweep++) {
        sampler.run_sweep(lattice, rng);
        if (verbose && (sweep + 1) % 1000 == 0) {
            std::cout << "  Warmup: " << (sweep + 1) << "/" << warmup_steps
                      << " (" << std::setprecision(1) << std::fixed
                      << (100.0 * (sweep + 1)) / warmup_steps << "%)" << std::endl;
        }
    }

    auto warmup_end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> warmup_elapsed = warmup_end - warmup_start;

    return {warmup_elapsed.count(), sweep_time_estimate};
}

/**
 * Run the measurement phase of a Monte Carlo simulation
 *
 * Purpose:
 *   - Collect samples of the magnetization and energy per site
 *   - Accumulate raw pair correlations (whole lattice and optional column)
 *   - Optionally dump configurations and evolution data for post-processing
 *
 * Implementation:
 *   - Performs measurement_steps sweeps
 *   - Samples observables every sampling_frequency sweeps
 *   - The magnetization is tracked by the lattice in O(1); the energy and
 *     correlations need a full lattice traversal per sample
 *
 * @return Pair of (MeasurementData with all samples, measurement_time_seconds)
 */
std::pair<MeasurementData, double> run_measurement_phase(
    MetropolisSampler& sampler,
    IsingLattice& lattice,
    RandomSource& rng,
    int measurement_steps,
    const SimulationParameters& params,
    const MeasurementOptions& options
) {
    if (options.sampling_frequency <= 0) {
        throw IO::ConfigurationError("Sampling frequency must be positive");
    }
    if (options.dump_every_n_measurements <= 0) {
        throw IO::ConfigurationError("dump_every_n_measurements must be positive");
    }

    if (options.verbose) {
        std::cout << std::endl;
        std::cout << "Measurement phase" << std::endl;
    }

    auto measurement_start = std::chrono::high_resolution_clock::now();

    // Acceptance statistics cover the measurement phase only
    sampler.reset_statistics();

    MeasurementData data;
    int expected_samples = measurement_steps / options.sampling_frequency + 1;
    data.energy_samples.reserve(expected_samples);
    data.magnetization_samples.reserve(expected_samples);

    if (options.measure_correlations) {
        int max_sep = resolve_max_separation(options.max_separation, lattice.size());
        data.correlations.emplace(max_sep, options.column);
    }

    std::ofstream obs_evolution_file;
    if (options.write_observable_evolution) {
        obs_evolution_file = IO::setup_observable_evolution_file(options.dump_dir, options.rank,
                                                                 params.temperature, params.field_h);
    }

    const double N = static_cast<double>(lattice.get_num_sites());
    int num_samples = 0;
    for (int sweep = 0; sweep < measurement_steps; sweep++) {
        sampler.run_sweep(lattice, rng);

        if (sweep % options.sampling_frequency == 0) {
            double m = lattice.get_magnetization();
            double e = total_energy(lattice, params.coupling_J, params.field_h) / N;

            data.magnetization_samples.push_back(m);
            data.energy_samples.push_back(e);
            if (data.correlations) {
                data.correlations->sample(lattice);
            }
            num_samples++;

            if (options.dump_configurations &&
                num_samples % options.dump_every_n_measurements == 0) {
                IO::dump_lattice_to_file(lattice, params.temperature, params.field_h,
                                         sweep, options.rank, options.dump_dir);
            }

            if (obs_evolution_file.is_open() &&
                num_samples % options.dump_every_n_measurements == 0) {
                IO::write_observable_evolution(obs_evolution_file, sweep, e, m, std::abs(m),
                                               sampler.get_acceptance_rate());
            }
        }

        // Progress updates every 5000 sweeps
        if (options.verbose && (sweep + 1) % 5000 == 0) {
            std::cout << "  Measurement: " << (sweep + 1) << "/" << measurement_steps
                      << " (" << std::setprecision(1) << std::fixed
                      << (100.0 * (sweep + 1)) / measurement_steps << "%)" << std::endl;
        }
    }

    data.acceptance_rate = sampler.get_acceptance_rate();

    auto measurement_end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> measurement_elapsed = measurement_end - measurement_start;

    return {data, measurement_elapsed.count()};
}

ObservableSnapshot summarize_measurements(const MeasurementData& data,
                                          const SimulationParameters& params) {
    ObservableSnapshot snapshot;
    snapshot.temperature = params.temperature;
    snapshot.field = params.field_h;
    snapshot.lattice_size = params.lattice_size;
    snapshot.seed = params.seed;
    snapshot.acceptance_rate = data.acceptance_rate;
    snapshot.magnetization_samples = data.magnetization_samples;

    // Mean and population variance
    auto compute_stats = [](const std::vector<double>& samples) -> std::pair<double, double> {
        if (samples.empty()) return {0.0, 0.0};
        double mean = 0.0;
        for (double x : samples) mean += x;
        mean /= samples.size();
        double variance = 0.0;
        for (double x : samples) variance += (x - mean) * (x - mean);
        variance /= samples.size();
        return {mean, variance};
    };

    auto [m_mean, m_var] = compute_stats(data.magnetization_samples);
    auto [e_mean, e_var] = compute_stats(data.energy_samples);

    double abs_m = 0.0;
    for (double m : data.magnetization_samples) abs_m += std::abs(m);
    if (!data.magnetization_samples.empty()) abs_m /= data.magnetization_samples.size();

    const double N = static_cast<double>(params.num_sites());
    const double T = params.temperature;

    snapshot.mean_magnetization = m_mean;
    snapshot.stddev_magnetization = std::sqrt(m_var);
    snapshot.mean_abs_magnetization = abs_m;
    snapshot.mean_energy = e_mean;
    snapshot.stddev_energy = std::sqrt(e_var);
    snapshot.specific_heat = N * e_var / (T * T);
    snapshot.susceptibility = N * m_var / T;

    if (data.correlations) {
        snapshot.raw_correlation = data.correlations->raw_correlation();
        snapshot.connected_correlation = data.correlations->connected_correlation();
        if (data.correlations->has_column()) {
            snapshot.column = data.correlations->get_column();
            snapshot.raw_column_correlation = data.correlations->raw_column_correlation();
            snapshot.connected_column_correlation = data.correlations->connected_column_correlation();
        }
    }

    return snapshot;
}

int resolve_max_separation(int max_separation, int lattice_size) {
    return max_separation < 0 ? lattice_size / 2 : max_separation;
}

void initialize_lattice(IsingLattice& lattice, const InitialConfiguration& initial, RandomSource& rng) {
    switch (initial.type) {
        case InitialState::ALL_UP:
            lattice.initialize_uniform(1);
            break;
        case InitialState::ALL_DOWN:
            lattice.initialize_uniform(-1);
            break;
        case InitialState::CUSTOM:
            lattice.initialize_custom(initial.spins);
            break;
        case InitialState::RANDOM:
        default:
            lattice.initialize_random(rng);
            break;
    }
}

RunResult run_simulation_point(const SimulationParameters& params,
                               const MeasurementOptions& options,
                               const InitialConfiguration& initial) {
    // Fails fast before any sweep
    MetropolisSampler sampler(params);

    if (options.column && (*options.column < 0 || *options.column >= params.lattice_size)) {
        throw IO::ConfigurationError("Correlation column " + std::to_string(*options.column) +
                                     " outside lattice of size " + std::to_string(params.lattice_size));
    }

    auto point_start = std::chrono::high_resolution_clock::now();

    MersenneTwisterSource rng(params.seed);
    IsingLattice lattice(params.lattice_size);
    initialize_lattice(lattice, initial, rng);

    RunResult result;

    auto [warmup_time, sweep_time] = run_warmup_phase(sampler, lattice, rng, params.equilibration_sweeps,
                                                      options.enable_profiling, options.verbose);
    result.timings.warmup_time = warmup_time;
    result.timings.sweep_time_estimate = sweep_time;

    auto [data, measurement_time] = run_measurement_phase(sampler, lattice, rng, params.measurement_sweeps,
                                                          params, options);
    result.timings.measurement_time = measurement_time;

    result.snapshot = summarize_measurements(data, params);

    if (options.estimate_autocorrelation) {
        result.magnetization_autocorrelation = estimate_autocorrelation(data.magnetization_samples);
        result.energy_autocorrelation = estimate_autocorrelation(data.energy_samples);
        result.magnetization_tau = integrated_autocorrelation_time(data.magnetization_samples);
        result.energy_tau = integrated_autocorrelation_time(data.energy_samples);
    }

    result.final_configuration = lattice.to_vector();

    auto point_end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> point_elapsed = point_end - point_start;
    result.timings.total_time = point_elapsed.count();

    return result;
}

ObservableSnapshot run_simulation(const SimulationParameters& params,
                                  const MeasurementOptions& options) {
    return run_simulation_point(params, options).snapshot;
}
