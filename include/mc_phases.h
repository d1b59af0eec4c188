/*
 * Monte Carlo Simulation Phases
 *
 * Handles warmup and measurement phases of Monte Carlo simulations
 * Separated from main control flow for modularity and reusability
 */

#ifndef MC_PHASES_H
#define MC_PHASES_H

#include "lattice.h"
#include "metropolis.h"
#include "observables.h"
#include "profiling.h"
#include "random.h"
#include "simulation_parameters.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * Options controlling what is sampled during the measurement phase
 */
struct MeasurementOptions {
    int sampling_frequency = 1;           // Sample every N sweeps
    bool measure_correlations = true;
    int max_separation = -1;              // -1 -> L / 2
    std::optional<int> column;            // Column for the column-specific correlation
    bool estimate_autocorrelation = true;
    bool enable_profiling = false;
    bool verbose = false;                 // Progress lines (caller decides which rank)

    // Diagnostics
    bool dump_configurations = false;
    bool write_observable_evolution = false;
    int dump_every_n_measurements = 10;
    std::string dump_dir = ".";
    int rank = 0;
};

/**
 * Initial spin configuration of a run
 */
enum class InitialState {
    RANDOM,
    ALL_UP,
    ALL_DOWN,
    CUSTOM
};

struct InitialConfiguration {
    InitialState type = InitialState::RANDOM;
    std::vector<int> spins;  // Row-major, used for CUSTOM
};

// Structure to hold measurement data during measurement phase
struct MeasurementData {
    std::vector<double> energy_samples;         // E / N per sample
    std::vector<double> magnetization_samples;  // m per sample
    std::optional<CorrelationAccumulator> correlations;
    double acceptance_rate = 0.0;
};

/**
 * Result of one complete run: summary, timings and final state
 */
struct RunResult {
    ObservableSnapshot snapshot;
    PointTimings timings;
    double magnetization_autocorrelation = 0.0;  // Lag-1 rho of the m series
    double energy_autocorrelation = 0.0;
    double magnetization_tau = 1.0;              // Integrated, in samples
    double energy_tau = 1.0;
    std::vector<int> final_configuration;
};

/**
 * Run the warmup phase of the simulation
 * @param sampler Metropolis sampler
 * @param lattice Lattice evolved in place
 * @param rng Random source of the run
 * @param warmup_steps Number of warmup sweeps
 * @param enable_profiling Whether to time the first 1000 sweeps
 * @param verbose Print progress every 1000 sweeps
 * @return Time taken for warmup in seconds, and the per-sweep time estimate
 */
std::pair<double, double> run_warmup_phase(
    MetropolisSampler& sampler,
    IsingLattice& lattice,
    RandomSource& rng,
    int warmup_steps,
    bool enable_profiling,
    bool verbose
);

/**
 * Run the measurement phase of the simulation
 * @param sampler Metropolis sampler (statistics are reset first)
 * @param lattice Lattice evolved in place
 * @param rng Random source of the run
 * @param measurement_steps Number of measurement sweeps
 * @param params Run parameters (coupling and field for the energy, T for file naming)
 * @param options Sampling options
 * @return MeasurementData containing all sampled observables and measurement time
 */
std::pair<MeasurementData, double> run_measurement_phase(
    MetropolisSampler& sampler,
    IsingLattice& lattice,
    RandomSource& rng,
    int measurement_steps,
    const SimulationParameters& params,
    const MeasurementOptions& options
);

/**
 * Reduce sampled series to the summary statistics of a snapshot
 */
ObservableSnapshot summarize_measurements(const MeasurementData& data,
                                          const SimulationParameters& params);

// Resolve max_separation = -1 to L / 2
int resolve_max_separation(int max_separation, int lattice_size);

void initialize_lattice(IsingLattice& lattice, const InitialConfiguration& initial, RandomSource& rng);

/**
 * Full run: validate, initialize, n_eq warmup sweeps, n_steps measurement sweeps
 * @throws IO::ConfigurationError if params are invalid
 */
RunResult run_simulation_point(const SimulationParameters& params,
                               const MeasurementOptions& options,
                               const InitialConfiguration& initial = InitialConfiguration());

/**
 * Convenience form returning only the snapshot of a random-start run
 */
ObservableSnapshot run_simulation(const SimulationParameters& params,
                                  const MeasurementOptions& options = MeasurementOptions());

#endif // MC_PHASES_H
