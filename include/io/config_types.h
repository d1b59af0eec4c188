#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <stdexcept>

namespace IO {

/**
 * Exception for configuration parsing and validation errors
 */
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Monte Carlo simulation parameters
 */
struct MonteCarloConfig {
    int warmup_steps = 1000;             // n_eq sweeps
    int measurement_steps = 5000;        // n_steps sweeps
    int sampling_frequency = 1;          // Measure every N sweeps
    int independent_runs = 1;            // Runs averaged per grid point (temperature_scan)
    long int seed = 42;
    std::string site_selection = "random";  // "random" or "raster"
};

/**
 * Scan configuration - used for both temperature and field.
 * Supports a single value, an explicit list, or a min/max/step range.
 */
struct ScanConfig {
    enum Type { SINGLE, LIST, SCAN };
    Type type = SINGLE;

    // For single value
    double value = 0.0;

    // For explicit list
    std::vector<double> values;

    // For range scan (inclusive of both ends)
    double min_value = 0.0;
    double max_value = 0.0;
    double step = 0.0;
};

/**
 * Correlation measurement options
 */
struct CorrelationConfig {
    std::vector<int> separations = {1, 2, 3, 5, 10};  // Reported separations in temperature_scan
    std::vector<int> columns = {4};                   // Columns analysed in column_correlation mode
    int max_separation = -1;                          // -1 -> L/2
};

/**
 * Umbrella sampling options
 */
struct UmbrellaConfig {
    int num_windows = 31;
    double min_target = -1.0;
    double max_target = 1.0;
    std::vector<double> targets;            // Explicit targets override num_windows/min/max

    double spring_constant = -1.0;          // Shared k, -1 -> N/2
    std::vector<double> spring_constants;   // Optional per-window k

    int num_bins = -1;                      // -1 -> N+1 bins centred on attainable m
    bool explicit_bin_edges = false;
    double bin_min = -1.0;
    double bin_max = 1.0;

    double overlap_threshold = 1e-3;        // Coverage gap flag threshold
    int warmup_steps = -1;                  // -1 -> monte_carlo.warmup_steps
    int measurement_steps = -1;             // -1 -> monte_carlo.measurement_steps
    bool compare_exact = true;              // Enumerate exact P(m) when L <= 5
};

/**
 * WHAM solver options
 */
struct WhamConfig {
    double tolerance = 1e-6;
    int max_iterations = 5000;
};

/**
 * Output configuration
 */
struct OutputConfig {
    std::string base_name = "umbrising";
    std::string directory = ".";
    bool verbose = true;                    // Progress lines during long phases
};

/**
 * Initial configuration options
 */
struct InitializationConfig {
    enum Type { RANDOM, UP, DOWN, FILE };
    Type type = RANDOM;

    // For FILE type: lattice dump written by a previous run
    std::string file;
};

/**
 * Diagnostic and profiling options
 */
struct DiagnosticConfig {
    bool enable_profiling = false;                // Enable timing/profiling output
    bool enable_config_dump = false;              // Enable lattice dumps during measurement
    bool enable_observable_evolution = false;     // Track observable evolution during measurement
    bool dump_final_configuration = false;        // Dump the final lattice for restart

    // Configuration dump options
    std::vector<int> dump_ranks;                  // Which ranks to dump (empty = none)
    bool dump_all_ranks = false;                  // If true, dump all ranks
    int dump_every_n_measurements = 10;           // Dump every N measurements

    bool estimate_autocorrelation = true;         // Estimate autocorrelation times (printed to stdout)

    // Helper to check if a specific rank should dump
    bool should_dump_rank(int rank) const {
        if (!enable_config_dump && !enable_observable_evolution && !dump_final_configuration) return false;
        if (dump_all_ranks) return true;
        return std::find(dump_ranks.begin(), dump_ranks.end(), rank) != dump_ranks.end();
    }
};

/**
 * Complete simulation configuration
 */
struct SimulationConfig {
    // Simulation parameters
    std::string simulation_type = "single_point";
    int lattice_size = 20;
    double coupling_J = 1.0;

    // Temperature and field grids
    ScanConfig temperature;
    ScanConfig field;

    // Monte Carlo parameters
    MonteCarloConfig monte_carlo;

    // Measurement settings
    CorrelationConfig correlation;

    // Umbrella sampling and reweighting
    UmbrellaConfig umbrella;
    WhamConfig wham;

    // Output settings
    OutputConfig output;

    // Diagnostic settings (optional)
    DiagnosticConfig diagnostics;

    // Initialization settings (optional)
    InitializationConfig initialization;
};

} // namespace IO
