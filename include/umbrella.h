/*
 * Umbrella Sampling Driver Header
 *
 * Runs a set of biased simulations ("windows"), each pinned near a target
 * magnetization per site m0 by the harmonic bias k (m - m0)^2, and records
 * one magnetization histogram per window on bins shared by every window.
 *
 * Window lifecycle: INIT -> EQUILIBRATE -> MEASURE -> DONE
 *   INIT         assign target and spring constant, random initial lattice
 *   EQUILIBRATE  n_eq biased sweeps, nothing recorded
 *   MEASURE      n_steps biased sweeps, m histogrammed after every sweep
 *   DONE         histogram frozen
 */

#ifndef UMBRELLA_H
#define UMBRELLA_H

#include "energy.h"
#include "lattice.h"
#include "metropolis.h"
#include "mpi_wrapper.h"
#include "random.h"
#include "simulation_parameters.h"
#include <eigen3/Eigen/Dense>
#include <string>
#include <vector>

/**
 * Uniform magnetization bins shared by all windows
 *
 * Values outside [lower, upper) are clamped into the edge bins.
 */
class HistogramBins {
private:
    double lower;
    double upper;
    int num_bins;

public:
    /**
     * @throws IO::ConfigurationError if num_bins <= 0, upper <= lower or an edge is not finite
     */
    HistogramBins(double lower_edge, double upper_edge, int bins);

    /**
     * N + 1 bins of width 2/N centred on the attainable values
     * m = -1, -1 + 2/N, ..., 1 of an L x L lattice
     */
    static HistogramBins for_lattice(int lattice_size);

    int size() const { return num_bins; }
    double get_lower() const { return lower; }
    double get_upper() const { return upper; }
    double width() const { return (upper - lower) / num_bins; }

    int bin_index(double m) const;
    double bin_center(int bin) const { return lower + (bin + 0.5) * width(); }
    Eigen::ArrayXd centers() const;

    bool operator==(const HistogramBins& other) const {
        return lower == other.lower && upper == other.upper && num_bins == other.num_bins;
    }
    bool operator!=(const HistogramBins& other) const { return !(*this == other); }
};

enum class WindowState {
    INIT,
    EQUILIBRATE,
    MEASURE,
    DONE
};

std::string window_state_to_string(WindowState state);

/**
 * Result of one umbrella window
 */
struct UmbrellaWindow {
    int index = 0;
    UmbrellaBias bias{0.0, 0.0};
    Eigen::ArrayXd histogram;        // Counts per shared bin
    long int num_samples = 0;        // Sum of the histogram
    double mean_magnetization = 0.0; // Biased <m> of the window
    double acceptance_rate = 0.0;    // Measurement phase only
    WindowState state = WindowState::INIT;
    bool coverage_gap = false;
};

/**
 * Single-window state machine
 *
 * Owns its lattice and random source, so windows never share mutable state.
 */
class UmbrellaWindowRunner {
private:
    SimulationParameters params;
    HistogramBins bins;
    UmbrellaWindow window;
    MetropolisSampler sampler;
    MersenneTwisterSource rng;
    IsingLattice lattice;

    void require_state(WindowState expected, const char* operation) const;

public:
    /**
     * @param params Run parameters; params.seed seeds this window's random source
     * @param bias Target magnetization and spring constant
     * @param bins Shared histogram bins
     * @param index Window index, reported back in the result
     * @throws IO::ConfigurationError if params or bias are invalid
     */
    UmbrellaWindowRunner(const SimulationParameters& params, const UmbrellaBias& bias,
                         const HistogramBins& bins, int index = 0);

    void initialize();   // INIT -> EQUILIBRATE
    void equilibrate();  // EQUILIBRATE -> MEASURE
    void measure();      // MEASURE -> DONE

    // Perform the next transition; no-op once DONE
    void advance();

    // Drive the window to DONE and return the result
    const UmbrellaWindow& run();

    WindowState get_state() const { return window.state; }
    const UmbrellaWindow& get_window() const { return window; }
    const IsingLattice& get_lattice() const { return lattice; }
};

/**
 * Umbrella sampling setup for one temperature
 */
struct UmbrellaSettings {
    std::vector<double> targets;           // m0 per window
    std::vector<double> spring_constants;  // One shared value or one per window
    HistogramBins bins = HistogramBins(-1.0, 1.0, 21);
    double overlap_threshold = 1e-3;
    int equilibration_sweeps = -1;         // -1 -> params.equilibration_sweeps
    int measurement_sweeps = -1;           // -1 -> params.measurement_sweeps
    bool verbose = false;

    double spring_constant_for(size_t window) const;

    /**
     * @throws IO::ConfigurationError on empty targets, mismatched spring
     *         constants, negative or non-finite k, or non-finite targets
     */
    void validate() const;
};

// num_windows targets evenly spaced over [min_target, max_target]
std::vector<double> evenly_spaced_targets(int num_windows, double min_target, double max_target);

// Default spring constant k = N / 2 for the per-site bias
double default_spring_constant(int lattice_size);

/**
 * Overlap of two normalized histograms: sum over bins of min(p_a, p_b)
 * 0 for disjoint support, 1 for identical shapes
 */
double histogram_overlap(const Eigen::ArrayXd& a, const Eigen::ArrayXd& b);

/**
 * Flag windows whose histogram barely overlaps a neighbor (windows ordered
 * by target). Both windows of a weak pair are flagged; a warning is printed.
 * @return Number of weak neighbor pairs
 */
int flag_coverage_gaps(std::vector<UmbrellaWindow>& windows, double overlap_threshold, bool warn = true);

/**
 * Run every window serially, in target order
 * Window i uses seed derive_seed(params.seed, i).
 */
std::vector<UmbrellaWindow> run_umbrella_sampling(const SimulationParameters& params,
                                                  const UmbrellaSettings& settings);

/**
 * Run the windows owned by this rank (round-robin) and combine the
 * results so that every rank holds all windows
 */
std::vector<UmbrellaWindow> run_umbrella_sampling(const SimulationParameters& params,
                                                  const UmbrellaSettings& settings,
                                                  MPIEnvironment& mpi_env,
                                                  MPIAccumulator& mpi_accumulator);

#endif // UMBRELLA_H
