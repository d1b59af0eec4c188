/*
 * WHAM Solver Header
 *
 * Weighted Histogram Analysis Method: combines the biased magnetization
 * histograms of all umbrella windows into one unbiased distribution P(m).
 *
 * Self-consistent equations (k_i, m0_i, n_i per window, bins b):
 *   P(b)  = sum_i h_i(b) / sum_i n_i exp[(f_i - bias_i(b)) / T]
 *   f_i   = -T ln sum_b P(b) exp[-bias_i(b) / T]
 *   bias_i(b) = k_i (m_b - m0_i)^2
 * iterated from f_i = 0 (or given offsets) until max |df_i| < tolerance.
 *
 * All sums are evaluated as log-sum-exp over an Eigen (windows x bins)
 * matrix, so no denominator can underflow. Bins without any count are
 * excluded from the normalization instead of being given P = 0.
 */

#ifndef WHAM_H
#define WHAM_H

#include "umbrella.h"
#include <eigen3/Eigen/Dense>
#include <vector>

struct WhamOptions {
    double tolerance = 1e-6;
    int max_iterations = 5000;
    std::vector<double> initial_offsets;  // Empty -> all zero

    // @throws IO::ConfigurationError if tolerance <= 0 or max_iterations <= 0
    void validate() const;
};

struct WhamResult {
    Eigen::ArrayXd magnetization;   // Bin centers
    Eigen::ArrayXd probability;     // Mass per bin, sums to 1 over included bins, 0 elsewhere
    Eigen::ArrayXd free_energy;     // -T ln P, +inf on excluded bins
    Eigen::ArrayXd offsets;         // f_i per window
    std::vector<bool> included;     // Bins with non-zero total count
    int iterations = 0;
    bool converged = false;
    double max_offset_change = 0.0; // max |df_i| of the last iteration
};

class WhamSolver {
private:
    HistogramBins bins;
    double temperature;
    int num_windows;

    std::vector<int> included_bins;        // Indices of bins with counts
    std::vector<int> active_windows;       // Windows with n_i > 0
    Eigen::ArrayXd log_total_counts;       // ln sum_i h_i(b), included bins
    Eigen::ArrayXd log_num_samples;        // ln n_i, active windows
    Eigen::ArrayXXd scaled_bias;           // bias_i(b) / T, all windows x included bins

    Eigen::ArrayXd log_probability(const Eigen::ArrayXd& offsets) const;
    Eigen::ArrayXd update_offsets(const Eigen::ArrayXd& log_p) const;

public:
    /**
     * @param bins Bins shared by every window
     * @param windows Completed umbrella windows
     * @param temperature Simulation temperature
     * @throws IO::ConfigurationError if temperature <= 0 or not finite
     * @throws std::invalid_argument if windows is empty, a histogram does not
     *         match the bins, or no bin holds any count
     */
    WhamSolver(const HistogramBins& bins, const std::vector<UmbrellaWindow>& windows, double temperature);

    /**
     * Iterate to self-consistency. Non-convergence is reported in the
     * result, never thrown.
     */
    WhamResult solve(const WhamOptions& options = WhamOptions()) const;

    int get_num_windows() const { return num_windows; }
    int get_num_included_bins() const { return static_cast<int>(included_bins.size()); }
    double get_temperature() const { return temperature; }
};

// ln sum exp(x), -inf for an empty or all -inf input
double log_sum_exp(const Eigen::ArrayXd& x);

// Bin center minimizing F(m); the most negative one on ties
double most_probable_magnetization(const WhamResult& result);

#endif // WHAM_H
