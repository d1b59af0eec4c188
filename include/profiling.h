/*
 * Profiling and Diagnostics Module
 *
 * Timing of the phases of a simulated point (warmup, measurement,
 * reweighting, communication) and autocorrelation estimates of the
 * sampled time series.
 */

#ifndef PROFILING_H
#define PROFILING_H

#include <string>
#include <vector>
#include <chrono>

/**
 * Timing data for one simulated point (grid point or umbrella temperature)
 */
struct PointTimings {
    double warmup_time = 0.0;
    double measurement_time = 0.0;
    double reweighting_time = 0.0;     // WHAM solve, rank 0 only
    double communication_time = 0.0;
    double total_time = 0.0;
    double sweep_time_estimate = 0.0;  // Time per sweep from warmup sampling
};

/**
 * Normalized autocorrelation rho(lag) of a time series
 *
 * @return 0 for a constant series or one shorter than lag + 2 samples
 */
double estimate_autocorrelation(const std::vector<double>& series, int lag = 1);

/**
 * Statistical inefficiency of an exponentially correlated series
 * from its lag-1 coefficient: tau = (1 + rho) / (1 - rho)
 */
double estimate_autocorrelation_time(double rho);

/**
 * Statistical inefficiency tau = 1 + 2 sum_t rho(t), summed up to the
 * first window W with W >= window_factor * tau / 2 (automatic windowing).
 * The variance of the sample mean is var / n * tau.
 *
 * @return 1 for uncorrelated or too short series
 */
double integrated_autocorrelation_time(const std::vector<double>& series, double window_factor = 5.0);

/**
 * Print profiling report over all simulated points
 *
 * @param all_timings One entry per point
 * @param point_name What a point is ("grid point", "temperature", ...)
 */
void print_profiling_report(const std::vector<PointTimings>& all_timings,
                            const std::string& point_name);

/**
 * Print barrier synchronization statistics
 *
 * @param all_barrier_times Barrier wait times from all MPI ranks
 */
void print_barrier_statistics(const std::vector<double>& all_barrier_times);

// One-line timing summary of a point
void print_point_timing(const PointTimings& timings);

#endif // PROFILING_H
