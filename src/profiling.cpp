/*
 * Profiling and Diagnostics Module Implementation
 */

#include "../include/profiling.h"
#include <iostream>
#include <iomanip>
#include <cmath>
#include <algorithm>

namespace {

// Mean and lag-0 variance of a series
std::pair<double, double> mean_and_variance(const std::vector<double>& series) {
    double mean = 0.0;
    for (double val : series) mean += val;
    mean /= series.size();

    double c0 = 0.0;
    for (double val : series) c0 += (val - mean) * (val - mean);
    return {mean, c0 / series.size()};
}

double autocovariance(const std::vector<double>& series, double mean, size_t lag) {
    double c = 0.0;
    for (size_t i = 0; i + lag < series.size(); i++) {
        c += (series[i] - mean) * (series[i + lag] - mean);
    }
    return c / (series.size() - lag);
}

} // namespace

double estimate_autocorrelation(const std::vector<double>& series, int lag) {
    if (lag < 0 || series.size() < static_cast<size_t>(lag) + 2) return 0.0;

    auto [mean, c0] = mean_and_variance(series);
    if (c0 <= 1e-15) return 0.0;
    return autocovariance(series, mean, static_cast<size_t>(lag)) / c0;
}

double estimate_autocorrelation_time(double rho) {
    if (rho >= 1.0) return 1e10;  // Frozen series
    if (rho <= -1.0) return 1.0;
    return (1.0 + rho) / (1.0 - rho);
}

double integrated_autocorrelation_time(const std::vector<double>& series, double window_factor) {
    if (series.size() < 3) return 1.0;

    auto [mean, c0] = mean_and_variance(series);
    if (c0 <= 1e-15) return 1.0;

    double tau = 1.0;
    const size_t max_window = series.size() / 2;
    for (size_t t = 1; t <= max_window; t++) {
        tau += 2.0 * autocovariance(series, mean, t) / c0;
        if (static_cast<double>(t) >= window_factor * tau / 2.0) break;
    }
    return std::max(tau, 1.0);
}

void print_profiling_report(const std::vector<PointTimings>& all_timings,
                            const std::string& point_name) {
    if (all_timings.empty()) return;

    double total_walltime = 0.0;
    double total_warmup = 0.0;
    double total_measurement = 0.0;
    double total_reweighting = 0.0;
    double total_comm = 0.0;
    double sweep_time = 0.0;

    for (const auto& t : all_timings) {
        total_walltime += t.total_time;
        total_warmup += t.warmup_time;
        total_measurement += t.measurement_time;
        total_reweighting += t.reweighting_time;
        total_comm += t.communication_time;
        if (sweep_time <= 0.0) sweep_time = t.sweep_time_estimate;
    }
    if (total_walltime <= 0.0) total_walltime = 1e-12;

    auto share = [total_walltime](double part) { return 100.0 * part / total_walltime; };

    std::cout << "\n========================================" << std::endl;
    std::cout << "  PROFILING SUMMARY (rank 0)" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Wall time over " << all_timings.size() << " " << point_name
              << (all_timings.size() == 1 ? "" : "s") << ": " << total_walltime << " s" << std::endl;
    std::cout << "  Warmup:        " << std::setw(10) << total_warmup << " s (" << share(total_warmup) << "%)" << std::endl;
    std::cout << "  Measurement:   " << std::setw(10) << total_measurement << " s (" << share(total_measurement) << "%)" << std::endl;
    if (total_reweighting > 0.0) {
        std::cout << "  WHAM:          " << std::setw(10) << total_reweighting << " s (" << share(total_reweighting) << "%)" << std::endl;
    }
    std::cout << "  Communication: " << std::setw(10) << total_comm << " s (" << share(total_comm) << "%)" << std::endl;

    if (sweep_time > 0.0) {
        std::cout << "Sweep rate: " << std::setprecision(0) << 1.0 / sweep_time << " sweeps/s ("
                  << std::scientific << std::setprecision(3) << sweep_time << " s/sweep)" << std::endl;
    }
    std::cout << std::fixed << "Average per " << point_name << ": " << std::setprecision(2)
              << total_walltime / all_timings.size() << " s" << std::endl;
    std::cout << "========================================\n" << std::endl;
}

void print_barrier_statistics(const std::vector<double>& all_barrier_times) {
    if (all_barrier_times.empty()) return;

    auto [avg_wait, variance] = mean_and_variance(all_barrier_times);
    double max_wait = *std::max_element(all_barrier_times.begin(), all_barrier_times.end());

    std::cout << "  Load imbalance at final barrier: max wait " << std::fixed << std::setprecision(4)
              << max_wait << " s, mean " << avg_wait << " s, std " << std::sqrt(variance)
              << " s over " << all_barrier_times.size() << " ranks" << std::endl;
}

void print_point_timing(const PointTimings& timings) {
    std::cout << "  Timing: " << std::fixed << std::setprecision(2) << timings.total_time << " s"
              << " (warmup " << timings.warmup_time << " s, measurement " << timings.measurement_time << " s";
    if (timings.reweighting_time > 0.0) {
        std::cout << ", WHAM " << timings.reweighting_time << " s";
    }
    std::cout << ")" << std::endl;

    if (timings.sweep_time_estimate > 0.0) {
        std::cout << "  Sweep time: " << std::scientific << std::setprecision(2)
                  << timings.sweep_time_estimate << " s/sweep" << std::fixed << std::endl;
    }
}
