/*
 * WHAM Solver Implementation
 */

#include "../include/wham.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

void WhamOptions::validate() const {
    if (!std::isfinite(tolerance) || tolerance <= 0.0) {
        throw IO::ConfigurationError("WHAM tolerance must be positive");
    }
    if (max_iterations <= 0) {
        throw IO::ConfigurationError("WHAM max_iterations must be positive");
    }
}

double log_sum_exp(const Eigen::ArrayXd& x) {
    if (x.size() == 0) return -std::numeric_limits<double>::infinity();
    double max = x.maxCoeff();
    if (!std::isfinite(max)) return max;
    return max + std::log((x - max).exp().sum());
}

WhamSolver::WhamSolver(const HistogramBins& shared_bins, const std::vector<UmbrellaWindow>& windows,
                       double T)
    : bins(shared_bins), temperature(T), num_windows(static_cast<int>(windows.size())) {
    if (!std::isfinite(temperature) || temperature <= 0.0) {
        throw IO::ConfigurationError("WHAM temperature must be positive, got " + std::to_string(temperature));
    }
    if (windows.empty()) {
        throw std::invalid_argument("WHAM needs at least one window");
    }

    const int num_bins = bins.size();
    Eigen::ArrayXd total_counts = Eigen::ArrayXd::Zero(num_bins);
    std::vector<double> window_counts(num_windows);

    for (int i = 0; i < num_windows; i++) {
        const auto& histogram = windows[i].histogram;
        if (histogram.size() != num_bins) {
            throw std::invalid_argument("Window " + std::to_string(i) + " histogram has " +
                                        std::to_string(histogram.size()) + " bins, expected " +
                                        std::to_string(num_bins));
        }
        total_counts += histogram;
        window_counts[i] = histogram.sum();
        if (window_counts[i] > 0.0) active_windows.push_back(i);
    }

    for (int b = 0; b < num_bins; b++) {
        if (total_counts(b) > 0.0) included_bins.push_back(b);
    }
    if (included_bins.empty()) {
        throw std::invalid_argument("WHAM input holds no samples");
    }

    const int num_included = static_cast<int>(included_bins.size());
    log_total_counts.resize(num_included);
    scaled_bias.resize(num_windows, num_included);
    for (int c = 0; c < num_included; c++) {
        int b = included_bins[c];
        log_total_counts(c) = std::log(total_counts(b));
        double m = bins.bin_center(b);
        for (int i = 0; i < num_windows; i++) {
            scaled_bias(i, c) = windows[i].bias.potential(m) / temperature;
        }
    }

    log_num_samples.resize(active_windows.size());
    for (size_t a = 0; a < active_windows.size(); a++) {
        log_num_samples(a) = std::log(window_counts[active_windows[a]]);
    }
}

Eigen::ArrayXd WhamSolver::log_probability(const Eigen::ArrayXd& offsets) const {
    const int num_included = static_cast<int>(included_bins.size());
    const int num_active = static_cast<int>(active_windows.size());

    // ln denom(b) = lse_i [ln n_i + f_i / T - bias_i(b) / T]
    Eigen::ArrayXd log_p(num_included);
    Eigen::ArrayXd terms(num_active);
    for (int c = 0; c < num_included; c++) {
        for (int a = 0; a < num_active; a++) {
            int i = active_windows[a];
            terms(a) = log_num_samples(a) + offsets(i) / temperature - scaled_bias(i, c);
        }
        log_p(c) = log_total_counts(c) - log_sum_exp(terms);
    }

    return log_p - log_sum_exp(log_p);
}

Eigen::ArrayXd WhamSolver::update_offsets(const Eigen::ArrayXd& log_p) const {
    Eigen::ArrayXd offsets(num_windows);
    for (int i = 0; i < num_windows; i++) {
        Eigen::ArrayXd terms = log_p - scaled_bias.row(i).transpose();
        offsets(i) = -temperature * log_sum_exp(terms);
    }
    return offsets;
}

WhamResult WhamSolver::solve(const WhamOptions& options) const {
    options.validate();

    Eigen::ArrayXd offsets = Eigen::ArrayXd::Zero(num_windows);
    if (!options.initial_offsets.empty()) {
        if (static_cast<int>(options.initial_offsets.size()) != num_windows) {
            throw std::invalid_argument("WHAM initial offsets: expected " + std::to_string(num_windows) +
                                        " values, got " + std::to_string(options.initial_offsets.size()));
        }
        offsets = Eigen::Map<const Eigen::ArrayXd>(options.initial_offsets.data(), num_windows);
    }

    WhamResult result;

    for (int iteration = 1; iteration <= options.max_iterations; iteration++) {
        Eigen::ArrayXd new_offsets = update_offsets(log_probability(offsets));
        result.max_offset_change = (new_offsets - offsets).abs().maxCoeff();
        offsets = new_offsets;
        result.iterations = iteration;

        if (result.max_offset_change < options.tolerance) {
            result.converged = true;
            break;
        }
    }

    // Distribution consistent with the returned offsets
    Eigen::ArrayXd log_p = log_probability(offsets);

    const int num_bins = bins.size();
    result.magnetization = bins.centers();
    result.probability = Eigen::ArrayXd::Zero(num_bins);
    result.free_energy = Eigen::ArrayXd::Constant(num_bins, std::numeric_limits<double>::infinity());
    result.included.assign(num_bins, false);
    for (size_t c = 0; c < included_bins.size(); c++) {
        int b = included_bins[c];
        result.included[b] = true;
        result.probability(b) = std::exp(log_p(c));
        result.free_energy(b) = -temperature * log_p(c);
    }
    result.offsets = offsets;

    return result;
}

double most_probable_magnetization(const WhamResult& result) {
    int best = -1;
    for (int b = 0; b < result.free_energy.size(); b++) {
        if (!result.included[b]) continue;
        if (best < 0 || result.free_energy(b) < result.free_energy(best)) best = b;
    }
    if (best < 0) {
        throw std::invalid_argument("WHAM result has no included bins");
    }
    return result.magnetization(best);
}
