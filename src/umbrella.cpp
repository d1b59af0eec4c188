/*
 * Umbrella Sampling Driver Implementation
 */

#include "../include/umbrella.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>
#include <stdexcept>

// HistogramBins

HistogramBins::HistogramBins(double lower_edge, double upper_edge, int bins)
    : lower(lower_edge), upper(upper_edge), num_bins(bins) {
    if (num_bins <= 0) {
        throw IO::ConfigurationError("Histogram needs at least one bin");
    }
    if (!std::isfinite(lower) || !std::isfinite(upper) || upper <= lower) {
        throw IO::ConfigurationError("Histogram edges must be finite with upper > lower");
    }
}

HistogramBins HistogramBins::for_lattice(int lattice_size) {
    if (lattice_size <= 0) {
        throw IO::ConfigurationError("Lattice size must be positive");
    }
    const int N = lattice_size * lattice_size;
    const double half_width = 1.0 / N;
    return HistogramBins(-1.0 - half_width, 1.0 + half_width, N + 1);
}

int HistogramBins::bin_index(double m) const {
    int bin = static_cast<int>(std::floor((m - lower) / width()));
    return std::clamp(bin, 0, num_bins - 1);
}

Eigen::ArrayXd HistogramBins::centers() const {
    Eigen::ArrayXd c(num_bins);
    for (int b = 0; b < num_bins; b++) c(b) = bin_center(b);
    return c;
}

std::string window_state_to_string(WindowState state) {
    switch (state) {
        case WindowState::INIT:        return "INIT";
        case WindowState::EQUILIBRATE: return "EQUILIBRATE";
        case WindowState::MEASURE:     return "MEASURE";
        case WindowState::DONE:        return "DONE";
    }
    return "UNKNOWN";
}

// UmbrellaWindowRunner

UmbrellaWindowRunner::UmbrellaWindowRunner(const SimulationParameters& run_params, const UmbrellaBias& bias,
                                           const HistogramBins& shared_bins, int index)
    : params(run_params), bins(shared_bins), sampler(run_params, bias),
      rng(run_params.seed), lattice(run_params.lattice_size) {
    window.index = index;
    window.bias = bias;
    window.histogram = Eigen::ArrayXd::Zero(bins.size());
    window.state = WindowState::INIT;
}

void UmbrellaWindowRunner::require_state(WindowState expected, const char* operation) const {
    if (window.state != expected) {
        throw std::runtime_error(std::string("Umbrella window ") + std::to_string(window.index) +
                                 ": " + operation + " called in state " +
                                 window_state_to_string(window.state));
    }
}

void UmbrellaWindowRunner::initialize() {
    require_state(WindowState::INIT, "initialize");
    lattice.initialize_random(rng);
    window.state = WindowState::EQUILIBRATE;
}

void UmbrellaWindowRunner::equilibrate() {
    require_state(WindowState::EQUILIBRATE, "equilibrate");
    for (int sweep = 0; sweep < params.equilibration_sweeps; sweep++) {
        sampler.run_sweep(lattice, rng);
    }
    window.state = WindowState::MEASURE;
}

void UmbrellaWindowRunner::measure() {
    require_state(WindowState::MEASURE, "measure");
    sampler.reset_statistics();

    double sum_m = 0.0;
    for (int sweep = 0; sweep < params.measurement_sweeps; sweep++) {
        sampler.run_sweep(lattice, rng);
        double m = lattice.get_magnetization();
        window.histogram(bins.bin_index(m)) += 1.0;
        sum_m += m;
    }

    window.num_samples = params.measurement_sweeps;
    window.mean_magnetization = sum_m / params.measurement_sweeps;
    window.acceptance_rate = sampler.get_acceptance_rate();
    window.state = WindowState::DONE;
}

void UmbrellaWindowRunner::advance() {
    switch (window.state) {
        case WindowState::INIT:        initialize();  break;
        case WindowState::EQUILIBRATE: equilibrate(); break;
        case WindowState::MEASURE:     measure();     break;
        case WindowState::DONE:                       break;
    }
}

const UmbrellaWindow& UmbrellaWindowRunner::run() {
    while (window.state != WindowState::DONE) {
        advance();
    }
    return window;
}

// UmbrellaSettings

double UmbrellaSettings::spring_constant_for(size_t window) const {
    if (spring_constants.size() == 1) return spring_constants[0];
    return spring_constants.at(window);
}

void UmbrellaSettings::validate() const {
    if (targets.empty()) {
        throw IO::ConfigurationError("Umbrella sampling needs at least one window");
    }
    if (spring_constants.size() != 1 && spring_constants.size() != targets.size()) {
        throw IO::ConfigurationError("Umbrella spring constants: give one shared value or one per window (" +
                                     std::to_string(targets.size()) + " windows, " +
                                     std::to_string(spring_constants.size()) + " values)");
    }
    for (double k : spring_constants) {
        if (!std::isfinite(k) || k < 0.0) {
            throw IO::ConfigurationError("Umbrella spring constant must be finite and non-negative");
        }
    }
    for (double m0 : targets) {
        if (!std::isfinite(m0)) {
            throw IO::ConfigurationError("Umbrella target magnetization must be finite");
        }
    }
    if (!std::isfinite(overlap_threshold) || overlap_threshold < 0.0) {
        throw IO::ConfigurationError("Umbrella overlap threshold must be finite and non-negative");
    }
    if (equilibration_sweeps == 0 || equilibration_sweeps < -1 ||
        measurement_sweeps == 0 || measurement_sweeps < -1) {
        throw IO::ConfigurationError("Umbrella sweep counts must be positive (or -1 for the run default)");
    }
}

std::vector<double> evenly_spaced_targets(int num_windows, double min_target, double max_target) {
    if (num_windows <= 0) {
        throw IO::ConfigurationError("Number of umbrella windows must be positive");
    }
    if (num_windows == 1) {
        return {0.5 * (min_target + max_target)};
    }
    std::vector<double> targets(num_windows);
    double step = (max_target - min_target) / (num_windows - 1);
    for (int i = 0; i < num_windows; i++) {
        targets[i] = min_target + i * step;
    }
    return targets;
}

double default_spring_constant(int lattice_size) {
    return 0.5 * lattice_size * lattice_size;
}

double histogram_overlap(const Eigen::ArrayXd& a, const Eigen::ArrayXd& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Histograms must share the same bins");
    }
    double sum_a = a.sum();
    double sum_b = b.sum();
    if (sum_a <= 0.0 || sum_b <= 0.0) return 0.0;
    return (a / sum_a).min(b / sum_b).sum();
}

int flag_coverage_gaps(std::vector<UmbrellaWindow>& windows, double overlap_threshold, bool warn) {
    for (auto& w : windows) w.coverage_gap = false;
    if (windows.size() < 2) return 0;

    // Neighbors are defined by target order, not by index
    std::vector<size_t> order(windows.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&windows](size_t a, size_t b) {
        return windows[a].bias.target_magnetization < windows[b].bias.target_magnetization;
    });

    int num_gaps = 0;
    for (size_t n = 0; n + 1 < order.size(); n++) {
        UmbrellaWindow& left = windows[order[n]];
        UmbrellaWindow& right = windows[order[n + 1]];
        double overlap = histogram_overlap(left.histogram, right.histogram);
        if (overlap < overlap_threshold) {
            left.coverage_gap = true;
            right.coverage_gap = true;
            num_gaps++;
            if (warn) {
                std::cerr << "WARNING: coverage gap between umbrella windows m0="
                          << std::fixed << std::setprecision(4) << left.bias.target_magnetization
                          << " and m0=" << right.bias.target_magnetization
                          << " (overlap " << std::scientific << std::setprecision(2) << overlap
                          << " < " << overlap_threshold << ")" << std::endl;
            }
        }
    }
    return num_gaps;
}

namespace {

SimulationParameters window_parameters(const SimulationParameters& params,
                                       const UmbrellaSettings& settings, int window) {
    SimulationParameters window_params = params;
    window_params.seed = derive_seed(params.seed, window);
    if (settings.equilibration_sweeps > 0) window_params.equilibration_sweeps = settings.equilibration_sweeps;
    if (settings.measurement_sweeps > 0) window_params.measurement_sweeps = settings.measurement_sweeps;
    return window_params;
}

UmbrellaWindow run_single_window(const SimulationParameters& params, const UmbrellaSettings& settings,
                                 int window) {
    UmbrellaBias bias{settings.targets[window], settings.spring_constant_for(window)};
    UmbrellaWindowRunner runner(window_parameters(params, settings, window), bias, settings.bins, window);
    UmbrellaWindow result = runner.run();

    if (settings.verbose) {
        std::cout << "  Window " << std::setw(3) << window
                  << "  m0=" << std::fixed << std::setprecision(4) << std::setw(8) << bias.target_magnetization
                  << "  k=" << std::setprecision(3) << bias.spring_constant
                  << "  <m>=" << std::setprecision(4) << std::setw(8) << result.mean_magnetization
                  << "  acc=" << std::setprecision(3) << result.acceptance_rate << std::endl;
    }
    return result;
}

} // namespace

std::vector<UmbrellaWindow> run_umbrella_sampling(const SimulationParameters& params,
                                                  const UmbrellaSettings& settings) {
    params.validate();
    settings.validate();

    std::vector<UmbrellaWindow> windows;
    windows.reserve(settings.targets.size());
    for (size_t i = 0; i < settings.targets.size(); i++) {
        windows.push_back(run_single_window(params, settings, static_cast<int>(i)));
    }

    flag_coverage_gaps(windows, settings.overlap_threshold);
    return windows;
}

std::vector<UmbrellaWindow> run_umbrella_sampling(const SimulationParameters& params,
                                                  const UmbrellaSettings& settings,
                                                  MPIEnvironment& mpi_env,
                                                  MPIAccumulator& mpi_accumulator) {
    params.validate();
    settings.validate();

    const int num_windows = static_cast<int>(settings.targets.size());
    const int num_bins = settings.bins.size();

    // Per window: histogram, num_samples, <m>, acceptance. Zero for windows of other ranks.
    const int record = num_bins + 3;
    std::vector<double> local(static_cast<size_t>(num_windows) * record, 0.0);

    for (int i = 0; i < num_windows; i++) {
        if (!mpi_env.owns_task(i)) continue;
        UmbrellaWindow w = run_single_window(params, settings, i);
        double* slot = local.data() + static_cast<size_t>(i) * record;
        for (int b = 0; b < num_bins; b++) slot[b] = w.histogram(b);
        slot[num_bins] = static_cast<double>(w.num_samples);
        slot[num_bins + 1] = w.mean_magnetization;
        slot[num_bins + 2] = w.acceptance_rate;
    }

    std::vector<double> global = mpi_accumulator.accumulate_sum_all(local);

    std::vector<UmbrellaWindow> windows(num_windows);
    for (int i = 0; i < num_windows; i++) {
        const double* slot = global.data() + static_cast<size_t>(i) * record;
        UmbrellaWindow& w = windows[i];
        w.index = i;
        w.bias = UmbrellaBias{settings.targets[i], settings.spring_constant_for(i)};
        w.histogram = Eigen::Map<const Eigen::ArrayXd>(slot, num_bins);
        w.num_samples = std::lround(slot[num_bins]);
        w.mean_magnetization = slot[num_bins + 1];
        w.acceptance_rate = slot[num_bins + 2];
        w.state = WindowState::DONE;
    }

    flag_coverage_gaps(windows, settings.overlap_threshold, mpi_env.is_master());
    return windows;
}
