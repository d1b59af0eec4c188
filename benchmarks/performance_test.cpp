/*
 * Performance Benchmarks for the Metropolis and WHAM Implementation
 *
 * Tests computational performance of key operations:
 * 1. Flip energy calculation time with and without the umbrella bias
 * 2. Sweep throughput vs. lattice size and site selection
 * 3. Correlation measurement time vs. lattice size
 * 4. WHAM solve time vs. number of windows and bins
 */

#include "../include/energy.h"
#include "../include/lattice.h"
#include "../include/metropolis.h"
#include "../include/observables.h"
#include "../include/random.h"
#include "../include/umbrella.h"
#include "../include/wham.h"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>
#include <vector>

// Timing utility
class Timer {
private:
    std::chrono::high_resolution_clock::time_point start_time;

public:
    void start() {
        start_time = std::chrono::high_resolution_clock::now();
    }

    double elapsed_ms() {
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        return duration.count() / 1000.0;  // Convert to milliseconds
    }
};

SimulationParameters benchmark_params(int L, double T, SiteSelection selection) {
    SimulationParameters params;
    params.lattice_size = L;
    params.temperature = T;
    params.coupling_J = 1.0;
    params.field_h = 0.0;
    params.equilibration_sweeps = 1;
    params.measurement_sweeps = 1;
    params.seed = 42;
    params.site_selection = selection;
    return params;
}

// Test 1: Flip energy calculation, plain vs. biased
void benchmark_flip_energy() {
    std::cout << "\n=== Benchmark 1: Flip Energy Calculation ===" << std::endl;
    std::cout << "Energy change of a single flip, with and without bias" << std::endl;
    std::cout << "Bias       | Time per call (ns)" << std::endl;
    std::cout << "-----------|-------------------" << std::endl;

    const int num_calls = 1000000;
    const int L = 32;
    Timer timer;

    MersenneTwisterSource rng(42);
    IsingLattice lattice(L);
    lattice.initialize_random(rng);

    std::optional<UmbrellaBias> none;
    std::optional<UmbrellaBias> harmonic = UmbrellaBias{0.5, default_spring_constant(L)};

    for (const auto* bias : {&none, &harmonic}) {
        double checksum = 0.0;
        timer.start();
        for (int n = 0; n < num_calls; n++) {
            checksum += flip_delta_energy(lattice, n % L, (n / L) % L, 1.0, 0.1, *bias);
        }
        double total_time = timer.elapsed_ms();
        double time_per_call = (total_time * 1.0e6) / num_calls;  // Convert to nanoseconds

        std::cout << std::setw(10) << (bias->has_value() ? "harmonic" : "none") << " | "
                  << std::setw(18) << std::fixed << std::setprecision(2) << time_per_call
                  << "   (checksum " << std::setprecision(1) << checksum << ")" << std::endl;
    }
}

// Test 2: Sweep throughput vs. system size
void benchmark_sweeps() {
    std::cout << "\n=== Benchmark 2: Metropolis Sweep Performance ===" << std::endl;
    std::cout << "Sweeps at T = 2.269 for different lattice sizes" << std::endl;
    std::cout << "Lattice Size | Selection | Sweeps/sec | Accept Rate | Time/flip (ns)" << std::endl;
    std::cout << "-------------|-----------|------------|-------------|---------------" << std::endl;

    Timer timer;
    std::vector<int> sizes = {8, 16, 32, 64, 128};

    for (int size : sizes) {
        for (SiteSelection selection : {SiteSelection::RANDOM, SiteSelection::RASTER}) {
            SimulationParameters params = benchmark_params(size, 2.269, selection);
            MersenneTwisterSource rng(params.seed);
            IsingLattice lattice(size);
            lattice.initialize_random(rng);
            MetropolisSampler sampler(params);

            // Fixed budget of attempted flips per size
            const int num_sweeps = std::max(10, 4000000 / (size * size));

            timer.start();
            for (int sweep = 0; sweep < num_sweeps; sweep++) {
                sampler.run_sweep(lattice, rng);
            }
            double elapsed = timer.elapsed_ms();

            double sweeps_per_sec = num_sweeps / (elapsed / 1000.0);
            double time_per_flip = (elapsed * 1.0e6) / (static_cast<double>(num_sweeps) * size * size);

            std::cout << std::setw(12) << size << " | "
                      << std::setw(9) << site_selection_to_string(selection) << " | "
                      << std::setw(10) << std::fixed << std::setprecision(0) << sweeps_per_sec << " | "
                      << std::setw(10) << std::setprecision(1) << sampler.get_acceptance_rate() * 100 << "% | "
                      << std::setw(14) << std::setprecision(2) << time_per_flip << std::endl;
        }
    }
}

// Test 3: Correlation measurement time vs. system size
void benchmark_correlations() {
    std::cout << "\n=== Benchmark 3: Correlation Measurement ===" << std::endl;
    std::cout << "G(r) for r = 0..L/2, averaged over rows and columns" << std::endl;
    std::cout << "Lattice Size | Separations | Time per sample (us)" << std::endl;
    std::cout << "-------------|-------------|---------------------" << std::endl;

    Timer timer;
    std::vector<int> sizes = {8, 16, 32, 64};
    const int num_samples = 200;

    for (int size : sizes) {
        MersenneTwisterSource rng(7);
        IsingLattice lattice(size);
        lattice.initialize_random(rng);
        CorrelationAccumulator accumulator(size / 2, size / 2);

        timer.start();
        for (int n = 0; n < num_samples; n++) {
            accumulator.sample(lattice);
        }
        double elapsed = timer.elapsed_ms();

        std::cout << std::setw(12) << size << " | "
                  << std::setw(11) << accumulator.get_max_separation() + 1 << " | "
                  << std::setw(20) << std::fixed << std::setprecision(2)
                  << (elapsed * 1000.0) / num_samples << std::endl;
    }
}

// Test 4: WHAM solve time on synthetic double-well histograms
void benchmark_wham() {
    std::cout << "\n=== Benchmark 4: WHAM Solve Time ===" << std::endl;
    std::cout << "Windows | Bins | Iterations | Time (ms)" << std::endl;
    std::cout << "--------|------|------------|----------" << std::endl;

    Timer timer;
    std::vector<std::pair<int, int>> configs = {{11, 101}, {21, 201}, {31, 401}, {61, 801}};
    const double T = 2.5;
    const double k = 200.0;

    for (const auto& config : configs) {
        int num_windows = config.first;
        HistogramBins bins(-1.0, 1.0, config.second);
        Eigen::ArrayXd centers = bins.centers();

        // Double-well unbiased distribution
        Eigen::ArrayXd unbiased = (-8.0 * (centers.square() - 0.5).square()).exp();

        std::vector<UmbrellaWindow> windows;
        std::vector<double> targets = evenly_spaced_targets(num_windows, -1.0, 1.0);
        for (int i = 0; i < num_windows; i++) {
            UmbrellaWindow w;
            w.index = i;
            w.bias = UmbrellaBias{targets[i], k};
            Eigen::ArrayXd weights = unbiased;
            for (int b = 0; b < bins.size(); b++) {
                weights(b) *= std::exp(-w.bias.potential(centers(b)) / T);
            }
            w.histogram = (10000.0 * weights / weights.sum()).round();
            w.num_samples = static_cast<long int>(w.histogram.sum());
            w.state = WindowState::DONE;
            windows.push_back(w);
        }

        timer.start();
        WhamSolver solver(bins, windows, T);
        WhamResult result = solver.solve(WhamOptions());
        double elapsed = timer.elapsed_ms();

        std::cout << std::setw(7) << num_windows << " | "
                  << std::setw(4) << bins.size() << " | "
                  << std::setw(10) << result.iterations << " | "
                  << std::setw(9) << std::fixed << std::setprecision(2) << elapsed
                  << (result.converged ? "" : "  (not converged)") << std::endl;
    }
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "   MONTE CARLO PERFORMANCE BENCHMARKS  " << std::endl;
    std::cout << "========================================" << std::endl;

    benchmark_flip_energy();
    benchmark_sweeps();
    benchmark_correlations();
    benchmark_wham();

    std::cout << "\n========================================" << std::endl;
    std::cout << "         BENCHMARKS COMPLETED          " << std::endl;
    std::cout << "========================================" << std::endl;

    return 0;
}
