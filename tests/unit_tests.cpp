/*
 * Unit Tests for the 2D Ising Metropolis Kernel
 *
 * Tests core functionalities:
 * 1. Random source seeding and ranges
 * 2. Lattice creation, spin access and periodic neighbors
 * 3. Energy oracle: flip energy changes against total energy differences
 * 4. Umbrella bias energy change
 * 5. Metropolis acceptance rule
 * 6. Low and high temperature limits
 * 7. Detailed balance on a 2x2 lattice against exact enumeration
 * 8. Seed reproducibility and parameter validation
 */

#include "../include/energy.h"
#include "../include/exact_solutions.h"
#include "../include/lattice.h"
#include "../include/mc_phases.h"
#include "../include/metropolis.h"
#include "../include/random.h"
#include "../include/simulation_parameters.h"
#include <algorithm>
#include <iostream>
#include <cmath>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <vector>

// Helper function for floating point comparison
bool approx_equal(double a, double b, double tolerance = 1e-10) {
    return std::abs(a - b) < tolerance;
}

// Random source returning a fixed value, for deterministic acceptance checks
class FixedSource : public RandomSource {
private:
    double value;

public:
    explicit FixedSource(double v) : value(v) {}
    double uniform() override { return value; }
    void reseed(long int) override {}
};

SimulationParameters make_params(int L, double T, double J = 1.0, double h = 0.0,
                                 int n_eq = 1000, int n_steps = 5000, long int seed = 42) {
    SimulationParameters params;
    params.lattice_size = L;
    params.temperature = T;
    params.coupling_J = J;
    params.field_h = h;
    params.equilibration_sweeps = n_eq;
    params.measurement_sweeps = n_steps;
    params.seed = seed;
    return params;
}

// Test 1: Random source
bool test_random_source() {
    std::cout << "\n=== Test 1: Random Source ===" << std::endl;

    MersenneTwisterSource a(42);
    MersenneTwisterSource b(42);
    MersenneTwisterSource c(-42);  // Sign is ignored

    for (int n = 0; n < 1000; n++) {
        double x = a.uniform();
        double y = b.uniform();
        double z = c.uniform();
        if (x != y || x != z) {
            std::cout << "✗ Same seed produced different streams" << std::endl;
            return false;
        }
        if (x < 0.0 || x >= 1.0) {
            std::cout << "✗ uniform() outside [0, 1): " << x << std::endl;
            return false;
        }
    }

    for (int n = 0; n < 1000; n++) {
        int index = a.uniform_index(7);
        if (index < 0 || index >= 7) {
            std::cout << "✗ uniform_index(7) returned " << index << std::endl;
            return false;
        }
    }

    // Reseeding restarts the stream
    MersenneTwisterSource d(7);
    double first = d.uniform();
    d.uniform();
    d.reseed(7);
    if (d.uniform() != first) {
        std::cout << "✗ reseed did not restart the stream" << std::endl;
        return false;
    }

    if (normalize_seed(0) != 1u) {
        std::cout << "✗ Zero seed not replaced" << std::endl;
        return false;
    }

    // Sign is ignored; the most negative seed still has a magnitude
    const long int min_seed = std::numeric_limits<long int>::min();
    if (normalize_seed(-7) != 7u ||
        normalize_seed(min_seed) != 0ULL - static_cast<unsigned long long>(min_seed)) {
        std::cout << "✗ Negative seeds not mapped to their magnitude" << std::endl;
        return false;
    }
    MersenneTwisterSource negative(-7);
    MersenneTwisterSource positive(7);
    if (negative.uniform() != positive.uniform()) {
        std::cout << "✗ Seeds 7 and -7 should give the same stream" << std::endl;
        return false;
    }
    MersenneTwisterSource extreme(min_seed);
    double u = extreme.uniform();
    if (u < 0.0 || u >= 1.0) {
        std::cout << "✗ Most negative seed gave uniform() = " << u << std::endl;
        return false;
    }

    // High bits of a 64-bit seed select a different stream
    if (sizeof(long int) > 4) {
        const long int high_seed = static_cast<long int>(42LL + (1LL << 32));
        MersenneTwisterSource low(42);
        MersenneTwisterSource high(high_seed);
        bool identical = true;
        for (int n = 0; n < 8; n++) {
            if (low.uniform() != high.uniform()) identical = false;
        }
        if (identical) {
            std::cout << "✗ Seeds differing by 2^32 gave the same stream" << std::endl;
            return false;
        }
    }

    std::cout << "✓ Random source is seed-deterministic and in range" << std::endl;
    return true;
}

// Test 2: Lattice creation and spin access
bool test_lattice_basics() {
    std::cout << "\n=== Test 2: Lattice Creation and Spin Access ===" << std::endl;

    IsingLattice lattice(3);
    if (lattice.get_total_spin() != 9 || !approx_equal(lattice.get_magnetization(), 1.0)) {
        std::cout << "✗ New lattice should be all up" << std::endl;
        return false;
    }

    lattice.flip_spin(1, 2);
    if (lattice.get_spin(1, 2) != -1 || lattice.get_total_spin() != 7) {
        std::cout << "✗ flip_spin did not update spin and total spin" << std::endl;
        return false;
    }

    // Periodic wrapping
    if (lattice.wrap(-1) != 2 || lattice.wrap(3) != 0 || lattice.get_spin_periodic(4, -1) != -1) {
        std::cout << "✗ Periodic wrapping incorrect" << std::endl;
        return false;
    }

    // (1, 0) has the flipped (1, 2) as its left neighbor through the boundary
    if (lattice.neighbor_sum(1, 0) != 2) {
        std::cout << "✗ Neighbor sum across the boundary: got " << lattice.neighbor_sum(1, 0) << std::endl;
        return false;
    }

    bool threw = false;
    try {
        lattice.set_spin(0, 0, 2);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cout << "✗ Spin value 2 accepted" << std::endl;
        return false;
    }

    threw = false;
    try {
        lattice.initialize_custom(std::vector<int>(5, 1));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cout << "✗ Custom configuration of wrong size accepted" << std::endl;
        return false;
    }

    // Round trip through the row-major vector
    std::vector<int> config = {1, -1, 1, -1, -1, 1, 1, 1, -1};
    lattice.initialize_custom(config);
    if (lattice.to_vector() != config || lattice.get_spin(1, 0) != -1 || lattice.get_total_spin() != 1) {
        std::cout << "✗ Custom configuration not stored row-major" << std::endl;
        return false;
    }

    std::cout << "✓ Lattice access, wrapping and initialization work" << std::endl;
    return true;
}

// Test 3: Flip energy change equals the total energy difference
bool test_energy_consistency() {
    std::cout << "\n=== Test 3: Energy Oracle Consistency ===" << std::endl;

    const double J = 1.3;
    const double h = 0.4;
    MersenneTwisterSource rng(11);

    for (int L : {2, 3, 5}) {
        IsingLattice lattice(L);
        lattice.initialize_random(rng);

        for (int i = 0; i < L; i++) {
            for (int j = 0; j < L; j++) {
                double before = total_energy(lattice, J, h);
                double predicted = flip_delta_energy(lattice, i, j, J, h);
                lattice.flip_spin(i, j);
                double after = total_energy(lattice, J, h);
                lattice.flip_spin(i, j);

                if (!approx_equal(after - before, predicted, 1e-9)) {
                    std::cout << "✗ L=" << L << " site (" << i << "," << j << "): dE=" << predicted
                              << ", E_after - E_before=" << after - before << std::endl;
                    return false;
                }
            }
        }
    }

    // Ferromagnetic ground state: E = -2 N J - N h
    IsingLattice ground(4);
    double expected = -2.0 * 16 * J - 16 * h;
    if (!approx_equal(total_energy(ground, J, h), expected, 1e-9)) {
        std::cout << "✗ Ground state energy " << total_energy(ground, J, h)
                  << ", expected " << expected << std::endl;
        return false;
    }

    std::cout << "✓ dE matches E_after - E_before for L = 2, 3, 5" << std::endl;
    return true;
}

// Test 4: Umbrella bias energy change
bool test_bias_energy() {
    std::cout << "\n=== Test 4: Umbrella Bias Energy ===" << std::endl;

    UmbrellaBias bias{0.25, 8.0};
    MersenneTwisterSource rng(5);
    IsingLattice lattice(4);
    lattice.initialize_random(rng);

    for (int i = 0; i < 4; i++) {
        for (int j = 0; j < 4; j++) {
            double before = bias.potential(lattice.get_magnetization());
            double predicted = bias_delta_energy(lattice, i, j, bias);
            double total_predicted = flip_delta_energy(lattice, i, j, 1.0, 0.1, bias);
            double unbiased = flip_delta_energy(lattice, i, j, 1.0, 0.1);

            lattice.flip_spin(i, j);
            double after = bias.potential(lattice.get_magnetization());
            lattice.flip_spin(i, j);

            if (!approx_equal(after - before, predicted, 1e-12) ||
                !approx_equal(total_predicted, unbiased + predicted, 1e-12)) {
                std::cout << "✗ Bias dE mismatch at (" << i << "," << j << ")" << std::endl;
                return false;
            }
        }
    }

    // No bias: identical to the plain oracle
    if (!approx_equal(flip_delta_energy(lattice, 0, 0, 1.0, 0.1, std::nullopt),
                      flip_delta_energy(lattice, 0, 0, 1.0, 0.1))) {
        std::cout << "✗ Empty bias changed the energy" << std::endl;
        return false;
    }

    std::cout << "✓ Bias dE = k(m_after - m0)^2 - k(m_before - m0)^2" << std::endl;
    return true;
}

// Test 5: Metropolis acceptance rule
bool test_metropolis_rule() {
    std::cout << "\n=== Test 5: Metropolis Acceptance Rule ===" << std::endl;

    MetropolisSampler sampler(make_params(4, 2.0));
    FixedSource half(0.5);
    FixedSource almost_one(0.999999);

    // Downhill and flat moves always accepted
    if (!sampler.metropolis_test(-4.0, almost_one) || !sampler.metropolis_test(0.0, almost_one)) {
        std::cout << "✗ Downhill move rejected" << std::endl;
        return false;
    }

    // exp(-1 / 2) = 0.61 > 0.5 accepted, exp(-2) = 0.135 < 0.5 rejected
    if (!sampler.metropolis_test(1.0, half) || sampler.metropolis_test(4.0, half)) {
        std::cout << "✗ Uphill acceptance does not follow exp(-dE/T)" << std::endl;
        return false;
    }

    // exp underflows to zero: always rejected, never an error
    FixedSource zero(0.0);
    if (sampler.metropolis_test(1e6, zero)) {
        std::cout << "✗ Underflowed probability accepted" << std::endl;
        return false;
    }

    // attempt_flip flips in place and counts attempts
    IsingLattice lattice(4);
    lattice.initialize_uniform(-1);
    lattice.set_spin(2, 2, 1);  // Isolated up spin: flipping it is downhill
    if (!sampler.attempt_flip(lattice, 2, 2, half) || lattice.get_spin(2, 2) != -1) {
        std::cout << "✗ Downhill flip not applied" << std::endl;
        return false;
    }
    if (sampler.get_total_attempts() != 1 || sampler.get_total_acceptances() != 1) {
        std::cout << "✗ Statistics not updated" << std::endl;
        return false;
    }

    // A raster sweep proposes every site exactly once
    SimulationParameters raster = make_params(4, 2.0);
    raster.site_selection = SiteSelection::RASTER;
    MetropolisSampler raster_sampler(raster);
    MersenneTwisterSource rng(3);
    raster_sampler.run_sweep(lattice, rng);
    if (raster_sampler.get_total_attempts() != 16) {
        std::cout << "✗ Sweep made " << raster_sampler.get_total_attempts() << " proposals" << std::endl;
        return false;
    }

    std::cout << "✓ Acceptance rule and statistics correct" << std::endl;
    return true;
}

// Test 6: T -> 0 keeps order, T -> infinity destroys it
bool test_temperature_limits() {
    std::cout << "\n=== Test 6: Low and High Temperature Limits ===" << std::endl;

    MeasurementOptions options;
    options.max_separation = 2;

    // Deep in the ordered phase
    InitialConfiguration ordered;
    ordered.type = InitialState::ALL_UP;
    RunResult cold = run_simulation_point(make_params(8, 1.0, 1.0, 0.0, 500, 2000, 1), options, ordered);
    if (cold.snapshot.mean_abs_magnetization < 0.9) {
        std::cout << "✗ T=1.0: <|m|> = " << cold.snapshot.mean_abs_magnetization << " (expected > 0.9)" << std::endl;
        return false;
    }

    // Essentially independent spins
    RunResult hot = run_simulation_point(make_params(16, 100.0, 1.0, 0.0, 500, 2000, 2), options);
    double m = hot.snapshot.mean_magnetization;
    double c1 = hot.snapshot.connected_correlation[1];
    if (std::abs(m) > 0.05 || std::abs(c1) > 0.05) {
        std::cout << "✗ T=100: <m> = " << m << ", C(1) = " << c1 << " (expected ~0)" << std::endl;
        return false;
    }
    if (hot.snapshot.acceptance_rate < 0.9) {
        std::cout << "✗ T=100: acceptance rate " << hot.snapshot.acceptance_rate << std::endl;
        return false;
    }

    std::cout << "✓ <|m|>(T=1) = " << std::fixed << std::setprecision(4) << cold.snapshot.mean_abs_magnetization
              << ", <m>(T=100) = " << m << ", C(1) = " << c1 << std::endl;
    return true;
}

// Test 7: Sampled state frequencies match the Boltzmann distribution
bool test_detailed_balance() {
    std::cout << "\n=== Test 7: Detailed Balance (2x2 lattice) ===" << std::endl;

    const int L = 2;
    const double T = 2.0;
    const double h = 0.3;
    const int num_sweeps = 200000;

    SimulationParameters params = make_params(L, T, 1.0, h, 1000, num_sweeps, 2024);
    MetropolisSampler sampler(params);
    MersenneTwisterSource rng(params.seed);
    IsingLattice lattice(L);
    lattice.initialize_random(rng);

    for (int sweep = 0; sweep < params.equilibration_sweeps; sweep++) {
        sampler.run_sweep(lattice, rng);
    }

    std::vector<double> counts(1 << (L * L), 0.0);
    for (int sweep = 0; sweep < num_sweeps; sweep++) {
        sampler.run_sweep(lattice, rng);
        counts[configuration_index(lattice)] += 1.0;
    }

    std::vector<double> exact = enumerate_state_probabilities(L, T, 1.0, h);
    double max_deviation = 0.0;
    for (size_t s = 0; s < counts.size(); s++) {
        max_deviation = std::max(max_deviation, std::abs(counts[s] / num_sweeps - exact[s]));
    }

    if (max_deviation > 0.01) {
        std::cout << "✗ Max deviation from Boltzmann weights: " << max_deviation << std::endl;
        return false;
    }

    std::cout << "✓ Max deviation from Boltzmann weights: " << std::scientific << std::setprecision(2)
              << max_deviation << std::fixed << std::endl;
    return true;
}

// Test 8: Same seed, same chain
bool test_reproducibility() {
    std::cout << "\n=== Test 8: Seed Reproducibility ===" << std::endl;

    MeasurementOptions options;
    SimulationParameters params = make_params(4, 2.0, 1.0, 0.0, 1000, 5000, 42);

    RunResult first = run_simulation_point(params, options);
    RunResult second = run_simulation_point(params, options);

    if (first.snapshot.magnetization_samples != second.snapshot.magnetization_samples ||
        first.final_configuration != second.final_configuration) {
        std::cout << "✗ Same seed produced different runs" << std::endl;
        return false;
    }

    params.seed = 43;
    RunResult other = run_simulation_point(params, options);
    if (other.snapshot.magnetization_samples == first.snapshot.magnetization_samples) {
        std::cout << "✗ Different seeds produced identical runs" << std::endl;
        return false;
    }

    if (first.snapshot.magnetization_samples.size() != 5000) {
        std::cout << "✗ Expected one sample per sweep, got "
                  << first.snapshot.magnetization_samples.size() << std::endl;
        return false;
    }

    // Reference value of the L=4, T=2, seed=42 chain; pins the order of random draws
    // in initialize_random, uniform_index and run_sweep
    const double reference_m = 0.43967499999999998;
    if (std::abs(first.snapshot.mean_magnetization - reference_m) > 1e-12) {
        std::cout << "✗ <m> = " << std::setprecision(17) << first.snapshot.mean_magnetization
                  << ", reference " << reference_m << std::endl;
        return false;
    }

    std::cout << "✓ L=4, T=2, seed=42: <m> = " << std::setprecision(6)
              << first.snapshot.mean_magnetization << " matches the reference chain" << std::endl;
    return true;
}

// Test 9: Invalid parameters fail before any sweep
bool test_parameter_validation() {
    std::cout << "\n=== Test 9: Parameter Validation ===" << std::endl;

    auto rejects = [](const SimulationParameters& params) {
        try {
            MetropolisSampler sampler(params);
        } catch (const IO::ConfigurationError&) {
            return true;
        }
        return false;
    };

    SimulationParameters zero_T = make_params(4, 0.0);
    SimulationParameters negative_T = make_params(4, -1.0);
    SimulationParameters empty = make_params(0, 2.0);
    SimulationParameters no_sweeps = make_params(4, 2.0, 1.0, 0.0, 0, 100);
    SimulationParameters bad_field = make_params(4, 2.0, 1.0, std::numeric_limits<double>::quiet_NaN());

    if (!rejects(zero_T) || !rejects(negative_T) || !rejects(empty) ||
        !rejects(no_sweeps) || !rejects(bad_field)) {
        std::cout << "✗ Invalid parameters accepted" << std::endl;
        return false;
    }

    bool bias_rejected = false;
    try {
        MetropolisSampler sampler(make_params(4, 2.0), UmbrellaBias{0.0, -1.0});
    } catch (const IO::ConfigurationError&) {
        bias_rejected = true;
    }
    if (!bias_rejected) {
        std::cout << "✗ Negative spring constant accepted" << std::endl;
        return false;
    }

    if (site_selection_from_string("raster") != SiteSelection::RASTER ||
        site_selection_to_string(SiteSelection::RANDOM) != "random") {
        std::cout << "✗ Site selection names" << std::endl;
        return false;
    }

    std::cout << "✓ Invalid T, L, sweep counts, h and bias rejected" << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "   ISING METROPOLIS UNIT TESTS         " << std::endl;
    std::cout << "========================================" << std::endl;

    int passed = 0;
    int total = 9;

    if (test_random_source()) passed++;
    if (test_lattice_basics()) passed++;
    if (test_energy_consistency()) passed++;
    if (test_bias_energy()) passed++;
    if (test_metropolis_rule()) passed++;
    if (test_temperature_limits()) passed++;
    if (test_detailed_balance()) passed++;
    if (test_reproducibility()) passed++;
    if (test_parameter_validation()) passed++;

    std::cout << "\n========================================" << std::endl;
    std::cout << "RESULTS: " << passed << "/" << total << " tests passed" << std::endl;

    if (passed == total) {
        std::cout << "✓ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ " << (total - passed) << " tests failed" << std::endl;
        return 1;
    }
}
