/*
 * Metropolis Sampler Header
 *
 * Single-spin-flip Metropolis kernel on a periodic 2D Ising lattice.
 * The sampler holds the thermodynamic parameters and acceptance
 * statistics; the lattice and the random source are owned by the caller.
 */

#ifndef METROPOLIS_H
#define METROPOLIS_H

#include "lattice.h"
#include "energy.h"
#include "random.h"
#include "simulation_parameters.h"
#include <cmath>
#include <optional>

class MetropolisSampler {
private:
    // Core parameters
    double temperature;
    double coupling_J;
    double field_h;
    SiteSelection site_selection;
    std::optional<UmbrellaBias> bias;  // Optional umbrella bias

    // Statistics
    long int total_attempts;
    long int total_acceptances;

public:
    /**
     * @param params Run parameters (validated here)
     * @param umbrella Optional harmonic bias on the magnetization per site
     * @throws IO::ConfigurationError if params are invalid
     */
    explicit MetropolisSampler(const SimulationParameters& params,
                               std::optional<UmbrellaBias> umbrella = std::nullopt);

    // Energy change of the proposal at (i, j), bias included
    double delta_energy(const IsingLattice& lattice, int i, int j) const {
        return flip_delta_energy(lattice, i, j, coupling_J, field_h, bias);
    }

    // Metropolis rule: accept if dE <= 0, else with probability exp(-dE / T).
    // A random number is drawn only for uphill moves.
    bool metropolis_test(double energy_change, RandomSource& rng) const {
        if (energy_change <= 0.0) return true;
        double probability = std::exp(-energy_change / temperature);  // Underflows to 0 -> reject
        return rng.uniform() < probability;
    }

    // Propose a flip of (i, j); flips in place on acceptance
    bool attempt_flip(IsingLattice& lattice, int i, int j, RandomSource& rng);

    // One sweep = L*L proposals; returns the number of accepted flips
    long int run_sweep(IsingLattice& lattice, RandomSource& rng);

    double get_acceptance_rate() const;
    void reset_statistics();

    double get_coupling() const { return coupling_J; }
    double get_field() const { return field_h; }
    long int get_total_attempts() const { return total_attempts; }
    long int get_total_acceptances() const { return total_acceptances; }
};

#endif // METROPOLIS_H
