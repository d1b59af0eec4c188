/*
 * Simulation Parameters
 *
 * Immutable per-run configuration shared read-only by the lattice,
 * the energy oracle and the Metropolis sampler.
 */

#ifndef SIMULATION_PARAMETERS_H
#define SIMULATION_PARAMETERS_H

#include "io/config_types.h"

// Site visiting order within one sweep
enum class SiteSelection {
    RANDOM,  // L*L uniformly drawn sites (row, then column)
    RASTER   // Row-major pass over every site
};

struct SimulationParameters {
    int lattice_size = 0;          // L
    double temperature = 0.0;      // T
    double coupling_J = 1.0;       // J
    double field_h = 0.0;          // h
    int equilibration_sweeps = 0;  // n_eq
    int measurement_sweeps = 0;    // n_steps
    long int seed = 42;
    SiteSelection site_selection = SiteSelection::RANDOM;

    int num_sites() const { return lattice_size * lattice_size; }

    /**
     * Fail fast on invalid configuration before any simulation work
     * @throws IO::ConfigurationError for L <= 0, T <= 0, non-finite T/J/h,
     *         or non-positive sweep counts
     */
    void validate() const;
};

SiteSelection site_selection_from_string(const std::string& name);
std::string site_selection_to_string(SiteSelection selection);

#endif // SIMULATION_PARAMETERS_H
