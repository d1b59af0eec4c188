/*
 * Metropolis Sampler Implementation
 *
 * Hot loop of the simulation: O(L^2) proposals per sweep, repeated
 * n_eq + n_steps times per run.
 */

#include "../include/metropolis.h"

MetropolisSampler::MetropolisSampler(const SimulationParameters& params,
                                     std::optional<UmbrellaBias> umbrella)
    : temperature(params.temperature), coupling_J(params.coupling_J), field_h(params.field_h),
      site_selection(params.site_selection), bias(umbrella),
      total_attempts(0), total_acceptances(0) {
    params.validate();

    if (bias.has_value() && (!std::isfinite(bias->spring_constant) || bias->spring_constant < 0.0 ||
                             !std::isfinite(bias->target_magnetization))) {
        throw IO::ConfigurationError("Umbrella bias requires a finite, non-negative spring constant "
                                     "and a finite target magnetization");
    }
}

bool MetropolisSampler::attempt_flip(IsingLattice& lattice, int i, int j, RandomSource& rng) {
    total_attempts++;

    double energy_change = delta_energy(lattice, i, j);
    if (!metropolis_test(energy_change, rng)) {
        return false;
    }

    lattice.flip_spin(i, j);
    total_acceptances++;
    return true;
}

long int MetropolisSampler::run_sweep(IsingLattice& lattice, RandomSource& rng) {
    const int L = lattice.size();
    long int accepted = 0;

    if (site_selection == SiteSelection::RASTER) {
        for (int i = 0; i < L; i++) {
            for (int j = 0; j < L; j++) {
                if (attempt_flip(lattice, i, j, rng)) accepted++;
            }
        }
    } else {
        const int attempts = L * L;
        for (int n = 0; n < attempts; n++) {
            // Random site selection: row first, then column
            int i = rng.uniform_index(L);
            int j = rng.uniform_index(L);
            if (attempt_flip(lattice, i, j, rng)) accepted++;
        }
    }

    return accepted;
}

double MetropolisSampler::get_acceptance_rate() const {
    return total_attempts > 0 ? static_cast<double>(total_acceptances) / total_attempts : 0.0;
}

void MetropolisSampler::reset_statistics() {
    total_attempts = 0;
    total_acceptances = 0;
}
