/*
 * Energy Oracle Header
 *
 * Hamiltonian: E = -J sum_<ij> s_i s_j - h sum_i s_i
 * with an optional umbrella bias V(m) = k (m - m0)^2, m = M / N.
 * All functions are pure: they never modify the lattice.
 */

#ifndef ENERGY_H
#define ENERGY_H

#include "lattice.h"
#include <optional>

/**
 * Harmonic umbrella bias on the magnetization per site
 */
struct UmbrellaBias {
    double target_magnetization;  // m0
    double spring_constant;       // k

    double potential(double m) const {
        double d = m - target_magnetization;
        return spring_constant * d * d;
    }
};

/**
 * Sum of the four periodic nearest-neighbor spins at (i, j)
 */
int local_field_energy(const IsingLattice& lattice, int i, int j);

/**
 * Energy change of flipping spin (i, j): dE = 2 s (J * nb + h)
 */
double flip_delta_energy(const IsingLattice& lattice, int i, int j, double J, double h);

/**
 * Change of the umbrella bias potential when spin (i, j) is flipped:
 * k (m_after - m0)^2 - k (m_before - m0)^2
 */
double bias_delta_energy(const IsingLattice& lattice, int i, int j, const UmbrellaBias& bias);

/**
 * Full proposal energy change, including the bias if one is active
 */
double flip_delta_energy(const IsingLattice& lattice, int i, int j, double J, double h,
                         const std::optional<UmbrellaBias>& bias);

/**
 * Total energy of the configuration (each bond counted once).
 * Consistent with flip_delta_energy for every L >= 2, including L = 2
 * where the periodic images of a neighbor coincide.
 */
double total_energy(const IsingLattice& lattice, double J, double h);

#endif // ENERGY_H
