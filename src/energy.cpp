/*
 * Energy Oracle Implementation
 */

#include "../include/energy.h"

int local_field_energy(const IsingLattice& lattice, int i, int j) {
    return lattice.neighbor_sum(i, j);
}

double flip_delta_energy(const IsingLattice& lattice, int i, int j, double J, double h) {
    int s = lattice.get_spin(i, j);
    return 2.0 * s * (J * local_field_energy(lattice, i, j) + h);
}

double bias_delta_energy(const IsingLattice& lattice, int i, int j, const UmbrellaBias& bias) {
    double n = static_cast<double>(lattice.get_num_sites());
    long int m_total = lattice.get_total_spin();
    double m_before = m_total / n;
    double m_after = (m_total - 2 * lattice.get_spin(i, j)) / n;
    return bias.potential(m_after) - bias.potential(m_before);
}

double flip_delta_energy(const IsingLattice& lattice, int i, int j, double J, double h,
                         const std::optional<UmbrellaBias>& bias) {
    double energy_change = flip_delta_energy(lattice, i, j, J, h);
    if (bias.has_value()) {
        energy_change += bias_delta_energy(lattice, i, j, *bias);
    }
    return energy_change;
}

double total_energy(const IsingLattice& lattice, double J, double h) {
    int L = lattice.size();
    double bond_sum = 0.0;

    // Right and down bonds of every site cover each bond once
    for (int i = 0; i < L; i++) {
        for (int j = 0; j < L; j++) {
            int s = lattice.get_spin(i, j);
            bond_sum += s * (lattice.get_spin(i, lattice.right(j)) + lattice.get_spin(lattice.down(i), j));
        }
    }

    return -J * bond_sum - h * static_cast<double>(lattice.get_total_spin());
}
