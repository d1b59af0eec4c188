/*
 * Ising Lattice Implementation
 */

#include "../include/lattice.h"
#include <stdexcept>
#include <string>

IsingLattice::IsingLattice(int size)
    : lattice_size(size), total_spin(0) {
    if (size <= 0) {
        throw std::invalid_argument("Lattice size must be positive (got " + std::to_string(size) + ")");
    }

    spins = SpinArray::Ones(size, size);
    total_spin = static_cast<long int>(size) * size;

    next_index.resize(size);
    prev_index.resize(size);
    for (int i = 0; i < size; i++) {
        next_index[i] = (i + 1) % size;
        prev_index[i] = (i - 1 + size) % size;
    }
}

void IsingLattice::initialize_random(RandomSource& rng) {
    // Row-major order so the draw sequence is reproducible for a given seed
    for (int i = 0; i < lattice_size; i++) {
        for (int j = 0; j < lattice_size; j++) {
            spins(i, j) = (rng.uniform() < 0.5) ? -1 : 1;
        }
    }
    recompute_total_spin();
}

void IsingLattice::initialize_uniform(int spin) {
    if (spin != 1 && spin != -1) {
        throw std::invalid_argument("Spin value must be +1 or -1 (got " + std::to_string(spin) + ")");
    }
    spins.setConstant(spin);
    recompute_total_spin();
}

void IsingLattice::initialize_custom(const std::vector<int>& configuration) {
    if (configuration.size() != static_cast<size_t>(get_num_sites())) {
        throw std::invalid_argument("Configuration size (" + std::to_string(configuration.size()) +
                                    ") does not match lattice sites (" +
                                    std::to_string(get_num_sites()) + ")");
    }

    for (size_t k = 0; k < configuration.size(); k++) {
        if (configuration[k] != 1 && configuration[k] != -1) {
            throw std::invalid_argument("Spin value must be +1 or -1 (got " +
                                        std::to_string(configuration[k]) + ")");
        }
    }

    for (int i = 0; i < lattice_size; i++) {
        for (int j = 0; j < lattice_size; j++) {
            spins(i, j) = configuration[i * lattice_size + j];
        }
    }
    recompute_total_spin();
}

void IsingLattice::set_spin(int i, int j, int spin) {
    if (spin != 1 && spin != -1) {
        throw std::invalid_argument("Spin value must be +1 or -1 (got " + std::to_string(spin) + ")");
    }
    total_spin += spin - spins(i, j);
    spins(i, j) = spin;
}

std::vector<int> IsingLattice::to_vector() const {
    std::vector<int> configuration(get_num_sites());
    for (int i = 0; i < lattice_size; i++) {
        for (int j = 0; j < lattice_size; j++) {
            configuration[i * lattice_size + j] = spins(i, j);
        }
    }
    return configuration;
}

void IsingLattice::recompute_total_spin() {
    total_spin = spins.cast<long int>().sum();
}
