/*
 * Ising Lattice Header
 *
 * L x L square lattice of +1/-1 spins with periodic boundaries.
 * Spins are stored row-major in an Eigen array so that a raster sweep
 * walks memory contiguously. The total spin is tracked incrementally.
 */

#ifndef LATTICE_H
#define LATTICE_H

#include "random.h"
#include <eigen3/Eigen/Dense>
#include <vector>

class IsingLattice {
public:
    typedef Eigen::Array<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> SpinArray;

private:
    int lattice_size;
    SpinArray spins;
    long int total_spin;

    // Periodic neighbor tables: next_index[i] = (i+1) mod L, prev_index[i] = (i-1) mod L
    std::vector<int> next_index;
    std::vector<int> prev_index;

    void recompute_total_spin();

public:
    // All spins up
    explicit IsingLattice(int size);

    // Initialization
    void initialize_random(RandomSource& rng);
    void initialize_uniform(int spin);
    void initialize_custom(const std::vector<int>& configuration);  // Row-major, L*L values of +1/-1

    int size() const { return lattice_size; }
    int get_num_sites() const { return lattice_size * lattice_size; }

    // Spin access (indices must lie in [0, L))
    int get_spin(int i, int j) const { return spins(i, j); }
    void set_spin(int i, int j, int spin);
    void flip_spin(int i, int j) {
        spins(i, j) = -spins(i, j);
        total_spin += 2 * spins(i, j);
    }

    // Periodic access for arbitrary integer indices
    int wrap(int i) const {
        int m = i % lattice_size;
        return (m < 0) ? m + lattice_size : m;
    }
    int get_spin_periodic(int i, int j) const { return spins(wrap(i), wrap(j)); }

    int down(int i) const { return next_index[i]; }
    int right(int j) const { return next_index[j]; }

    // Sum of the four nearest neighbors of (i, j)
    int neighbor_sum(int i, int j) const {
        return spins(prev_index[i], j) + spins(next_index[i], j) +
               spins(i, prev_index[j]) + spins(i, next_index[j]);
    }

    // Observables tracked in O(1)
    long int get_total_spin() const { return total_spin; }
    double get_magnetization() const { return static_cast<double>(total_spin) / get_num_sites(); }

    // Configuration extraction (row-major), used for dumps and restarts
    std::vector<int> to_vector() const;
    const SpinArray& get_spin_array() const { return spins; }
};

#endif // LATTICE_H
