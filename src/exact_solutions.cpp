/*
 * Exact Reference Solutions Implementation
 */

#include "../include/exact_solutions.h"
#include "../include/energy.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

double onsager_critical_temperature(double J) {
    return 2.0 * J / std::log(1.0 + std::sqrt(2.0));
}

double exact_spontaneous_magnetization(double T, double J) {
    if (T <= 0.0) return 1.0;
    if (T >= onsager_critical_temperature(J)) return 0.0;

    double z = std::exp(-2.0 * J / T);
    double z2 = z * z;
    return std::pow(1.0 + z2, 0.25) * std::pow(1.0 - 6.0 * z2 + z2 * z2, 0.125) / std::sqrt(1.0 - z2);
}

namespace {

void check_enumeration_arguments(int L, double T, int max_size) {
    if (L < 2 || L > max_size) {
        throw std::invalid_argument("Exact enumeration supports 2 <= L <= " + std::to_string(max_size) +
                                    ", got L = " + std::to_string(L));
    }
    if (!std::isfinite(T) || T <= 0.0) {
        throw std::invalid_argument("Exact enumeration needs T > 0");
    }
}

// Four periodic neighbors of every site, row-major
std::vector<int> neighbor_table(int L) {
    std::vector<int> table(4 * L * L);
    for (int i = 0; i < L; i++) {
        for (int j = 0; j < L; j++) {
            int site = i * L + j;
            table[4 * site + 0] = ((i + L - 1) % L) * L + j;
            table[4 * site + 1] = ((i + 1) % L) * L + j;
            table[4 * site + 2] = i * L + (j + L - 1) % L;
            table[4 * site + 3] = i * L + (j + 1) % L;
        }
    }
    return table;
}

} // namespace

Eigen::ArrayXd enumerate_magnetization_distribution(int L, double T, double J, double h) {
    check_enumeration_arguments(L, T, MAX_ENUMERATION_SIZE);

    const int N = L * L;
    const std::vector<int> neighbors = neighbor_table(L);

    // Density of states g(M, B), B = sum over bonds of s_i s_j in [-2N, 2N]
    const int bond_offset = 2 * N;
    const int bond_range = 4 * N + 1;
    std::vector<long long> density((N + 1) * bond_range, 0);

    // Gray-code walk from the all-down state: one spin flip per step
    std::vector<int> spins(N, -1);
    int total_spin = -N;
    int bond_sum = 2 * N;
    density[0 * bond_range + bond_sum + bond_offset]++;

    const unsigned long long num_states = 1ULL << N;
    for (unsigned long long k = 1; k < num_states; k++) {
        int site = 0;
        while (((k >> site) & 1ULL) == 0) site++;

        int s = spins[site];
        int nb = spins[neighbors[4 * site]] + spins[neighbors[4 * site + 1]] +
                 spins[neighbors[4 * site + 2]] + spins[neighbors[4 * site + 3]];
        bond_sum -= 2 * s * nb;
        total_spin -= 2 * s;
        spins[site] = -s;

        int n_up = (total_spin + N) / 2;
        density[n_up * bond_range + bond_sum + bond_offset]++;
    }

    // Log weights, shifted by their maximum before exponentiation
    std::vector<double> log_weight(density.size(), -std::numeric_limits<double>::infinity());
    double max_log_weight = -std::numeric_limits<double>::infinity();
    for (int n = 0; n <= N; n++) {
        int M = -N + 2 * n;
        for (int b = 0; b < bond_range; b++) {
            long long g = density[n * bond_range + b];
            if (g == 0) continue;
            int B = b - bond_offset;
            double lw = std::log(static_cast<double>(g)) + (J * B + h * M) / T;
            log_weight[n * bond_range + b] = lw;
            if (lw > max_log_weight) max_log_weight = lw;
        }
    }

    Eigen::ArrayXd distribution = Eigen::ArrayXd::Zero(N + 1);
    for (int n = 0; n <= N; n++) {
        for (int b = 0; b < bond_range; b++) {
            double lw = log_weight[n * bond_range + b];
            if (std::isfinite(lw)) distribution(n) += std::exp(lw - max_log_weight);
        }
    }

    return distribution / distribution.sum();
}

std::vector<double> enumerate_state_probabilities(int L, double T, double J, double h) {
    check_enumeration_arguments(L, T, MAX_STATE_ENUMERATION_SIZE);

    const int N = L * L;
    const long int num_states = 1L << N;

    std::vector<double> energies(num_states);
    std::vector<int> configuration(N);
    IsingLattice lattice(L);
    double min_energy = std::numeric_limits<double>::infinity();

    for (long int index = 0; index < num_states; index++) {
        for (int site = 0; site < N; site++) {
            configuration[site] = ((index >> site) & 1L) ? 1 : -1;
        }
        lattice.initialize_custom(configuration);
        energies[index] = total_energy(lattice, J, h);
        if (energies[index] < min_energy) min_energy = energies[index];
    }

    std::vector<double> probabilities(num_states);
    double partition = 0.0;
    for (long int index = 0; index < num_states; index++) {
        probabilities[index] = std::exp(-(energies[index] - min_energy) / T);
        partition += probabilities[index];
    }
    for (double& p : probabilities) p /= partition;

    return probabilities;
}

long int configuration_index(const IsingLattice& lattice) {
    const int L = lattice.size();
    long int index = 0;
    for (int i = 0; i < L; i++) {
        for (int j = 0; j < L; j++) {
            if (lattice.get_spin(i, j) > 0) index |= 1L << (i * L + j);
        }
    }
    return index;
}

Eigen::ArrayXd project_distribution(const Eigen::ArrayXd& distribution, int L, const HistogramBins& bins) {
    const int N = L * L;
    if (distribution.size() != N + 1) {
        throw std::invalid_argument("Distribution over M must have N + 1 entries");
    }
    Eigen::ArrayXd projected = Eigen::ArrayXd::Zero(bins.size());
    for (int n = 0; n <= N; n++) {
        double m = static_cast<double>(-N + 2 * n) / N;
        projected(bins.bin_index(m)) += distribution(n);
    }
    return projected;
}
