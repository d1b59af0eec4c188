/*
 * Exact Reference Solutions
 *
 * Closed-form infinite-lattice results (Onsager, Yang) and brute-force
 * enumeration of small periodic lattices, used as references for the
 * sampled and reweighted distributions.
 */

#ifndef EXACT_SOLUTIONS_H
#define EXACT_SOLUTIONS_H

#include "umbrella.h"
#include <eigen3/Eigen/Dense>
#include <vector>

// Largest lattices handled by the enumerators
constexpr int MAX_ENUMERATION_SIZE = 5;        // 2^25 configurations
constexpr int MAX_STATE_ENUMERATION_SIZE = 4;  // 2^16 stored probabilities

// Tc = 2J / ln(1 + sqrt(2))
double onsager_critical_temperature(double J = 1.0);

/**
 * Spontaneous magnetization of the infinite lattice (Yang):
 * (1 + z^2)^(1/4) (1 - 6 z^2 + z^4)^(1/8) (1 - z^2)^(-1/2), z = exp(-2J/T),
 * for T < Tc and 0 otherwise
 */
double exact_spontaneous_magnetization(double T, double J = 1.0);

/**
 * Exact P(M) of an L x L periodic lattice by full enumeration.
 * Entry n holds the probability of total spin M = -N + 2n (N + 1 entries).
 * @throws std::invalid_argument if L is outside [2, MAX_ENUMERATION_SIZE] or T <= 0
 */
Eigen::ArrayXd enumerate_magnetization_distribution(int L, double T, double J = 1.0, double h = 0.0);

/**
 * Boltzmann probability of every configuration of an L x L lattice.
 * Configuration index: bit (i * L + j) set means spin (i, j) is +1.
 * @throws std::invalid_argument if L is outside [2, MAX_STATE_ENUMERATION_SIZE] or T <= 0
 */
std::vector<double> enumerate_state_probabilities(int L, double T, double J = 1.0, double h = 0.0);

// Index of the lattice configuration in the enumeration order above
long int configuration_index(const IsingLattice& lattice);

/**
 * Project an exact P(M) onto histogram bins (mass per bin)
 */
Eigen::ArrayXd project_distribution(const Eigen::ArrayXd& distribution, int L, const HistogramBins& bins);

#endif // EXACT_SOLUTIONS_H
