/*
 * Observable Estimators Header
 *
 * Magnetization and spin-spin correlations of a 2D periodic Ising lattice.
 * Snapshot estimators are pure functions of the lattice; the
 * CorrelationAccumulator time-averages them over measurement sweeps.
 *
 * Correlation convention (used for both the general and the column estimator):
 *   raw        G(r) = < s(i,j) s(i+r,j) >
 *   connected  C(r) = G(r) - <m>^2
 * where <m> is the time-averaged magnetization per site of the whole lattice.
 */

#ifndef OBSERVABLES_H
#define OBSERVABLES_H

#include "lattice.h"
#include <optional>
#include <vector>

enum class CorrelationDirection {
    VERTICAL,    // Separation along rows: s(i,j) s(i+r,j)
    HORIZONTAL   // Separation along columns: s(i,j) s(i,j+r)
};

// Mean spin value over the lattice
double magnetization(const IsingLattice& lattice);

// Wrap-around distance between two indices on a ring of length L
int periodic_distance(int a, int b, int L);

/**
 * Raw pair correlation averaged over all sites at separation r.
 * r may be any integer; it is reduced to periodic_distance(0, r, L),
 * which is exact because G(r) = G(-r) = G(L - r) for every configuration.
 */
double pair_correlation(const IsingLattice& lattice, int r,
                        CorrelationDirection direction = CorrelationDirection::VERTICAL);

/**
 * Raw pair correlation restricted to one column, vertical separation r
 * (same wrap distance as pair_correlation)
 * @throws std::invalid_argument if column is outside [0, L)
 */
double column_correlation(const IsingLattice& lattice, int column, int r);

// G(r) for r = 0..max_separation
std::vector<double> pair_correlation_profile(const IsingLattice& lattice, int max_separation,
                                             CorrelationDirection direction = CorrelationDirection::VERTICAL);
std::vector<double> column_correlation_profile(const IsingLattice& lattice, int column, int max_separation);

/**
 * Time-averaged correlation estimator
 *
 * Accumulates the magnetization and raw pair products of each sampled
 * sweep, for the whole lattice and optionally for one column.
 */
class CorrelationAccumulator {
private:
    int max_separation;
    std::optional<int> column;
    CorrelationDirection direction;

    long int num_samples;
    double sum_magnetization;
    std::vector<double> sum_pair;
    std::vector<double> sum_column_pair;

public:
    CorrelationAccumulator(int max_sep, std::optional<int> column_index = std::nullopt,
                           CorrelationDirection dir = CorrelationDirection::VERTICAL);

    void sample(const IsingLattice& lattice);

    long int get_num_samples() const { return num_samples; }
    int get_max_separation() const { return max_separation; }
    bool has_column() const { return column.has_value(); }
    int get_column() const { return column.value_or(-1); }

    double mean_magnetization() const;
    std::vector<double> raw_correlation() const;
    std::vector<double> connected_correlation() const;
    std::vector<double> raw_column_correlation() const;
    std::vector<double> connected_column_correlation() const;
};

/**
 * Summary of one run, produced once and never mutated afterwards
 */
struct ObservableSnapshot {
    double temperature = 0.0;
    double field = 0.0;
    int lattice_size = 0;
    long int seed = 0;

    double mean_magnetization = 0.0;       // <m>
    double stddev_magnetization = 0.0;
    double mean_abs_magnetization = 0.0;   // <|m|>
    double mean_energy = 0.0;              // <E> / N
    double stddev_energy = 0.0;
    double specific_heat = 0.0;            // (<E^2> - <E>^2) / (N T^2)
    double susceptibility = 0.0;           // N (<m^2> - <m>^2) / T
    double acceptance_rate = 0.0;

    std::vector<double> magnetization_samples;  // m per sampled sweep

    std::vector<double> raw_correlation;        // G(r), r = 0..max_separation
    std::vector<double> connected_correlation;  // C(r)

    int column = -1;                            // -1 if no column measured
    std::vector<double> raw_column_correlation;
    std::vector<double> connected_column_correlation;
};

#endif // OBSERVABLES_H
