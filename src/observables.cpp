/*
 * Observable Estimators Implementation
 */

#include "../include/observables.h"
#include <cstdlib>
#include <stdexcept>
#include <string>

double magnetization(const IsingLattice& lattice) {
    return static_cast<double>(lattice.get_spin_array().sum()) / lattice.get_num_sites();
}

int periodic_distance(int a, int b, int L) {
    int d = std::abs(a - b) % L;
    return (d < L - d) ? d : L - d;
}

double pair_correlation(const IsingLattice& lattice, int r, CorrelationDirection direction) {
    const int L = lattice.size();
    const int shift = periodic_distance(0, r, L);
    long int pair_sum = 0;

    if (direction == CorrelationDirection::VERTICAL) {
        for (int i = 0; i < L; i++) {
            int i_shifted = (i + shift) % L;
            for (int j = 0; j < L; j++) {
                pair_sum += lattice.get_spin(i, j) * lattice.get_spin(i_shifted, j);
            }
        }
    } else {
        for (int i = 0; i < L; i++) {
            for (int j = 0; j < L; j++) {
                pair_sum += lattice.get_spin(i, j) * lattice.get_spin(i, (j + shift) % L);
            }
        }
    }

    return static_cast<double>(pair_sum) / lattice.get_num_sites();
}

double column_correlation(const IsingLattice& lattice, int column, int r) {
    const int L = lattice.size();
    if (column < 0 || column >= L) {
        throw std::invalid_argument("Column index " + std::to_string(column) +
                                    " outside lattice of size " + std::to_string(L));
    }

    const int shift = periodic_distance(0, r, L);
    long int pair_sum = 0;
    for (int i = 0; i < L; i++) {
        pair_sum += lattice.get_spin(i, column) * lattice.get_spin((i + shift) % L, column);
    }
    return static_cast<double>(pair_sum) / L;
}

std::vector<double> pair_correlation_profile(const IsingLattice& lattice, int max_separation,
                                             CorrelationDirection direction) {
    std::vector<double> profile(max_separation + 1);
    for (int r = 0; r <= max_separation; r++) {
        profile[r] = pair_correlation(lattice, r, direction);
    }
    return profile;
}

std::vector<double> column_correlation_profile(const IsingLattice& lattice, int column, int max_separation) {
    std::vector<double> profile(max_separation + 1);
    for (int r = 0; r <= max_separation; r++) {
        profile[r] = column_correlation(lattice, column, r);
    }
    return profile;
}

// CorrelationAccumulator

CorrelationAccumulator::CorrelationAccumulator(int max_sep, std::optional<int> column_index,
                                               CorrelationDirection dir)
    : max_separation(max_sep), column(column_index), direction(dir),
      num_samples(0), sum_magnetization(0.0) {
    if (max_separation < 0) {
        throw std::invalid_argument("Maximum correlation separation must be non-negative");
    }
    sum_pair.assign(max_separation + 1, 0.0);
    if (column.has_value()) {
        sum_column_pair.assign(max_separation + 1, 0.0);
    }
}

void CorrelationAccumulator::sample(const IsingLattice& lattice) {
    sum_magnetization += lattice.get_magnetization();

    for (int r = 0; r <= max_separation; r++) {
        sum_pair[r] += pair_correlation(lattice, r, direction);
    }
    if (column.has_value()) {
        for (int r = 0; r <= max_separation; r++) {
            sum_column_pair[r] += column_correlation(lattice, *column, r);
        }
    }

    num_samples++;
}

double CorrelationAccumulator::mean_magnetization() const {
    return num_samples > 0 ? sum_magnetization / num_samples : 0.0;
}

std::vector<double> CorrelationAccumulator::raw_correlation() const {
    std::vector<double> result(sum_pair.size(), 0.0);
    if (num_samples == 0) return result;
    for (size_t r = 0; r < sum_pair.size(); r++) {
        result[r] = sum_pair[r] / num_samples;
    }
    return result;
}

std::vector<double> CorrelationAccumulator::connected_correlation() const {
    std::vector<double> result = raw_correlation();
    if (num_samples == 0) return result;
    double m = mean_magnetization();
    for (double& value : result) value -= m * m;
    return result;
}

std::vector<double> CorrelationAccumulator::raw_column_correlation() const {
    std::vector<double> result(sum_column_pair.size(), 0.0);
    if (num_samples == 0) return result;
    for (size_t r = 0; r < sum_column_pair.size(); r++) {
        result[r] = sum_column_pair[r] / num_samples;
    }
    return result;
}

std::vector<double> CorrelationAccumulator::connected_column_correlation() const {
    std::vector<double> result = raw_column_correlation();
    if (num_samples == 0) return result;
    double m = mean_magnetization();
    for (double& value : result) value -= m * m;
    return result;
}
