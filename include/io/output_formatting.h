/*
 * Output Formatting Utilities
 *
 * Functions for formatted console and file output
 */

#ifndef OUTPUT_FORMATTING_H
#define OUTPUT_FORMATTING_H

#include "../observables.h"
#include "../umbrella.h"
#include "../wham.h"
#include "config_types.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace IO {

/**
 * Print the Umbrising logo
 */
inline void print_logo() {
    std::cout << "\n";
    std::cout << " _   _           _          _     _             \n";
    std::cout << "| | | |_ __ ___ | |__  _ __(_)___(_)_ __   __ _ \n";
    std::cout << "| | | | '_ ` _ \\| '_ \\| '__| / __| | '_ \\ / _` |\n";
    std::cout << "| |_| | | | | | | |_) | |  | \\__ \\ | | | | (_| |\n";
    std::cout << " \\___/|_| |_| |_|_.__/|_|  |_|___/_|_| |_|\\__, |\n";
    std::cout << "                                          |___/ \n";
    std::cout << "\n";
    std::cout << "        2D Ising Metropolis Monte Carlo\n";
    std::cout << "        with Umbrella Sampling and WHAM\n";
    std::cout << "\n";
}

/**
 * Print a section separator
 */
inline void print_section_separator(const std::string& title = "") {
    std::cout << "\n";
    std::cout << "========================================";
    if (!title.empty()) {
        std::cout << "\n  " << title;
    }
    std::cout << "\n========================================\n";
}

/**
 * Print a subsection separator
 */
inline void print_subsection_separator(const std::string& title = "") {
    std::cout << "\n----------------------------------------\n";
    if (!title.empty()) {
        std::cout << "  " << title << "\n";
        std::cout << "----------------------------------------\n";
    }
}

// Fixed-precision number as text, for titles and file names
inline std::string format_number(double value, int precision = 4) {
    std::ostringstream text;
    text << std::fixed << std::setprecision(precision) << value;
    return text.str();
}

/**
 * Print the observables of one run in a structured, readable format
 *
 * @param snapshot Summary of the run
 * @param separations Separations whose connected correlation is listed (empty: all)
 */
inline void print_observables_formatted(const ObservableSnapshot& snapshot,
                                        const std::vector<int>& separations = {})
{
    std::cout << std::fixed;

    print_subsection_separator("T = " + format_number(snapshot.temperature) +
                               ", h = " + format_number(snapshot.field));

    // Global observables
    std::cout << "\n  Global Observables:\n";
    std::cout << "  -------------------\n";
    std::cout << std::setprecision(8);
    std::cout << "    Energy/site:         " << std::setw(14) << snapshot.mean_energy
              << " ± " << std::setw(14) << snapshot.stddev_energy << "\n";
    std::cout << "    Magnetization:       " << std::setw(14) << snapshot.mean_magnetization
              << " ± " << std::setw(14) << snapshot.stddev_magnetization << "\n";
    std::cout << "    |Magnetization|:     " << std::setw(14) << snapshot.mean_abs_magnetization << "\n";
    std::cout << "    Specific Heat:       " << std::setw(14) << snapshot.specific_heat << "\n";
    std::cout << "    Susceptibility:      " << std::setw(14) << snapshot.susceptibility << "\n";
    std::cout << std::setprecision(4);
    std::cout << "    Acceptance Rate:     " << std::setw(14) << snapshot.acceptance_rate << "\n";
    std::cout << "    Samples:             " << std::setw(14) << snapshot.magnetization_samples.size() << "\n";

    // Correlations
    if (!snapshot.connected_correlation.empty()) {
        std::cout << "\n  Spin-Spin Correlations (vertical separation r):\n";
        std::cout << "  ------------------------------------------------\n";
        std::cout << "         r             G(r)             C(r)\n";
        std::cout << std::setprecision(8);
        int max_r = static_cast<int>(snapshot.connected_correlation.size()) - 1;
        for (int r = 0; r <= max_r; r++) {
            if (!separations.empty() &&
                std::find(separations.begin(), separations.end(), r) == separations.end()) {
                continue;
            }
            std::cout << "    " << std::setw(6) << r
                      << "   " << std::setw(14) << snapshot.raw_correlation[r]
                      << "   " << std::setw(14) << snapshot.connected_correlation[r] << "\n";
        }
    }

    if (snapshot.column >= 0 && !snapshot.connected_column_correlation.empty()) {
        std::cout << "\n  Column " << snapshot.column << " Correlations:\n";
        std::cout << "  ------------------------\n";
        for (size_t r = 0; r < snapshot.connected_column_correlation.size(); r++) {
            std::cout << "    " << std::setw(6) << r
                      << "   " << std::setw(14) << snapshot.raw_column_correlation[r]
                      << "   " << std::setw(14) << snapshot.connected_column_correlation[r] << "\n";
        }
    }

    std::cout << std::endl;
}

/**
 * Print the window table and the WHAM result of one temperature
 */
inline void print_wham_summary(double T,
                               const std::vector<UmbrellaWindow>& windows,
                               const WhamResult& result,
                               double m_star,
                               double m_exact)
{
    print_subsection_separator("Umbrella sampling + WHAM at T = " + format_number(T));

    int num_gaps = 0;
    std::cout << "\n    window        m0           k        <m>_bias   acceptance  gap\n";
    for (const auto& w : windows) {
        std::cout << "    " << std::setw(6) << w.index
                  << std::fixed << std::setprecision(4)
                  << "  " << std::setw(10) << w.bias.target_magnetization
                  << "  " << std::setw(10) << std::setprecision(3) << w.bias.spring_constant
                  << "  " << std::setw(10) << std::setprecision(4) << w.mean_magnetization
                  << "  " << std::setw(10) << w.acceptance_rate
                  << "  " << (w.coverage_gap ? "yes" : "no") << "\n";
        if (w.coverage_gap) num_gaps++;
    }

    std::cout << "\n  WHAM: " << (result.converged ? "converged" : "NOT converged")
              << " after " << result.iterations << " iterations"
              << " (max |df| = " << std::scientific << std::setprecision(2)
              << result.max_offset_change << ")" << std::fixed << "\n";
    std::cout << "  Windows with coverage gaps: " << num_gaps << "\n";
    std::cout << std::setprecision(6);
    std::cout << "  Most probable |m|:   " << std::setw(12) << std::abs(m_star) << "\n";
    std::cout << "  Exact |m| (L = inf): " << std::setw(12) << m_exact << "\n";
    std::cout << std::endl;
}

} // namespace IO

#endif // OUTPUT_FORMATTING_H
