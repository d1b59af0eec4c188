/*
 * Diagnostic Utilities for Monte Carlo Simulations
 *
 * Functions for dumping and restoring lattice configurations, tracking
 * observable evolution, and other diagnostic operations.
 */

#ifndef DIAGNOSTIC_UTILS_H
#define DIAGNOSTIC_UTILS_H

#include "../lattice.h"
#include "config_types.h"
#include <string>
#include <vector>
#include <fstream>

namespace IO {

/**
 * Create directory if it doesn't exist
 *
 * @param path Path to directory
 * @throws std::runtime_error if the directory cannot be created
 */
void create_directory(const std::string& path);

/**
 * Write a lattice to a file: '#' header lines, then L rows of L spins
 *
 * @param lattice Lattice to write
 * @param filename Output path
 * @param temperature Temperature of the run (header only)
 * @param field Field of the run (header only)
 * @param label Free text describing the dump (header only)
 * @return true on success; a warning is printed otherwise
 */
bool write_lattice_dump(const IsingLattice& lattice,
                        const std::string& filename,
                        double temperature,
                        double field,
                        const std::string& label);

/**
 * Dump configuration during the measurement phase
 *
 * @param lattice Current lattice
 * @param temperature Current temperature
 * @param field Current field
 * @param measurement_step Current measurement sweep
 * @param rank MPI rank
 * @param dump_dir Directory for dump files
 */
void dump_lattice_to_file(const IsingLattice& lattice,
                          double temperature,
                          double field,
                          int measurement_step,
                          int rank,
                          const std::string& dump_dir);

/**
 * Read a lattice dump back (restart)
 *
 * @param filename Dump written by write_lattice_dump
 * @param lattice_size Set to L of the dump
 * @return Row-major spins
 * @throws ConfigurationError if the file is missing, ragged, or holds values other than +1/-1
 */
std::vector<int> load_lattice_from_file(const std::string& filename, int& lattice_size);

/**
 * Setup and open observable evolution file
 *
 * @param dump_dir Directory for output files
 * @param rank MPI rank
 * @param temperature Current temperature
 * @param field Current field
 * @return Opened output file stream
 */
std::ofstream setup_observable_evolution_file(const std::string& dump_dir,
                                              int rank,
                                              double temperature,
                                              double field);

/**
 * Write observable evolution data to file
 *
 * @param file Output file stream
 * @param measurement_step Current measurement sweep
 * @param energy Energy per site
 * @param magnetization Magnetization per site
 * @param abs_magnetization |m|
 * @param acceptance_rate Acceptance rate so far
 */
void write_observable_evolution(std::ofstream& file,
                                int measurement_step,
                                double energy,
                                double magnetization,
                                double abs_magnetization,
                                double acceptance_rate);

} // namespace IO

#endif // DIAGNOSTIC_UTILS_H
