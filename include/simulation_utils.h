/*
 * Simulation Utilities
 *
 * Helper functions for turning a parsed configuration into the core
 * objects of a run (parameters, measurement options, umbrella settings,
 * WHAM options) and for expanding temperature/field grids.
 */

#ifndef SIMULATION_UTILS_H
#define SIMULATION_UTILS_H

#include "io/config_types.h"
#include "mc_phases.h"
#include "simulation_parameters.h"
#include "umbrella.h"
#include "wham.h"
#include <string>
#include <vector>

/**
 * Expand a temperature or field scan into its grid values
 * Ranges include both ends (within half a step).
 *
 * @throws IO::ConfigurationError for an empty list or an invalid range
 */
std::vector<double> expand_scan(const IO::ScanConfig& scan, const std::string& name);

/**
 * Parameters of a single run at (T, h)
 *
 * @param config Full configuration
 * @param T Temperature of the run
 * @param h Field of the run
 * @param seed Seed of the run (use derive_seed for independent streams)
 */
SimulationParameters create_parameters_from_config(const IO::SimulationConfig& config,
                                                   double T, double h, long int seed);

/**
 * Measurement options for the given rank
 */
MeasurementOptions create_measurement_options_from_config(const IO::SimulationConfig& config,
                                                         int rank,
                                                         const std::string& dump_dir);

/**
 * Umbrella windows, spring constants and shared bins
 */
UmbrellaSettings create_umbrella_settings_from_config(const IO::SimulationConfig& config);

WhamOptions create_wham_options_from_config(const IO::SimulationConfig& config);

/**
 * Initial lattice of the run; FILE loads a dump written by a previous run
 *
 * @throws IO::ConfigurationError if the dump cannot be read or does not match the lattice size
 */
InitialConfiguration create_initial_configuration_from_config(const IO::SimulationConfig& config);

#endif // SIMULATION_UTILS_H
