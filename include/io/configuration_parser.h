#pragma once
#include "config_types.h"
#include <string>
#include <vector>

namespace IO {

/**
 * Main configuration parser class
 *
 * Provides a simple interface to load all simulation configuration
 * from a TOML file. Designed for clarity over performance.
 */
class ConfigurationParser {
public:
    /**
     * Load complete simulation configuration from TOML file
     *
     * @param toml_file Path to main TOML configuration file
     * @return Complete, validated configuration structure
     * @throws ConfigurationError if any parsing or validation fails
     */
    static SimulationConfig load_configuration(const std::string& toml_file);

    /**
     * Check parameter ranges of a configuration
     *
     * @throws ConfigurationError on the first invalid value
     */
    static void validate_configuration(const SimulationConfig& config);

    // Simulation types understood by the main program
    static const std::vector<std::string>& simulation_types();

private:
    /**
     * Parse the main TOML configuration file
     */
    static void parse_toml_file(const std::string& toml_file, SimulationConfig& config);

    /**
     * Check a temperature or field grid
     */
    static void validate_scan(const ScanConfig& scan, const std::string& name, bool require_positive);
};

} // namespace IO
