/*
 * Configuration Parser for Monte Carlo Simulations
 *
 * TOML Configuration Reference:
 * =============================
 *
 * [simulation]
 *   type = "single_point"               # single_point | field_scan | temperature_scan |
 *                                       # column_correlation | umbrella (default: "single_point")
 *   seed = 42                           # Random number seed (default: 42)
 *
 * [lattice]
 *   size = 20                           # Lattice size (square lattice: L x L)
 *   coupling = 1.0                      # Exchange coupling J (default: 1.0)
 *
 * [temperature]
 *   # For single temperature (default: value = 2.0):
 *   value = 2.0
 *
 *   # For an explicit list:
 *   values = [1.5, 2.0, 2.269, 2.5]
 *
 *   # For a temperature scan (both ends included):
 *   min = 1.0
 *   max = 4.0
 *   step = 0.1
 *
 * [field]                               # Same forms as [temperature] (default: value = 0.0)
 *   min = -1.0
 *   max = 1.0
 *   step = 0.1
 *
 * [monte_carlo]
 *   warmup_steps = 1000                 # Equilibration sweeps n_eq
 *   measurement_steps = 5000            # Measurement sweeps n_steps
 *   sampling_frequency = 1              # Sample every N sweeps
 *   independent_runs = 1                # Runs averaged per temperature (temperature_scan)
 *   site_selection = "random"           # "random" (row, then column) or "raster"
 *
 * [correlation]
 *   separations = [1, 2, 3, 5, 10]      # Separations reported by temperature_scan
 *   columns = [4, 9]                    # Columns analysed by column_correlation
 *   max_separation = -1                 # Largest separation measured (-1: L/2)
 *
 * [umbrella]
 *   num_windows = 31                    # Windows evenly spaced over [min_target, max_target]
 *   min_target = -1.0
 *   max_target = 1.0
 *   targets = [-0.5, 0.0, 0.5]          # Optional: explicit targets (override the three above)
 *   spring_constant = 200.0             # Shared k of k (m - m0)^2 (default: N/2)
 *   spring_constants = [...]            # Optional: one k per window
 *   num_bins = 401                      # Histogram bins (default: N+1, centred on attainable m)
 *   bin_min = -1.0                      # Optional explicit histogram edges (give both)
 *   bin_max = 1.0
 *   overlap_threshold = 1e-3            # Neighbor overlap below which a coverage gap is flagged
 *   warmup_steps = 500                  # Optional per-window override of monte_carlo.warmup_steps
 *   measurement_steps = 5000            # Optional per-window override of monte_carlo.measurement_steps
 *   compare_exact = true                # Report exact P(m) next to WHAM when L <= 5
 *
 * [wham]
 *   tolerance = 1e-6                    # Convergence threshold on max |df_i|
 *   max_iterations = 5000
 *
 * [output]
 *   base_name = "umbrising"             # Output file base name
 *   directory = "."                     # Output directory
 *   verbose = true                      # Progress lines during long phases
 *
 * [initialization]
 *   type = "random"                     # "random", "up", "down" or "file"
 *   file = "restart.dat"                # For type="file": lattice dump of a previous run
 *
 * [diagnostics]
 *   enable_profiling = false            # Enable timing/performance profiling
 *   enable_config_dump = false          # Enable lattice snapshots during measurement
 *   enable_observable_evolution = false # Enable per-measurement observable tracking
 *   dump_final_configuration = false    # Write the final lattice (restart file)
 *
 *   dump_ranks = [0, 1]                 # Ranks to dump: array of integers, "all", or "none"
 *   dump_every_n_measurements = 10      # Dump configuration every N measurements
 *   estimate_autocorrelation = true     # Estimate autocorrelation times at every point
 */

#include "../../include/io/configuration_parser.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

#include <toml.hpp>  // toml11 library for TOML parsing

namespace IO {

namespace {

// Accept integer or floating TOML values where a real number is expected
double read_number(const toml::value& table, const std::string& key, double fallback) {
    if (!table.contains(key)) return fallback;
    const auto& value = toml::find(table, key);
    if (value.is_floating()) return value.as_floating();
    if (value.is_integer()) return static_cast<double>(value.as_integer());
    throw ConfigurationError("'" + key + "' must be a number");
}

std::vector<double> read_number_array(const toml::value& table, const std::string& key) {
    std::vector<double> numbers;
    const auto& value = toml::find(table, key);
    if (!value.is_array()) {
        throw ConfigurationError("'" + key + "' must be an array of numbers");
    }
    for (const auto& element : value.as_array()) {
        if (element.is_floating()) {
            numbers.push_back(element.as_floating());
        } else if (element.is_integer()) {
            numbers.push_back(static_cast<double>(element.as_integer()));
        } else {
            throw ConfigurationError("'" + key + "' must be an array of numbers");
        }
    }
    return numbers;
}

std::vector<int> read_integer_array(const toml::value& table, const std::string& key) {
    std::vector<int> integers;
    const auto& value = toml::find(table, key);
    if (!value.is_array()) {
        throw ConfigurationError("'" + key + "' must be an array of integers");
    }
    for (const auto& element : value.as_array()) {
        if (!element.is_integer()) {
            throw ConfigurationError("'" + key + "' must be an array of integers");
        }
        integers.push_back(static_cast<int>(element.as_integer()));
    }
    return integers;
}

ScanConfig parse_scan_section(const toml::value& section, const std::string& name, double default_value) {
    ScanConfig scan;
    bool has_range = section.contains("min") || section.contains("max") || section.contains("step");

    if (section.contains("values")) {
        scan.type = ScanConfig::LIST;
        scan.values = read_number_array(section, "values");
    } else if (has_range) {
        if (!section.contains("min") || !section.contains("max") || !section.contains("step")) {
            throw ConfigurationError("[" + name + "] range needs min, max and step");
        }
        scan.type = ScanConfig::SCAN;
        scan.min_value = read_number(section, "min", 0.0);
        scan.max_value = read_number(section, "max", 0.0);
        scan.step = read_number(section, "step", 0.0);
    } else {
        scan.type = ScanConfig::SINGLE;
        scan.value = read_number(section, "value", default_value);
    }
    return scan;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

const std::vector<std::string>& ConfigurationParser::simulation_types() {
    static const std::vector<std::string> types = {
        "single_point", "field_scan", "temperature_scan", "column_correlation", "umbrella"
    };
    return types;
}

SimulationConfig ConfigurationParser::load_configuration(const std::string& toml_file) {
    SimulationConfig config;

    try {
        // Parse main TOML file
        parse_toml_file(toml_file, config);

        // Validate the complete configuration
        validate_configuration(config);

        std::cout << "Configuration loaded successfully:" << std::endl;
        std::cout << "  - Simulation type: " << config.simulation_type << std::endl;
        std::cout << "  - Lattice size: " << config.lattice_size << "x" << config.lattice_size << std::endl;
        std::cout << "  - Coupling J: " << config.coupling_J << std::endl;

        return config;

    } catch (const std::exception& e) {
        throw ConfigurationError("Failed to load configuration: " + std::string(e.what()));
    }
}

void ConfigurationParser::parse_toml_file(const std::string& toml_file, SimulationConfig& config) {
    try {
        // Parse TOML file using toml11
        const auto data = toml::parse(toml_file);

        // Parse simulation section
        if (data.contains("simulation")) {
            const auto sim = toml::find(data, "simulation");
            config.simulation_type = to_lower(toml::find_or<std::string>(sim, "type", "single_point"));
            config.monte_carlo.seed = toml::find_or<long>(sim, "seed", 42);
        }

        // Parse lattice section
        if (data.contains("lattice")) {
            const auto lattice = toml::find(data, "lattice");
            config.lattice_size = toml::find_or<int>(lattice, "size", 20);
            config.coupling_J = read_number(lattice, "coupling", 1.0);
        }

        // Parse temperature and field grids
        if (data.contains("temperature")) {
            config.temperature = parse_scan_section(toml::find(data, "temperature"), "temperature", 2.0);
        } else {
            config.temperature.type = ScanConfig::SINGLE;
            config.temperature.value = 2.0;
        }

        if (data.contains("field")) {
            config.field = parse_scan_section(toml::find(data, "field"), "field", 0.0);
        } else {
            config.field.type = ScanConfig::SINGLE;
            config.field.value = 0.0;
        }

        // Parse monte_carlo section
        if (data.contains("monte_carlo")) {
            const auto mc = toml::find(data, "monte_carlo");
            config.monte_carlo.warmup_steps = toml::find_or<int>(mc, "warmup_steps", 1000);
            config.monte_carlo.measurement_steps = toml::find_or<int>(mc, "measurement_steps", 5000);
            config.monte_carlo.sampling_frequency = toml::find_or<int>(mc, "sampling_frequency", 1);
            config.monte_carlo.independent_runs = toml::find_or<int>(mc, "independent_runs", 1);
            config.monte_carlo.site_selection = to_lower(toml::find_or<std::string>(mc, "site_selection", "random"));
        }

        // Parse correlation section
        if (data.contains("correlation")) {
            const auto corr = toml::find(data, "correlation");
            if (corr.contains("separations")) {
                config.correlation.separations = read_integer_array(corr, "separations");
            }
            if (corr.contains("columns")) {
                config.correlation.columns = read_integer_array(corr, "columns");
            }
            config.correlation.max_separation = toml::find_or<int>(corr, "max_separation", -1);
        }

        // Parse umbrella section
        if (data.contains("umbrella")) {
            const auto umb = toml::find(data, "umbrella");
            UmbrellaConfig& uc = config.umbrella;

            uc.num_windows = toml::find_or<int>(umb, "num_windows", 31);
            uc.min_target = read_number(umb, "min_target", -1.0);
            uc.max_target = read_number(umb, "max_target", 1.0);
            if (umb.contains("targets")) {
                uc.targets = read_number_array(umb, "targets");
            }

            if (umb.contains("spring_constant")) {
                uc.spring_constant = read_number(umb, "spring_constant", -1.0);
                if (uc.spring_constant < 0.0) {
                    throw ConfigurationError("umbrella.spring_constant must be non-negative");
                }
            }
            if (umb.contains("spring_constants")) {
                uc.spring_constants = read_number_array(umb, "spring_constants");
            }

            if (umb.contains("num_bins")) {
                uc.num_bins = toml::find<int>(umb, "num_bins");
                if (uc.num_bins <= 0) {
                    throw ConfigurationError("umbrella.num_bins must be positive");
                }
            }
            if (umb.contains("bin_min") || umb.contains("bin_max")) {
                if (!umb.contains("bin_min") || !umb.contains("bin_max")) {
                    throw ConfigurationError("umbrella.bin_min and umbrella.bin_max must be given together");
                }
                uc.explicit_bin_edges = true;
                uc.bin_min = read_number(umb, "bin_min", -1.0);
                uc.bin_max = read_number(umb, "bin_max", 1.0);
            }

            uc.overlap_threshold = read_number(umb, "overlap_threshold", 1e-3);
            if (umb.contains("warmup_steps")) {
                uc.warmup_steps = toml::find<int>(umb, "warmup_steps");
                if (uc.warmup_steps <= 0) {
                    throw ConfigurationError("umbrella.warmup_steps must be positive");
                }
            }
            if (umb.contains("measurement_steps")) {
                uc.measurement_steps = toml::find<int>(umb, "measurement_steps");
                if (uc.measurement_steps <= 0) {
                    throw ConfigurationError("umbrella.measurement_steps must be positive");
                }
            }
            uc.compare_exact = toml::find_or<bool>(umb, "compare_exact", true);
        }

        // Parse wham section
        if (data.contains("wham")) {
            const auto wham = toml::find(data, "wham");
            config.wham.tolerance = read_number(wham, "tolerance", 1e-6);
            config.wham.max_iterations = toml::find_or<int>(wham, "max_iterations", 5000);
        }

        // Parse output section
        if (data.contains("output")) {
            const auto output = toml::find(data, "output");
            config.output.base_name = toml::find_or<std::string>(output, "base_name", "umbrising");
            config.output.directory = toml::find_or<std::string>(output, "directory", ".");
            config.output.verbose = toml::find_or<bool>(output, "verbose", true);
        }

        // Parse diagnostics section (optional)
        if (data.contains("diagnostics")) {
            const auto diag = toml::find(data, "diagnostics");
            config.diagnostics.enable_profiling = toml::find_or<bool>(diag, "enable_profiling", false);
            config.diagnostics.enable_config_dump = toml::find_or<bool>(diag, "enable_config_dump", false);
            config.diagnostics.enable_observable_evolution = toml::find_or<bool>(diag, "enable_observable_evolution", false);
            config.diagnostics.dump_final_configuration = toml::find_or<bool>(diag, "dump_final_configuration", false);

            config.diagnostics.dump_every_n_measurements = toml::find_or<int>(diag, "dump_every_n_measurements", 10);
            config.diagnostics.estimate_autocorrelation = toml::find_or<bool>(diag, "estimate_autocorrelation", true);

            // Parse dump_ranks - can be "all", "none", or array of integers
            if (diag.contains("dump_ranks")) {
                const auto& dump_ranks_value = toml::find(diag, "dump_ranks");

                if (dump_ranks_value.is_string()) {
                    std::string dump_ranks_str = dump_ranks_value.as_string();
                    if (dump_ranks_str == "all") {
                        config.diagnostics.dump_all_ranks = true;
                    } else if (dump_ranks_str == "none") {
                        config.diagnostics.dump_all_ranks = false;
                        config.diagnostics.dump_ranks.clear();
                    } else {
                        throw ConfigurationError("Invalid dump_ranks string: " + dump_ranks_str +
                                                 " (expected 'all' or 'none')");
                    }
                } else if (dump_ranks_value.is_array()) {
                    config.diagnostics.dump_ranks = read_integer_array(diag, "dump_ranks");
                } else {
                    throw ConfigurationError("dump_ranks must be a string ('all'/'none') or array of integers");
                }
            } else {
                config.diagnostics.dump_ranks = {0};
            }
        } else {
            config.diagnostics.dump_ranks = {0};
        }

        // Parse initialization section (optional)
        if (data.contains("initialization")) {
            const auto init = toml::find(data, "initialization");

            std::string type_str = to_lower(toml::find_or<std::string>(init, "type", "random"));
            if (type_str == "random") {
                config.initialization.type = InitializationConfig::RANDOM;
            } else if (type_str == "up") {
                config.initialization.type = InitializationConfig::UP;
            } else if (type_str == "down") {
                config.initialization.type = InitializationConfig::DOWN;
            } else if (type_str == "file") {
                config.initialization.type = InitializationConfig::FILE;
            } else {
                throw ConfigurationError("Invalid initialization type: " + type_str +
                                         " (expected 'random', 'up', 'down' or 'file')");
            }

            config.initialization.file = toml::find_or<std::string>(init, "file", "");
        }

    } catch (const ConfigurationError&) {
        throw;
    } catch (const toml::syntax_error& e) {
        throw ConfigurationError("TOML syntax error in " + toml_file + ": " + e.what());
    } catch (const toml::type_error& e) {
        throw ConfigurationError("TOML type error in " + toml_file + ": " + e.what());
    } catch (const std::exception& e) {
        throw ConfigurationError("Error parsing TOML file " + toml_file + ": " + e.what());
    }
}

void ConfigurationParser::validate_scan(const ScanConfig& scan, const std::string& name, bool require_positive) {
    auto check_value = [&](double value) {
        if (!std::isfinite(value)) {
            throw ConfigurationError(name + " values must be finite");
        }
        if (require_positive && value <= 0.0) {
            throw ConfigurationError(name + " must be positive, got " + std::to_string(value));
        }
    };

    switch (scan.type) {
        case ScanConfig::SINGLE:
            check_value(scan.value);
            break;
        case ScanConfig::LIST:
            if (scan.values.empty()) {
                throw ConfigurationError(name + " list is empty");
            }
            for (double value : scan.values) check_value(value);
            break;
        case ScanConfig::SCAN:
            check_value(scan.min_value);
            check_value(scan.max_value);
            if (scan.max_value < scan.min_value) {
                throw ConfigurationError("Maximum " + name + " must not be below the minimum");
            }
            if (!std::isfinite(scan.step) || scan.step <= 0.0) {
                throw ConfigurationError(name + " step must be positive");
            }
            break;
    }
}

void ConfigurationParser::validate_configuration(const SimulationConfig& config) {
    const auto& types = simulation_types();
    if (std::find(types.begin(), types.end(), config.simulation_type) == types.end()) {
        throw ConfigurationError("Unknown simulation type: " + config.simulation_type);
    }

    // Validate parameter ranges
    if (config.lattice_size <= 0) {
        throw ConfigurationError("Lattice size must be positive");
    }
    if (!std::isfinite(config.coupling_J)) {
        throw ConfigurationError("Coupling J must be finite");
    }

    validate_scan(config.temperature, "Temperature", true);
    validate_scan(config.field, "Field", false);

    if (config.monte_carlo.warmup_steps <= 0 || config.monte_carlo.measurement_steps <= 0) {
        throw ConfigurationError("Monte Carlo steps must be positive");
    }
    if (config.monte_carlo.sampling_frequency <= 0) {
        throw ConfigurationError("Sampling frequency must be positive");
    }
    if (config.monte_carlo.independent_runs <= 0) {
        throw ConfigurationError("Number of independent runs must be positive");
    }
    const std::string& selection = config.monte_carlo.site_selection;
    if (selection != "random" && selection != "raster") {
        throw ConfigurationError("Unknown site selection: " + selection + " (expected 'random' or 'raster')");
    }

    const int L = config.lattice_size;
    for (int r : config.correlation.separations) {
        if (r < 0) {
            throw ConfigurationError("Correlation separations must be non-negative");
        }
    }
    if (config.simulation_type == "column_correlation") {
        if (config.correlation.columns.empty()) {
            throw ConfigurationError("column_correlation needs at least one column");
        }
        for (int column : config.correlation.columns) {
            if (column < 0 || column >= L) {
                throw ConfigurationError("Correlation column " + std::to_string(column) +
                                         " outside lattice of size " + std::to_string(L));
            }
        }
    }
    if (config.correlation.max_separation < -1) {
        throw ConfigurationError("max_separation must be -1 (L/2) or non-negative");
    }

    const UmbrellaConfig& uc = config.umbrella;
    if (uc.targets.empty() && uc.num_windows <= 0) {
        throw ConfigurationError("Number of umbrella windows must be positive");
    }
    for (double target : uc.targets) {
        if (!std::isfinite(target)) {
            throw ConfigurationError("Umbrella targets must be finite");
        }
    }
    if (!std::isfinite(uc.min_target) || !std::isfinite(uc.max_target)) {
        throw ConfigurationError("Umbrella target range must be finite");
    }
    size_t num_windows = uc.targets.empty() ? static_cast<size_t>(uc.num_windows) : uc.targets.size();
    if (!uc.spring_constants.empty() && uc.spring_constants.size() != 1 &&
        uc.spring_constants.size() != num_windows) {
        throw ConfigurationError("umbrella.spring_constants needs one value or one per window");
    }
    for (double k : uc.spring_constants) {
        if (!std::isfinite(k) || k < 0.0) {
            throw ConfigurationError("Umbrella spring constants must be finite and non-negative");
        }
    }
    if (!std::isfinite(uc.spring_constant)) {
        throw ConfigurationError("Umbrella spring constant must be finite");
    }
    if (uc.explicit_bin_edges && (!std::isfinite(uc.bin_min) || !std::isfinite(uc.bin_max) ||
                                  uc.bin_max <= uc.bin_min)) {
        throw ConfigurationError("Histogram edges need bin_max > bin_min");
    }
    if (!std::isfinite(uc.overlap_threshold) || uc.overlap_threshold < 0.0) {
        throw ConfigurationError("Overlap threshold must be non-negative");
    }

    if (!std::isfinite(config.wham.tolerance) || config.wham.tolerance <= 0.0) {
        throw ConfigurationError("WHAM tolerance must be positive");
    }
    if (config.wham.max_iterations <= 0) {
        throw ConfigurationError("WHAM max_iterations must be positive");
    }

    if (config.diagnostics.dump_every_n_measurements <= 0) {
        throw ConfigurationError("dump_every_n_measurements must be positive");
    }
    if (config.initialization.type == InitializationConfig::FILE && config.initialization.file.empty()) {
        throw ConfigurationError("initialization.type = \"file\" needs initialization.file");
    }
}

} // namespace IO
