/*
 * Configuration I/O Tests
 *
 * Tests for configuration file parsing, validation, conversion into
 * run objects, and lattice dump/restart files
 */

#include "../include/io/configuration_parser.h"
#include "../include/io/diagnostic_utils.h"
#include "../include/random.h"
#include "../include/simulation_utils.h"
#include <iostream>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

using namespace IO;

// Test counter
int tests_passed = 0;
int tests_total = 0;

void test_result(bool passed, const std::string& test_name) {
    tests_total++;
    if (passed) {
        tests_passed++;
        std::cout << "✓ " << test_name << std::endl;
    } else {
        std::cout << "✗ " << test_name << " FAILED" << std::endl;
    }
}

// True if loading the file is rejected with a ConfigurationError
bool rejects_configuration(const std::string& toml_file) {
    try {
        ConfigurationParser::load_configuration(toml_file);
    } catch (const ConfigurationError& e) {
        std::cout << "  Rejected: " << e.what() << std::endl;
        return true;
    }
    std::cerr << "ERROR: " << toml_file << " was accepted" << std::endl;
    return false;
}

/**
 * Test 1: Single point configuration with every section given
 */
bool test_single_point_loading() {
    std::cout << "\n=== Test 1: Single Point Configuration ===" << std::endl;

    try {
        SimulationConfig config = ConfigurationParser::load_configuration(
            "tests/io_test_data/single_point/simulation.toml");

        if (config.simulation_type != "single_point" || config.lattice_size != 8 ||
            config.monte_carlo.seed != 7) {
            std::cerr << "ERROR: [simulation]/[lattice] not loaded correctly" << std::endl;
            return false;
        }

        if (config.temperature.type != ScanConfig::SINGLE || config.temperature.value != 2.5 ||
            config.field.type != ScanConfig::SINGLE || config.field.value != 0.1) {
            std::cerr << "ERROR: Temperature/field not loaded as single values" << std::endl;
            return false;
        }

        const MonteCarloConfig& mc = config.monte_carlo;
        if (mc.warmup_steps != 200 || mc.measurement_steps != 1000 || mc.sampling_frequency != 2 ||
            mc.site_selection != "raster") {
            std::cerr << "ERROR: [monte_carlo] not loaded correctly" << std::endl;
            return false;
        }

        if (config.correlation.separations != std::vector<int>{1, 2, 4} ||
            config.correlation.max_separation != 3) {
            std::cerr << "ERROR: [correlation] not loaded correctly" << std::endl;
            return false;
        }

        if (config.output.base_name != "io_single" || config.output.directory != "results" ||
            config.output.verbose) {
            std::cerr << "ERROR: [output] not loaded correctly" << std::endl;
            return false;
        }

        // Run parameters built from the configuration
        SimulationParameters params = create_parameters_from_config(config, 2.5, 0.1, 99);
        if (params.lattice_size != 8 || params.temperature != 2.5 || params.field_h != 0.1 ||
            params.equilibration_sweeps != 200 || params.measurement_sweeps != 1000 || params.seed != 99 ||
            params.site_selection != SiteSelection::RASTER) {
            std::cerr << "ERROR: SimulationParameters do not match the configuration" << std::endl;
            return false;
        }

        InitialConfiguration initial = create_initial_configuration_from_config(config);
        if (initial.type != InitialState::ALL_UP) {
            std::cerr << "ERROR: initialization.type = \"up\" not honoured" << std::endl;
            return false;
        }

        // dump_ranks = "all": every rank dumps configurations
        MeasurementOptions options = create_measurement_options_from_config(config, 3, "results/dumps");
        if (options.sampling_frequency != 2 || options.max_separation != 3 || !options.dump_configurations ||
            options.write_observable_evolution || options.dump_every_n_measurements != 25 ||
            options.rank != 3 || options.verbose) {
            std::cerr << "ERROR: MeasurementOptions do not match the configuration" << std::endl;
            return false;
        }

        std::cout << "  Loaded L=" << config.lattice_size << " at T=" << config.temperature.value
                  << ", h=" << config.field.value << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 2: Umbrella configuration with explicit windows and WHAM options
 */
bool test_umbrella_loading() {
    std::cout << "\n=== Test 2: Umbrella Configuration ===" << std::endl;

    try {
        SimulationConfig config = ConfigurationParser::load_configuration(
            "tests/io_test_data/umbrella/simulation.toml");

        std::vector<double> temperatures = expand_scan(config.temperature, "temperature");
        if (config.simulation_type != "umbrella" || temperatures != std::vector<double>{2.0, 2.5}) {
            std::cerr << "ERROR: Umbrella mode or temperature list not loaded" << std::endl;
            return false;
        }

        UmbrellaSettings settings = create_umbrella_settings_from_config(config);
        if (settings.targets != std::vector<double>{-0.5, 0.0, 0.5}) {
            std::cerr << "ERROR: Explicit targets not loaded" << std::endl;
            return false;
        }
        if (settings.spring_constant_for(0) != 10.0 || settings.spring_constant_for(1) != 20.0 ||
            settings.spring_constant_for(2) != 30.0) {
            std::cerr << "ERROR: Per-window spring constants not loaded" << std::endl;
            return false;
        }
        if (settings.bins.size() != 37 || settings.bins.get_lower() != -1.0 || settings.bins.get_upper() != 1.0) {
            std::cerr << "ERROR: Explicit bin count not honoured" << std::endl;
            return false;
        }
        if (settings.overlap_threshold != 0.01 || settings.equilibration_sweeps != -1 ||
            settings.measurement_sweeps != 4000 || config.umbrella.compare_exact) {
            std::cerr << "ERROR: Umbrella run options not loaded" << std::endl;
            return false;
        }

        WhamOptions wham = create_wham_options_from_config(config);
        if (wham.tolerance != 1e-8 || wham.max_iterations != 2000 || !wham.initial_offsets.empty()) {
            std::cerr << "ERROR: [wham] not loaded correctly" << std::endl;
            return false;
        }

        std::cout << "  " << settings.targets.size() << " windows, " << settings.bins.size() << " bins" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 3: Defaults filled in for a minimal umbrella configuration
 */
bool test_umbrella_defaults() {
    std::cout << "\n=== Test 3: Umbrella Defaults ===" << std::endl;

    try {
        SimulationConfig config = ConfigurationParser::load_configuration(
            "tests/io_test_data/minimal/simulation.toml");

        if (config.temperature.value != 2.0 || config.field.value != 0.0 || config.monte_carlo.seed != 42) {
            std::cerr << "ERROR: Default temperature/field/seed not applied" << std::endl;
            return false;
        }

        UmbrellaSettings settings = create_umbrella_settings_from_config(config);

        // 31 windows from -1 to 1 with k = N / 2 = 8
        if (settings.targets.size() != 31 || std::abs(settings.targets.front() + 1.0) > 1e-12 ||
            std::abs(settings.targets.back() - 1.0) > 1e-12 || std::abs(settings.targets[15]) > 1e-12) {
            std::cerr << "ERROR: Default targets incorrect" << std::endl;
            return false;
        }
        if (settings.spring_constants.size() != 1 || settings.spring_constant_for(30) != 8.0) {
            std::cerr << "ERROR: Default spring constant should be 8, got "
                      << settings.spring_constant_for(0) << std::endl;
            return false;
        }
        if (!(settings.bins == HistogramBins::for_lattice(4))) {
            std::cerr << "ERROR: Default bins should be centred on the 17 attainable m values" << std::endl;
            return false;
        }

        WhamOptions wham = create_wham_options_from_config(config);
        if (wham.tolerance != 1e-6 || wham.max_iterations != 5000) {
            std::cerr << "ERROR: Default WHAM options incorrect" << std::endl;
            return false;
        }

        // No [diagnostics] section: rank 0 is the dump rank, but nothing is enabled
        if (config.diagnostics.dump_ranks != std::vector<int>{0} || config.diagnostics.should_dump_rank(0)) {
            std::cerr << "ERROR: Default diagnostics incorrect" << std::endl;
            return false;
        }

        std::cout << "  Defaults: 31 windows, k = " << settings.spring_constant_for(0)
                  << ", " << settings.bins.size() << " bins" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 4: Scan expansion
 */
bool test_scan_expansion() {
    std::cout << "\n=== Test 4: Scan Expansion ===" << std::endl;

    ScanConfig range;
    range.type = ScanConfig::SCAN;
    range.min_value = 1.0;
    range.max_value = 2.0;
    range.step = 0.25;
    std::vector<double> grid = expand_scan(range, "temperature");
    if (grid.size() != 5 || grid.front() != 1.0 || std::abs(grid.back() - 2.0) > 1e-12) {
        std::cerr << "ERROR: Range 1.0..2.0 step 0.25 should give 5 points ending at 2.0" << std::endl;
        return false;
    }

    // A step that does not divide the range still ends within half a step of max
    range.step = 0.3;
    grid = expand_scan(range, "temperature");
    if (grid.size() != 4 || std::abs(grid.back() - 1.9) > 1e-12) {
        std::cerr << "ERROR: Range 1.0..2.0 step 0.3 gave " << grid.size() << " points" << std::endl;
        return false;
    }

    ScanConfig single;
    single.value = -0.4;
    if (expand_scan(single, "field") != std::vector<double>{-0.4}) {
        std::cerr << "ERROR: Single value scan" << std::endl;
        return false;
    }

    ScanConfig empty_list;
    empty_list.type = ScanConfig::LIST;
    ScanConfig bad_step = range;
    bad_step.step = 0.0;

    int rejected = 0;
    try { expand_scan(empty_list, "field"); } catch (const ConfigurationError&) { rejected++; }
    try { expand_scan(bad_step, "temperature"); } catch (const ConfigurationError&) { rejected++; }
    if (rejected != 2) {
        std::cerr << "ERROR: Invalid scans accepted" << std::endl;
        return false;
    }

    return true;
}

/**
 * Test 5: Invalid configurations are rejected
 */
bool test_invalid_configurations() {
    std::cout << "\n=== Test 5: Invalid Configurations ===" << std::endl;

    bool all_rejected = true;
    all_rejected &= rejects_configuration("tests/io_test_data/invalid_temperature/simulation.toml");
    all_rejected &= rejects_configuration("tests/io_test_data/syntax_error/simulation.toml");
    all_rejected &= rejects_configuration("tests/io_test_data/invalid_site_selection/simulation.toml");
    all_rejected &= rejects_configuration("tests/io_test_data/invalid_column/simulation.toml");
    all_rejected &= rejects_configuration("tests/io_test_data/does_not_exist.toml");
    return all_rejected;
}

// In-memory configuration that passes validation
SimulationConfig valid_config() {
    SimulationConfig config;
    config.temperature.type = ScanConfig::SINGLE;
    config.temperature.value = 2.0;
    return config;
}

/**
 * Test 6: Direct validation of an in-memory configuration
 */
bool test_configuration_validation() {
    std::cout << "\n=== Test 6: Configuration Validation ===" << std::endl;

    SimulationConfig config = valid_config();
    try {
        ConfigurationParser::validate_configuration(config);
    } catch (const ConfigurationError& e) {
        std::cerr << "ERROR: Default configuration rejected: " << e.what() << std::endl;
        return false;
    }

    int rejected = 0;

    SimulationConfig unknown_type = valid_config();
    unknown_type.simulation_type = "replica_exchange";
    try { ConfigurationParser::validate_configuration(unknown_type); } catch (const ConfigurationError&) { rejected++; }

    SimulationConfig zero_lattice = valid_config();
    zero_lattice.lattice_size = 0;
    try { ConfigurationParser::validate_configuration(zero_lattice); } catch (const ConfigurationError&) { rejected++; }

    SimulationConfig mismatched_k = valid_config();
    mismatched_k.umbrella.targets = {-0.5, 0.5};
    mismatched_k.umbrella.spring_constants = {1.0, 2.0, 3.0};
    try { ConfigurationParser::validate_configuration(mismatched_k); } catch (const ConfigurationError&) { rejected++; }

    SimulationConfig bad_wham = valid_config();
    bad_wham.wham.tolerance = -1.0;
    try { ConfigurationParser::validate_configuration(bad_wham); } catch (const ConfigurationError&) { rejected++; }

    SimulationConfig missing_restart = valid_config();
    missing_restart.initialization.type = InitializationConfig::FILE;
    try { ConfigurationParser::validate_configuration(missing_restart); } catch (const ConfigurationError&) { rejected++; }

    if (rejected != 5) {
        std::cerr << "ERROR: Expected 5 rejections, got " << rejected << std::endl;
        return false;
    }
    return true;
}

/**
 * Test 7: Lattice dump written and read back as a restart configuration
 */
bool test_lattice_dump_restart() {
    std::cout << "\n=== Test 7: Lattice Dump and Restart ===" << std::endl;

    const std::string filename = "tests/io_test_data/restart_roundtrip.dat";
    const int L = 5;

    MersenneTwisterSource rng(2024);
    IsingLattice lattice(L);
    lattice.initialize_random(rng);

    if (!write_lattice_dump(lattice, filename, 2.269, 0.0, "restart test")) {
        std::cerr << "ERROR: Could not write " << filename << std::endl;
        return false;
    }

    bool passed = true;
    try {
        SimulationConfig config;
        config.lattice_size = L;
        config.initialization.type = InitializationConfig::FILE;
        config.initialization.file = filename;

        InitialConfiguration initial = create_initial_configuration_from_config(config);
        if (initial.type != InitialState::CUSTOM || initial.spins.size() != static_cast<size_t>(L * L)) {
            std::cerr << "ERROR: Restart configuration not loaded" << std::endl;
            passed = false;
        }

        IsingLattice restored(L);
        restored.initialize_custom(initial.spins);
        for (int i = 0; i < L && passed; i++) {
            for (int j = 0; j < L; j++) {
                if (restored.get_spin(i, j) != lattice.get_spin(i, j)) {
                    std::cerr << "ERROR: Spin (" << i << ", " << j << ") differs after restart" << std::endl;
                    passed = false;
                    break;
                }
            }
        }
        if (passed && restored.get_magnetization() != lattice.get_magnetization()) {
            std::cerr << "ERROR: Magnetization differs after restart" << std::endl;
            passed = false;
        }

        // The same dump does not fit a different lattice size
        config.lattice_size = L + 1;
        try {
            create_initial_configuration_from_config(config);
            std::cerr << "ERROR: Dump of L=" << L << " accepted for L=" << L + 1 << std::endl;
            passed = false;
        } catch (const ConfigurationError& e) {
            std::cout << "  Rejected: " << e.what() << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        passed = false;
    }

    std::remove(filename.c_str());
    return passed;
}

/**
 * Test 8: Malformed lattice dumps
 */
bool test_malformed_dumps() {
    std::cout << "\n=== Test 8: Malformed Lattice Dumps ===" << std::endl;

    const std::vector<std::string> files = {
        "tests/io_test_data/malformed_dump.dat",
        "tests/io_test_data/ragged_dump.dat",
        "tests/io_test_data/missing_dump.dat"
    };

    for (const auto& file : files) {
        int lattice_size = 0;
        try {
            load_lattice_from_file(file, lattice_size);
            std::cerr << "ERROR: " << file << " was accepted" << std::endl;
            return false;
        } catch (const ConfigurationError& e) {
            std::cout << "  Rejected: " << e.what() << std::endl;
        }
    }
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "   CONFIGURATION I/O TESTS             " << std::endl;
    std::cout << "========================================" << std::endl;

    test_result(test_single_point_loading(), "Single point configuration loading");
    test_result(test_umbrella_loading(), "Umbrella configuration loading");
    test_result(test_umbrella_defaults(), "Umbrella defaults");
    test_result(test_scan_expansion(), "Temperature/field scan expansion");
    test_result(test_invalid_configurations(), "Invalid configuration files rejected");
    test_result(test_configuration_validation(), "In-memory configuration validation");
    test_result(test_lattice_dump_restart(), "Lattice dump restart");
    test_result(test_malformed_dumps(), "Malformed lattice dumps rejected");

    std::cout << "\n========================================" << std::endl;
    std::cout << "RESULTS: " << tests_passed << "/" << tests_total << " tests passed" << std::endl;

    if (tests_passed == tests_total) {
        std::cout << "✓ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
