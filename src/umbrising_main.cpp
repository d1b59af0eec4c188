/*
 * Umbrising Main - MPI Monte Carlo Simulation Program
 *
 * Reads configuration from a TOML file and runs 2D Ising Metropolis
 * simulations: single points, field and temperature scans, column
 * correlations, and umbrella sampling followed by WHAM reweighting.
 *
 * Runs serially when built without MPI
 */

#include "../include/exact_solutions.h"
#include "../include/io/configuration_parser.h"
#include "../include/io/diagnostic_utils.h"
#include "../include/io/output_formatting.h"
#include "../include/mc_phases.h"
#include "../include/mpi_wrapper.h"
#include "../include/profiling.h"
#include "../include/simulation_utils.h"
#include "../include/umbrella.h"
#include "../include/wham.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

std::string output_path(const IO::SimulationConfig& config, const std::string& suffix) {
    return config.output.directory + "/" + config.output.base_name + suffix;
}

std::ofstream open_output_file(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open output file: " + filename);
    }
    file << std::fixed << std::setprecision(8);
    return file;
}

/**
 * Combine the snapshots of all walkers of one point on rank 0
 *
 * Moments are summed with sample-count weights, so the result equals the
 * statistics of the concatenated series. Connected correlations are rebuilt
 * from the pooled raw correlation and the pooled mean magnetization.
 */
ObservableSnapshot combine_walkers(const ObservableSnapshot& local,
                                   MPIAccumulator& mpi_accumulator)
{
    const double n = static_cast<double>(local.magnetization_samples.size());
    const double var_m = local.stddev_magnetization * local.stddev_magnetization;
    const double var_e = local.stddev_energy * local.stddev_energy;

    std::vector<double> moments = {
        n,
        n * local.mean_magnetization,
        n * (var_m + local.mean_magnetization * local.mean_magnetization),
        n * local.mean_abs_magnetization,
        n * local.mean_energy,
        n * (var_e + local.mean_energy * local.mean_energy),
        n * local.acceptance_rate
    };
    for (double g : local.raw_correlation) moments.push_back(n * g);

    std::vector<double> totals = mpi_accumulator.accumulate_sum(moments);
    std::vector<double> all_samples = mpi_accumulator.gather_samples(local.magnetization_samples);

    ObservableSnapshot combined = local;
    if (totals.empty() || totals[0] <= 0.0) return combined;

    const double total = totals[0];
    const double N = static_cast<double>(local.lattice_size) * local.lattice_size;
    const double T = local.temperature;

    double m_mean = totals[1] / total;
    double m_var = std::max(0.0, totals[2] / total - m_mean * m_mean);
    double e_mean = totals[4] / total;
    double e_var = std::max(0.0, totals[5] / total - e_mean * e_mean);

    combined.mean_magnetization = m_mean;
    combined.stddev_magnetization = std::sqrt(m_var);
    combined.mean_abs_magnetization = totals[3] / total;
    combined.mean_energy = e_mean;
    combined.stddev_energy = std::sqrt(e_var);
    combined.specific_heat = N * e_var / (T * T);
    combined.susceptibility = N * m_var / T;
    combined.acceptance_rate = totals[6] / total;
    combined.magnetization_samples = all_samples;

    for (size_t r = 0; r < combined.raw_correlation.size(); r++) {
        combined.raw_correlation[r] = totals[7 + r] / total;
        combined.connected_correlation[r] = combined.raw_correlation[r] - m_mean * m_mean;
    }

    return combined;
}

void report_autocorrelation(const RunResult& result, int sampling_frequency) {
    double tau_m = estimate_autocorrelation_time(result.magnetization_autocorrelation);
    double tau_e = estimate_autocorrelation_time(result.energy_autocorrelation);
    std::cout << "  Autocorrelation ρ(1): Energy=" << std::fixed << std::setprecision(4)
              << result.energy_autocorrelation
              << ", Magnetization=" << result.magnetization_autocorrelation << std::endl;
    std::cout << "  Estimated τ from ρ(1): Energy≈" << std::fixed << std::setprecision(2) << tau_e
              << ", Magnetization≈" << tau_m << " samples" << std::endl;

    // Integrated estimate, converted to sweeps
    std::cout << "  Integrated τ: Energy≈" << result.energy_tau * sampling_frequency
              << " sweeps, Magnetization≈" << result.magnetization_tau * sampling_frequency << " sweeps";
    size_t num_samples = result.snapshot.magnetization_samples.size();
    if (num_samples > 0) {
        std::cout << " (" << std::setprecision(0) << num_samples / result.magnetization_tau
                  << " independent m samples)";
    }
    std::cout << std::endl;
}

/**
 * Measure load imbalance at the end of a mode and print it on rank 0
 */
void report_barrier_statistics(MPIEnvironment& mpi_env, MPIAccumulator& mpi_accumulator) {
    double wait = mpi_env.barrier_with_timing();
    std::vector<double> all_waits = mpi_accumulator.gather_samples({wait});
    if (mpi_env.is_master()) {
        print_barrier_statistics(all_waits);
    }
}

void finish_profiling(const IO::SimulationConfig& config,
                      const std::vector<PointTimings>& timings,
                      const std::string& point_name,
                      MPIEnvironment& mpi_env,
                      MPIAccumulator& mpi_accumulator)
{
    if (!config.diagnostics.enable_profiling) return;
    if (mpi_env.is_master() && !timings.empty()) {
        print_profiling_report(timings, point_name);
    }
    report_barrier_statistics(mpi_env, mpi_accumulator);
}

/**
 * Prepare the dump directory if any diagnostics file is requested
 */
std::string setup_dump_directory(const IO::SimulationConfig& config, MPIEnvironment& mpi_env) {
    std::string dump_dir = config.output.directory + "/dumps";
    const auto& diag = config.diagnostics;
    if (mpi_env.is_master() &&
        (diag.enable_config_dump || diag.enable_observable_evolution || diag.dump_final_configuration)) {
        IO::create_directory(dump_dir);
        std::cout << "  Dump directory: " << dump_dir << std::endl;
    }
    mpi_env.barrier();
    return dump_dir;
}

} // namespace

/**
 * Run single point mode: every rank is an independent walker
 */
void run_single_point(const IO::SimulationConfig& config,
                      MPIEnvironment& mpi_env,
                      MPIAccumulator& mpi_accumulator)
{
    int rank = mpi_env.get_rank();
    int num_ranks = mpi_env.get_num_ranks();

    double T = expand_scan(config.temperature, "temperature").front();
    double h = expand_scan(config.field, "field").front();

    int measurement_steps_per_rank = config.monte_carlo.measurement_steps / num_ranks;
    if (measurement_steps_per_rank == 0) {
        throw IO::ConfigurationError("measurement_steps (" + std::to_string(config.monte_carlo.measurement_steps) +
                                     ") is less than the number of ranks (" + std::to_string(num_ranks) + ")");
    }

    if (mpi_env.is_master()) {
        IO::print_section_separator("SINGLE POINT SIMULATION");
        std::cout << "Temperature: T = " << T << ", field: h = " << h << std::endl;
        std::cout << "MPI walkers: " << num_ranks << std::endl;
        std::cout << "Measurement sweeps per walker: " << measurement_steps_per_rank << std::endl;
    }

    std::string dump_dir = setup_dump_directory(config, mpi_env);

    SimulationParameters params = create_parameters_from_config(config, T, h,
                                                                derive_seed(config.monte_carlo.seed, rank));
    params.measurement_sweeps = measurement_steps_per_rank;
    MeasurementOptions options = create_measurement_options_from_config(config, rank, dump_dir);
    InitialConfiguration initial = create_initial_configuration_from_config(config);

    if (mpi_env.is_master()) {
        IO::print_subsection_separator("Starting simulation");
    }

    RunResult result = run_simulation_point(params, options, initial);

    auto comm_start = std::chrono::high_resolution_clock::now();
    ObservableSnapshot combined = combine_walkers(result.snapshot, mpi_accumulator);
    auto comm_end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> comm_elapsed = comm_end - comm_start;
    result.timings.communication_time = comm_elapsed.count();

    if (config.diagnostics.dump_final_configuration && config.diagnostics.should_dump_rank(rank)) {
        IsingLattice final_lattice(config.lattice_size);
        final_lattice.initialize_custom(result.final_configuration);
        std::string filename = dump_dir + "/final_rank" + std::to_string(rank) + ".dat";
        if (IO::write_lattice_dump(final_lattice, filename, T, h, "final configuration, rank " + std::to_string(rank))) {
            std::cout << "  Final configuration written to " << filename << std::endl;
        }
    }

    if (mpi_env.is_master()) {
        IO::print_observables_formatted(combined);
        if (config.diagnostics.estimate_autocorrelation) {
            report_autocorrelation(result, config.monte_carlo.sampling_frequency);
        }
        if (config.diagnostics.enable_profiling) {
            print_point_timing(result.timings);
        }
    }

    finish_profiling(config, {result.timings}, "walker", mpi_env, mpi_accumulator);
}

/**
 * Run field scan mode: <m>(h) on the temperature x field grid
 */
void run_field_scan(const IO::SimulationConfig& config,
                    MPIEnvironment& mpi_env,
                    MPIAccumulator& mpi_accumulator)
{
    int rank = mpi_env.get_rank();
    std::vector<double> temperatures = expand_scan(config.temperature, "temperature");
    std::vector<double> fields = expand_scan(config.field, "field");
    const int num_points = static_cast<int>(temperatures.size() * fields.size());

    if (mpi_env.is_master()) {
        IO::print_section_separator("FIELD SCAN");
        std::cout << "Grid: " << temperatures.size() << " temperatures x " << fields.size()
                  << " fields, " << mpi_env.get_num_ranks() << " ranks" << std::endl;
    }

    std::string dump_dir = setup_dump_directory(config, mpi_env);
    MeasurementOptions options = create_measurement_options_from_config(config, rank, dump_dir);
    options.measure_correlations = false;
    options.verbose = false;
    InitialConfiguration initial = create_initial_configuration_from_config(config);

    // Two values per point: <m>, std(m)
    std::vector<double> local(2 * num_points, 0.0);
    std::vector<PointTimings> timings;

    mpi_env.warn_idle_ranks(num_points, "grid points");
    for (int point = 0; point < num_points; point++) {
        if (!mpi_env.owns_task(point)) continue;
        double T = temperatures[point / fields.size()];
        double h = fields[point % fields.size()];

        SimulationParameters params = create_parameters_from_config(config, T, h,
                                                                    derive_seed(config.monte_carlo.seed, point));
        RunResult result = run_simulation_point(params, options, initial);
        local[2 * point] = result.snapshot.mean_magnetization;
        local[2 * point + 1] = result.snapshot.stddev_magnetization;
        timings.push_back(result.timings);

        if (rank == 0 && config.output.verbose) {
            std::cout << "  T = " << std::fixed << std::setprecision(4) << T
                      << ", h = " << h << ": m = " << std::setprecision(6)
                      << result.snapshot.mean_magnetization << std::endl;
        }
    }

    std::vector<double> totals = mpi_accumulator.accumulate_sum(local);

    if (mpi_env.is_master()) {
        std::string filename = output_path(config, "_m_vs_h.out");
        std::ofstream outfile = open_output_file(filename);
        outfile << "# 2D Ising field scan, L = " << config.lattice_size
                << ", J = " << config.coupling_J << std::endl;
        outfile << "# Columns: T h m std_m" << std::endl;
        for (int point = 0; point < num_points; point++) {
            outfile << std::setw(12) << temperatures[point / fields.size()] << " "
                    << std::setw(12) << fields[point % fields.size()] << " "
                    << std::setw(14) << totals[2 * point] << " "
                    << std::setw(14) << totals[2 * point + 1] << std::endl;
        }
        std::cout << "\nResults saved to: " << filename << std::endl;
    }

    finish_profiling(config, timings, "grid point", mpi_env, mpi_accumulator);
}

/**
 * Run temperature scan mode: <|m|>(T) and connected correlations, averaged
 * over independent runs
 */
void run_temperature_scan(const IO::SimulationConfig& config,
                          MPIEnvironment& mpi_env,
                          MPIAccumulator& mpi_accumulator)
{
    int rank = mpi_env.get_rank();
    std::vector<double> temperatures = expand_scan(config.temperature, "temperature");
    double h = expand_scan(config.field, "field").front();
    const int num_runs = config.monte_carlo.independent_runs;
    const int num_temperatures = static_cast<int>(temperatures.size());
    const double Tc = onsager_critical_temperature(config.coupling_J);

    int max_sep = resolve_max_separation(config.correlation.max_separation, config.lattice_size);
    std::vector<int> separations;
    for (int r : config.correlation.separations) {
        if (r <= max_sep) {
            separations.push_back(r);
        } else if (mpi_env.is_master()) {
            std::cerr << "WARNING: separation " << r << " exceeds max_separation " << max_sep
                      << " and is not reported" << std::endl;
        }
    }

    if (mpi_env.is_master()) {
        IO::print_section_separator("TEMPERATURE SCAN");
        std::cout << "Temperatures: " << num_temperatures << ", independent runs per temperature: "
                  << num_runs << ", ranks: " << mpi_env.get_num_ranks() << std::endl;
        std::cout << "Onsager Tc = " << std::setprecision(6) << Tc << std::endl;
    }

    std::string dump_dir = setup_dump_directory(config, mpi_env);
    MeasurementOptions options = create_measurement_options_from_config(config, rank, dump_dir);
    options.max_separation = max_sep;
    options.verbose = false;
    InitialConfiguration initial = create_initial_configuration_from_config(config);

    // Per temperature: sum |m|, then sum C(r) for each reported separation
    const int stride = 1 + static_cast<int>(separations.size());
    std::vector<double> local(stride * num_temperatures, 0.0);
    std::vector<PointTimings> timings;

    const int num_tasks = num_temperatures * num_runs;
    mpi_env.warn_idle_ranks(num_tasks, "runs");
    for (int task = 0; task < num_tasks; task++) {
        if (!mpi_env.owns_task(task)) continue;
        int t = task / num_runs;
        int run = task % num_runs;

        SimulationParameters params = create_parameters_from_config(config, temperatures[t], h,
                                                                    derive_seed(config.monte_carlo.seed, run));
        RunResult result = run_simulation_point(params, options, initial);

        local[stride * t] += result.snapshot.mean_abs_magnetization;
        for (size_t k = 0; k < separations.size(); k++) {
            local[stride * t + 1 + k] += result.snapshot.connected_correlation[separations[k]];
        }
        timings.push_back(result.timings);

        if (rank == 0 && config.output.verbose) {
            std::cout << "  T = " << std::fixed << std::setprecision(4) << temperatures[t]
                      << ", run " << run << ": |m| = " << std::setprecision(6)
                      << result.snapshot.mean_abs_magnetization << std::endl;
        }
    }

    std::vector<double> totals = mpi_accumulator.accumulate_sum(local);

    if (mpi_env.is_master()) {
        std::string m_filename = output_path(config, "_abs_m_vs_T.out");
        std::string corr_filename = output_path(config, "_corr_vs_T.out");
        std::ofstream m_file = open_output_file(m_filename);
        std::ofstream corr_file = open_output_file(corr_filename);

        m_file << "# 2D Ising temperature scan, L = " << config.lattice_size << ", h = " << h
               << ", " << num_runs << " runs per temperature" << std::endl;
        m_file << "# Columns: T T/Tc |m| m_exact" << std::endl;
        corr_file << "# Connected correlation C(r) = <s(i,j) s(i+r,j)> - <m>^2" << std::endl;
        corr_file << "# Columns: T T/Tc";
        for (int r : separations) corr_file << " C(" << r << ")";
        corr_file << std::endl;

        IO::print_subsection_separator("Results");
        std::cout << "         T      T/Tc          |m|      m_exact" << std::endl;

        for (int t = 0; t < num_temperatures; t++) {
            double T = temperatures[t];
            double abs_m = totals[stride * t] / num_runs;
            double m_exact = exact_spontaneous_magnetization(T, config.coupling_J);

            m_file << std::setw(12) << T << " " << std::setw(12) << T / Tc << " "
                   << std::setw(14) << abs_m << " " << std::setw(14) << m_exact << std::endl;
            corr_file << std::setw(12) << T << " " << std::setw(12) << T / Tc;
            for (size_t k = 0; k < separations.size(); k++) {
                corr_file << " " << std::setw(14) << totals[stride * t + 1 + k] / num_runs;
            }
            corr_file << std::endl;

            std::cout << std::fixed << std::setprecision(4)
                      << "  " << std::setw(8) << T << "  " << std::setw(8) << T / Tc
                      << std::setprecision(6)
                      << "  " << std::setw(11) << abs_m << "  " << std::setw(11) << m_exact << std::endl;
        }

        std::cout << "\nResults saved to:" << std::endl;
        std::cout << "  |m| vs T:         " << m_filename << std::endl;
        std::cout << "  Correlations:     " << corr_filename << std::endl;
    }

    finish_profiling(config, timings, "run", mpi_env, mpi_accumulator);
}

/**
 * Run column correlation mode: C(r) restricted to each configured column
 */
void run_column_correlation(const IO::SimulationConfig& config,
                            MPIEnvironment& mpi_env,
                            MPIAccumulator& mpi_accumulator)
{
    int rank = mpi_env.get_rank();
    double T = expand_scan(config.temperature, "temperature").front();
    double h = expand_scan(config.field, "field").front();
    const std::vector<int>& columns = config.correlation.columns;
    const int num_columns = static_cast<int>(columns.size());
    int max_sep = resolve_max_separation(config.correlation.max_separation, config.lattice_size);

    if (mpi_env.is_master()) {
        IO::print_section_separator("COLUMN CORRELATION");
        std::cout << "T = " << T << ", h = " << h << ", columns:";
        for (int c : columns) std::cout << " " << c;
        std::cout << ", max separation " << max_sep << std::endl;
    }

    std::string dump_dir = setup_dump_directory(config, mpi_env);
    MeasurementOptions options = create_measurement_options_from_config(config, rank, dump_dir);
    options.max_separation = max_sep;
    InitialConfiguration initial = create_initial_configuration_from_config(config);

    // Per column: <m>, then C_col(0..max_sep)
    const int stride = 2 + max_sep;
    std::vector<double> local(stride * num_columns, 0.0);
    std::vector<PointTimings> timings;

    mpi_env.warn_idle_ranks(num_columns, "columns");
    for (int c = 0; c < num_columns; c++) {
        if (!mpi_env.owns_task(c)) continue;

        // Same seed for every column: all columns are measured on the same chain
        SimulationParameters params = create_parameters_from_config(config, T, h, config.monte_carlo.seed);
        MeasurementOptions column_options = options;
        column_options.column = columns[c];
        RunResult result = run_simulation_point(params, column_options, initial);

        local[stride * c] = result.snapshot.mean_magnetization;
        for (int r = 0; r <= max_sep; r++) {
            local[stride * c + 1 + r] = result.snapshot.connected_column_correlation[r];
        }
        timings.push_back(result.timings);
    }

    std::vector<double> totals = mpi_accumulator.accumulate_sum(local);

    if (mpi_env.is_master()) {
        std::string filename = output_path(config, "_column_corr.out");
        std::ofstream outfile = open_output_file(filename);
        outfile << "# Column correlation C_col(r) = <s(i,c) s(i+r,c)> - <m>^2, L = " << config.lattice_size
                << ", T = " << T << ", h = " << h << std::endl;
        for (int c = 0; c < num_columns; c++) {
            outfile << "# column " << columns[c] << ": <m> = " << totals[stride * c] << std::endl;
        }
        outfile << "# Columns: r";
        for (int c : columns) outfile << " C_col" << c << "(r)";
        outfile << std::endl;

        for (int r = 0; r <= max_sep; r++) {
            outfile << std::setw(6) << r;
            for (int c = 0; c < num_columns; c++) {
                outfile << " " << std::setw(14) << totals[stride * c + 1 + r];
            }
            outfile << std::endl;
        }
        std::cout << "\nResults saved to: " << filename << std::endl;
    }

    finish_profiling(config, timings, "column", mpi_env, mpi_accumulator);
}

/**
 * Run umbrella mode: umbrella windows and WHAM at every temperature
 */
void run_umbrella(const IO::SimulationConfig& config,
                  MPIEnvironment& mpi_env,
                  MPIAccumulator& mpi_accumulator)
{
    std::vector<double> temperatures = expand_scan(config.temperature, "temperature");
    double h = expand_scan(config.field, "field").front();
    UmbrellaSettings settings = create_umbrella_settings_from_config(config);
    settings.verbose = settings.verbose && mpi_env.is_master();
    WhamOptions wham_options = create_wham_options_from_config(config);
    bool compare_exact = config.umbrella.compare_exact && config.lattice_size <= MAX_ENUMERATION_SIZE;

    if (mpi_env.is_master()) {
        IO::print_section_separator("UMBRELLA SAMPLING + WHAM");
        std::cout << "Windows: " << settings.targets.size()
                  << ", bins: " << settings.bins.size()
                  << " on [" << settings.bins.get_lower() << ", " << settings.bins.get_upper() << ")"
                  << ", ranks: " << mpi_env.get_num_ranks()
                  << " (" << mpi_env.num_owned_tasks(static_cast<int>(settings.targets.size()))
                  << " windows on rank 0)" << std::endl;
        if (compare_exact) {
            std::cout << "Exact P(m) by enumeration of the " << config.lattice_size << "x"
                      << config.lattice_size << " lattice is written next to the WHAM result" << std::endl;
        }
    }

    mpi_env.warn_idle_ranks(static_cast<int>(settings.targets.size()), "windows");

    std::ofstream summary_file;
    std::string summary_filename = output_path(config, "_umbrella.out");
    if (mpi_env.is_master()) {
        summary_file = open_output_file(summary_filename);
        summary_file << "# Umbrella sampling + WHAM, L = " << config.lattice_size << ", h = " << h << std::endl;
        summary_file << "# Columns: T |m*| m_exact converged iterations gaps" << std::endl;
    }

    std::vector<PointTimings> timings;

    for (double T : temperatures) {
        auto point_start = std::chrono::high_resolution_clock::now();

        SimulationParameters params = create_parameters_from_config(config, T, h, config.monte_carlo.seed);
        std::vector<UmbrellaWindow> windows = run_umbrella_sampling(params, settings, mpi_env, mpi_accumulator);

        auto sampling_end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> sampling_elapsed = sampling_end - point_start;
        PointTimings point_timings;
        point_timings.measurement_time = sampling_elapsed.count();
        point_timings.total_time = sampling_elapsed.count();

        if (!mpi_env.is_master()) {
            timings.push_back(point_timings);
            continue;
        }

        WhamSolver solver(settings.bins, windows, T);
        WhamResult result = solver.solve(wham_options);

        std::chrono::duration<double> wham_elapsed = std::chrono::high_resolution_clock::now() - sampling_end;
        point_timings.reweighting_time = wham_elapsed.count();
        point_timings.total_time += wham_elapsed.count();
        timings.push_back(point_timings);
        if (config.diagnostics.enable_profiling) {
            print_point_timing(point_timings);
        }
        if (!result.converged) {
            std::cerr << "WARNING: WHAM did not converge at T = " << T << " after "
                      << result.iterations << " iterations (max |df| = "
                      << result.max_offset_change << ")" << std::endl;
        }

        double m_star = most_probable_magnetization(result);
        double m_exact = exact_spontaneous_magnetization(T, config.coupling_J);
        int num_gaps = static_cast<int>(std::count_if(windows.begin(), windows.end(),
                                                      [](const UmbrellaWindow& w) { return w.coverage_gap; }));

        IO::print_wham_summary(T, windows, result, m_star, m_exact);

        Eigen::ArrayXd exact_p;
        if (compare_exact) {
            exact_p = project_distribution(
                enumerate_magnetization_distribution(config.lattice_size, T, config.coupling_J, h),
                config.lattice_size, settings.bins);
        }

        std::string wham_filename = output_path(config, "_wham_T" + IO::format_number(T) + ".out");
        std::ofstream wham_file = open_output_file(wham_filename);
        wham_file << "# WHAM at T = " << T << ": " << (result.converged ? "converged" : "not converged")
                  << " after " << result.iterations << " iterations" << std::endl;
        wham_file << "# Columns: m P(m) F(m)" << (compare_exact ? " P_exact(m)" : "") << std::endl;
        for (int b = 0; b < settings.bins.size(); b++) {
            wham_file << std::setw(12) << result.magnetization[b] << " "
                      << std::setw(14) << result.probability[b] << " ";
            if (result.included[b]) {
                wham_file << std::setw(14) << result.free_energy[b];
            } else {
                wham_file << std::setw(14) << "inf";
            }
            if (compare_exact) {
                wham_file << " " << std::setw(14) << exact_p[b];
            }
            wham_file << std::endl;
        }

        summary_file << std::setw(12) << T << " " << std::setw(12) << std::abs(m_star) << " "
                     << std::setw(12) << m_exact << " " << (result.converged ? 1 : 0) << " "
                     << result.iterations << " " << num_gaps << std::endl;

        std::cout << "  WHAM profile saved to: " << wham_filename << std::endl;
    }

    if (mpi_env.is_master()) {
        std::cout << "\nSummary saved to: " << summary_filename << std::endl;
    }

    finish_profiling(config, timings, "temperature", mpi_env, mpi_accumulator);
}

int main(int argc, char* argv[]) {
    // Initialize MPI environment
    MPIEnvironment mpi_env(argc, argv);
    MPIAccumulator mpi_accumulator(mpi_env);

    // Redirect stdout to /dev/null for non-master ranks
    std::streambuf* cout_backup = nullptr;
    std::ofstream devnull;
    if (!mpi_env.is_master()) {
        devnull.open("/dev/null");
        cout_backup = std::cout.rdbuf();
        std::cout.rdbuf(devnull.rdbuf());
    }

    if (mpi_env.is_master()) {
        IO::print_logo();
        IO::print_section_separator("Monte Carlo Simulation (" + std::to_string(mpi_env.get_num_ranks()) + " ranks)");
        mpi_env.print_info();
    }

    // Parse command line arguments
    std::string config_file = "simulation.toml";
    if (argc > 1) {
        config_file = argv[1];
    }

    int status = 0;
    try {
        if (mpi_env.is_master()) {
            std::cout << "Loading configuration from: " << config_file << std::endl;
        }

        // All ranks load configuration
        IO::SimulationConfig config = IO::ConfigurationParser::load_configuration(config_file);

        if (mpi_env.is_master()) {
            IO::create_directory(config.output.directory);
        }
        mpi_env.barrier();

        if (config.simulation_type == "single_point") {
            run_single_point(config, mpi_env, mpi_accumulator);
        } else if (config.simulation_type == "field_scan") {
            run_field_scan(config, mpi_env, mpi_accumulator);
        } else if (config.simulation_type == "temperature_scan") {
            run_temperature_scan(config, mpi_env, mpi_accumulator);
        } else if (config.simulation_type == "column_correlation") {
            run_column_correlation(config, mpi_env, mpi_accumulator);
        } else if (config.simulation_type == "umbrella") {
            run_umbrella(config, mpi_env, mpi_accumulator);
        } else {
            throw IO::ConfigurationError("Unknown simulation type: " + config.simulation_type);
        }

    } catch (const IO::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        status = 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        status = 1;
    }

    // Restore stdout for non-master ranks
    if (!mpi_env.is_master() && cout_backup) {
        std::cout.rdbuf(cout_backup);
        devnull.close();
    }

    if (status == 0 && mpi_env.is_master()) {
        std::cout << "\nSimulation completed successfully!" << std::endl;
    }
    return status;
}
