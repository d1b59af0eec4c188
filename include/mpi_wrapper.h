/*
 * MPI Wrapper for Monte Carlo Parallelization
 *
 * Provides a clean interface for MPI operations with fallback to serial execution
 * when MPI is not available. Two parallel schemes are supported:
 *   - walkers: every rank runs an independent chain of the same point and
 *     the samples are gathered on rank 0
 *   - tasks: independent points (grid points, umbrella windows) are dealt
 *     round-robin to ranks and the results are summed into zero-filled buffers
 */

#ifndef MPI_WRAPPER_H
#define MPI_WRAPPER_H

#include <vector>
#include <string>

#ifdef UMBRISING_USE_MPI
#include <mpi.h>
#endif

/**
 * MPI Environment Manager
 *
 * Handles MPI initialization, finalization, and provides rank/size information.
 * Falls back gracefully to serial execution when compiled without MPI.
 */
class MPIEnvironment {
private:
    int rank;
    int num_ranks;
    bool is_initialized;

public:
    MPIEnvironment(int argc, char** argv);
    ~MPIEnvironment();

    MPIEnvironment(const MPIEnvironment&) = delete;
    MPIEnvironment& operator=(const MPIEnvironment&) = delete;

    // Accessors
    int get_rank() const { return rank; }
    int get_num_ranks() const { return num_ranks; }
    bool is_master() const { return rank == 0; }
    bool using_mpi() const {
#ifdef UMBRISING_USE_MPI
        return is_initialized;
#else
        return false;
#endif
    }

    // Round-robin task ownership
    bool owns_task(int task_index) const { return task_index % num_ranks == rank; }

    // Tasks out of num_tasks dealt to this rank
    int num_owned_tasks(int num_tasks) const {
        return num_tasks / num_ranks + (rank < num_tasks % num_ranks ? 1 : 0);
    }

    /**
     * Warn on rank 0 when fewer tasks than ranks leave ranks idle
     *
     * @param num_tasks Tasks dealt with owns_task
     * @param task_name Plural name of the tasks ("windows", "grid points")
     */
    void warn_idle_ranks(int num_tasks, const std::string& task_name) const;

    // Barrier synchronization
    void barrier();

    /**
     * Barrier with timing - returns time spent waiting at barrier (seconds)
     */
    double barrier_with_timing();

    // Print info about MPI setup
    void print_info() const;
};

/**
 * MPI Statistics Accumulator
 *
 * Handles accumulation of Monte Carlo statistics across MPI ranks.
 * Each rank computes local statistics, then they are reduced to rank 0
 * (accumulate_sum) or to every rank (accumulate_sum_all).
 */
class MPIAccumulator {
private:
    const MPIEnvironment& mpi_env;

public:
    explicit MPIAccumulator(const MPIEnvironment& env) : mpi_env(env) {}

    /**
     * Accumulate scalar statistics across all ranks
     * Returns the sum on rank 0, undefined on other ranks
     */
    double accumulate_sum(double local_value);

    /**
     * Accumulate vector statistics across all ranks
     * Returns the sum on rank 0, undefined on other ranks
     */
    std::vector<double> accumulate_sum(const std::vector<double>& local_values);

    /**
     * Element-wise sum delivered to every rank
     */
    std::vector<double> accumulate_sum_all(const std::vector<double>& local_values);

    /**
     * Gather all measurement samples from all ranks to rank 0
     * Each rank sends its local samples, rank 0 receives the concatenation
     * in rank order. Returns an empty vector on other ranks.
     */
    std::vector<double> gather_samples(const std::vector<double>& local_samples);
};

/**
 * Derive an independent seed for a rank or a task
 */
inline long int derive_seed(long int base_seed, int stream) {
    // Preserve the sign of the base seed
    if (base_seed < 0) {
        return base_seed - static_cast<long int>(stream) * 12345;
    } else {
        return base_seed + static_cast<long int>(stream) * 12345;
    }
}

#endif // MPI_WRAPPER_H
