/*
 * MPI Wrapper Implementation
 */

#include "../include/mpi_wrapper.h"
#include <iostream>

// MPIEnvironment Implementation
MPIEnvironment::MPIEnvironment(int argc, char** argv)
    : rank(0), num_ranks(1), is_initialized(false) {

#ifdef UMBRISING_USE_MPI
    MPI_Init(&argc, &argv);
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &num_ranks);
    is_initialized = true;
#else
    (void)argc;
    (void)argv;
#endif
}

MPIEnvironment::~MPIEnvironment() {
#ifdef UMBRISING_USE_MPI
    if (is_initialized) {
        MPI_Finalize();
    }
#endif
}

void MPIEnvironment::barrier() {
#ifdef UMBRISING_USE_MPI
    if (is_initialized) {
        MPI_Barrier(MPI_COMM_WORLD);
    }
#endif
}

double MPIEnvironment::barrier_with_timing() {
#ifdef UMBRISING_USE_MPI
    if (is_initialized) {
        double start_time = MPI_Wtime();
        MPI_Barrier(MPI_COMM_WORLD);
        double end_time = MPI_Wtime();
        return end_time - start_time;
    }
#endif
    return 0.0;
}

void MPIEnvironment::print_info() const {
    if (using_mpi()) {
        std::cout << "MPI: " << num_ranks << " rank" << (num_ranks == 1 ? "" : "s")
                  << "; walkers split sweeps, scans and windows are dealt round-robin" << std::endl;
    } else {
        std::cout << "Serial execution (compiled without MPI)" << std::endl;
    }
}

void MPIEnvironment::warn_idle_ranks(int num_tasks, const std::string& task_name) const {
    if (is_master() && num_tasks < num_ranks) {
        std::cerr << "WARNING: " << num_tasks << " " << task_name << " for " << num_ranks
                  << " ranks, " << num_ranks - num_tasks << " rank(s) stay idle" << std::endl;
    }
}

// MPIAccumulator Implementation
double MPIAccumulator::accumulate_sum(double local_value) {
#ifdef UMBRISING_USE_MPI
    if (mpi_env.using_mpi()) {
        double global_sum = 0.0;
        MPI_Reduce(&local_value, &global_sum, 1, MPI_DOUBLE, MPI_SUM,
                   0, MPI_COMM_WORLD);
        return global_sum;
    }
#endif
    return local_value;
}

std::vector<double> MPIAccumulator::accumulate_sum(const std::vector<double>& local_values) {
#ifdef UMBRISING_USE_MPI
    if (mpi_env.using_mpi()) {
        std::vector<double> global_sum(local_values.size(), 0.0);
        MPI_Reduce(const_cast<double*>(local_values.data()), global_sum.data(),
                   static_cast<int>(local_values.size()), MPI_DOUBLE, MPI_SUM,
                   0, MPI_COMM_WORLD);
        return global_sum;
    }
#endif
    return local_values;
}

std::vector<double> MPIAccumulator::accumulate_sum_all(const std::vector<double>& local_values) {
#ifdef UMBRISING_USE_MPI
    if (mpi_env.using_mpi()) {
        std::vector<double> global_sum(local_values.size(), 0.0);
        MPI_Allreduce(const_cast<double*>(local_values.data()), global_sum.data(),
                      static_cast<int>(local_values.size()), MPI_DOUBLE, MPI_SUM,
                      MPI_COMM_WORLD);
        return global_sum;
    }
#endif
    return local_values;
}

std::vector<double> MPIAccumulator::gather_samples(const std::vector<double>& local_samples) {
#ifdef UMBRISING_USE_MPI
    if (mpi_env.using_mpi()) {
        int local_count = static_cast<int>(local_samples.size());
        int num_ranks = mpi_env.get_num_ranks();

        // Sample counts may differ between ranks
        std::vector<int> counts(num_ranks, 0);
        MPI_Gather(&local_count, 1, MPI_INT, counts.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);

        std::vector<int> displacements(num_ranks, 0);
        std::vector<double> all_samples;
        if (mpi_env.is_master()) {
            int total = 0;
            for (int r = 0; r < num_ranks; r++) {
                displacements[r] = total;
                total += counts[r];
            }
            all_samples.resize(total);
        }

        MPI_Gatherv(const_cast<double*>(local_samples.data()), local_count, MPI_DOUBLE,
                    all_samples.data(), counts.data(), displacements.data(), MPI_DOUBLE,
                    0, MPI_COMM_WORLD);
        return all_samples;
    }
#endif
    return local_samples;
}
