/*
 * Diagnostic Utilities Implementation
 */

#include "../../include/io/diagnostic_utils.h"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>

namespace IO {

void create_directory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        // Directory doesn't exist, create it
        if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
            throw std::runtime_error("Could not create directory " + path + ": " + std::strerror(errno));
        }
    } else if (!S_ISDIR(st.st_mode)) {
        throw std::runtime_error(path + " exists and is not a directory");
    }
}

bool write_lattice_dump(const IsingLattice& lattice,
                        const std::string& filename,
                        double temperature,
                        double field,
                        const std::string& label) {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        std::cerr << "WARNING: Could not open dump file: " << filename << std::endl;
        return false;
    }

    const int L = lattice.size();

    // Write header
    outfile << "# Lattice dump: " << label << std::endl;
    outfile << "# Temperature: " << std::fixed << std::setprecision(4) << temperature << std::endl;
    outfile << "# Field: " << std::fixed << std::setprecision(4) << field << std::endl;
    outfile << "# Lattice size: " << L << std::endl;
    outfile << "# Magnetization: " << std::setprecision(6) << lattice.get_magnetization() << std::endl;
    outfile << "# Format: L rows of L spins (+1/-1), row i = first index" << std::endl;
    outfile << "#" << std::endl;

    // Write configuration
    for (int i = 0; i < L; i++) {
        for (int j = 0; j < L; j++) {
            if (j > 0) outfile << " ";
            outfile << std::setw(2) << lattice.get_spin(i, j);
        }
        outfile << std::endl;
    }

    return outfile.good();
}

void dump_lattice_to_file(const IsingLattice& lattice,
                          double temperature,
                          double field,
                          int measurement_step,
                          int rank,
                          const std::string& dump_dir) {
    std::ostringstream filename;
    filename << dump_dir << "/lattice_rank" << rank
             << "_T" << std::fixed << std::setprecision(2) << temperature
             << "_h" << field
             << "_meas" << measurement_step << ".dat";

    std::ostringstream label;
    label << "rank " << rank << ", measurement sweep " << measurement_step;
    write_lattice_dump(lattice, filename.str(), temperature, field, label.str());
}

std::vector<int> load_lattice_from_file(const std::string& filename, int& lattice_size) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw ConfigurationError("Cannot open lattice dump: " + filename);
    }

    std::vector<int> spins;
    int row_length = -1;
    int num_rows = 0;
    std::string line;
    int line_number = 0;

    while (std::getline(infile, line)) {
        line_number++;
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        std::istringstream row(line);
        int value;
        int count = 0;
        while (row >> value) {
            if (value != 1 && value != -1) {
                throw ConfigurationError(filename + ":" + std::to_string(line_number) +
                                         ": spin value " + std::to_string(value) + " is not +1/-1");
            }
            spins.push_back(value);
            count++;
        }
        if (!row.eof()) {
            throw ConfigurationError(filename + ":" + std::to_string(line_number) + ": unreadable entry");
        }

        if (row_length < 0) row_length = count;
        if (count != row_length) {
            throw ConfigurationError(filename + ":" + std::to_string(line_number) +
                                     ": row has " + std::to_string(count) + " spins, expected " +
                                     std::to_string(row_length));
        }
        num_rows++;
    }

    if (num_rows == 0 || num_rows != row_length) {
        throw ConfigurationError("Lattice dump " + filename + " is not a square L x L configuration");
    }

    lattice_size = row_length;
    return spins;
}

std::ofstream setup_observable_evolution_file(const std::string& dump_dir,
                                              int rank,
                                              double temperature,
                                              double field) {
    std::ostringstream obs_filename;
    obs_filename << dump_dir << "/observables_rank" << rank
                 << "_T" << std::fixed << std::setprecision(2) << temperature
                 << "_h" << field << ".dat";

    std::ofstream file(obs_filename.str());

    if (file.is_open()) {
        file << "# Observable evolution for T=" << temperature << ", h=" << field
             << ", Rank=" << rank << std::endl;
        file << "# measurement_step energy magnetization abs_magnetization acceptance_rate" << std::endl;
        file << std::fixed << std::setprecision(8);
    } else {
        std::cerr << "WARNING: Could not open observable evolution file: " << obs_filename.str() << std::endl;
    }

    return file;
}

void write_observable_evolution(std::ofstream& file,
                                int measurement_step,
                                double energy,
                                double magnetization,
                                double abs_magnetization,
                                double acceptance_rate) {
    if (!file.is_open()) return;

    file << measurement_step << " " << energy << " " << magnetization
         << " " << abs_magnetization << " " << acceptance_rate << std::endl;
}

} // namespace IO
