#include "../include/simulation_parameters.h"
#include <algorithm>
#include <cctype>
#include <cmath>

void SimulationParameters::validate() const {
    if (lattice_size <= 0) {
        throw IO::ConfigurationError("Lattice size must be positive (got " +
                                     std::to_string(lattice_size) + ")");
    }
    if (!std::isfinite(temperature) || temperature <= 0.0) {
        throw IO::ConfigurationError("Temperature must be positive and finite (got " +
                                     std::to_string(temperature) + ")");
    }
    if (!std::isfinite(coupling_J)) {
        throw IO::ConfigurationError("Coupling constant J must be finite");
    }
    if (!std::isfinite(field_h)) {
        throw IO::ConfigurationError("External field h must be finite");
    }
    if (equilibration_sweeps <= 0 || measurement_sweeps <= 0) {
        throw IO::ConfigurationError("Monte Carlo sweep counts must be positive");
    }
}

SiteSelection site_selection_from_string(const std::string& name) {
    std::string lower_name = name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(), ::tolower);

    if (lower_name == "random") {
        return SiteSelection::RANDOM;
    } else if (lower_name == "raster") {
        return SiteSelection::RASTER;
    } else {
        throw IO::ConfigurationError("Unknown site selection: " + name +
                                     " (must be 'random' or 'raster')");
    }
}

std::string site_selection_to_string(SiteSelection selection) {
    return (selection == SiteSelection::RASTER) ? "raster" : "random";
}
