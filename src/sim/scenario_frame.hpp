// src/sim/scenario_frame.hpp
#pragma once

#include <vector>

#include "cruise/vehicle_state.hpp"

namespace sim {

// Inputs for one control cycle, as produced by a scenario script
struct ScenarioFrame {
    cruise::VehicleState state;
    bool long_enabled = true;

    std::vector<double> psis;
    std::vector<double> curvatures;
    std::vector<double> curvature_rates;

    void reset() { *this = ScenarioFrame{}; }
};

// Controller outputs of the previous cycle, fed back to the script
struct ReplayOutputs {
    double t_s = 0.0;
    bool cruise_initialized = false;
    double target_kph = 0.0;    // display value while uninitialized
    double cluster_kph = 0.0;
    double curvature = 0.0;
    double curvature_rate = 0.0;
};

} // namespace sim
