// src/sim/replay_app.hpp
#pragma once

#include <string>

#include "config/vehicle_params.hpp"
#include "sim/lua_scenario.hpp"

namespace sim {

struct ReplayAppConfig {
    // Control loop timing
    double dt_s = 0.01;
    double duration_s = 30.0;
    double log_hz = 10.0;

    // Scenario via Lua
    std::string lua_script_path;       // e.g. "config/lua/cruise_hold.lua"
    std::string scenario_arg;          // passed to scenario_init()

    // Runtime settings file; empty = built-in defaults
    std::string settings_path;

    // Output files
    std::string csv_log_path = "replay_out.csv";
    std::string debug_log_path = "replay_debug.log";
    bool enable_debug_log_file = false;

    // Vehicle parameters (required)
    config::VehicleParams vehicle_params;
};

/**
 * ReplayApp - Runs both control components against a scripted scenario
 *
 * Fast-forward only; one iteration per control cycle. Output is a CSV of
 * set speed and curvature command over time.
 */
class ReplayApp {
public:
    explicit ReplayApp(ReplayAppConfig cfg);

    int run();

private:
    ReplayAppConfig cfg_;
    LuaScenario lua_;
};

} // namespace sim
