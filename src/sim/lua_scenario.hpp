// src/sim/lua_scenario.hpp
#pragma once

#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "sim/scenario_frame.hpp"

namespace sim {

/**
 * LuaScenario - Scripted per-cycle inputs
 *
 * Script contract:
 *   scenario_init(arg)        optional, returns bool
 *   scenario_frame(t, out)    required, returns a frame table:
 *     { cruise_available, cruise_enabled, cruise_standstill, gas_pressed,
 *       v_ego, cruise_speed, cruise_speed_cluster, long_enabled,
 *       buttons = { {type="accel", pressed=true}, ... },
 *       psis = {...}, curvatures = {...}, curvature_rates = {...} }
 * where `out` holds the previous cycle's outputs.
 */
class LuaScenario {
public:
    LuaScenario() = default;
    ~LuaScenario();

    LuaScenario(const LuaScenario&) = delete;
    LuaScenario& operator=(const LuaScenario&) = delete;

    bool init(const std::string& lua_script_path, const std::string& scenario_arg);

    bool get_frame(double t_s, const ReplayOutputs& prev, ScenarioFrame& out_frame);

    static cruise::ButtonType button_type_from_string(const std::string& name);

private:
    lua_State* L_{nullptr};

    void push_outputs_table_(const ReplayOutputs& out);
    bool read_frame_table_(int idx, ScenarioFrame& out_frame);
    void read_number_array_(int idx, const char* key, std::vector<double>& out);
    void read_buttons_(int idx, std::vector<cruise::ButtonEvent>& out);
};

} // namespace sim
