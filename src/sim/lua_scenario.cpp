// src/sim/lua_scenario.cpp
#include "sim/lua_scenario.hpp"
#include "utils/logging.hpp"

namespace sim {

LuaScenario::~LuaScenario() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaScenario::init(const std::string& lua_script_path,
                       const std::string& scenario_arg) {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    lua_getglobal(L_, "scenario_init");
    if (lua_isfunction(L_, -1)) {
        lua_pushstring(L_, scenario_arg.c_str());
        if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
            LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
            lua_pop(L_, 1);
            return false;
        }
        const bool ok = lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        if (!ok) {
            LOG_WARN("[Lua] scenario_init returned false");
        }
    } else {
        lua_pop(L_, 1);
    }

    return true;
}

void LuaScenario::push_outputs_table_(const ReplayOutputs& out) {
    lua_newtable(L_);

    auto set_num = [&](const char* k, double v) {
        lua_pushnumber(L_, v);
        lua_setfield(L_, -2, k);
    };

    set_num("t_s", out.t_s);
    set_num("target_kph", out.target_kph);
    set_num("cluster_kph", out.cluster_kph);
    set_num("curvature", out.curvature);
    set_num("curvature_rate", out.curvature_rate);

    lua_pushboolean(L_, out.cruise_initialized ? 1 : 0);
    lua_setfield(L_, -2, "cruise_initialized");
}

void LuaScenario::read_number_array_(int idx, const char* key, std::vector<double>& out) {
    out.clear();
    lua_getfield(L_, idx, key);
    if (lua_istable(L_, -1)) {
        const auto n = static_cast<lua_Integer>(lua_rawlen(L_, -1));
        out.reserve(static_cast<size_t>(n));
        for (lua_Integer i = 1; i <= n; ++i) {
            lua_rawgeti(L_, -1, i);
            out.push_back(lua_isnumber(L_, -1) ? lua_tonumber(L_, -1) : 0.0);
            lua_pop(L_, 1);
        }
    }
    lua_pop(L_, 1);
}

void LuaScenario::read_buttons_(int idx, std::vector<cruise::ButtonEvent>& out) {
    out.clear();
    lua_getfield(L_, idx, "buttons");
    if (lua_istable(L_, -1)) {
        const auto n = static_cast<lua_Integer>(lua_rawlen(L_, -1));
        for (lua_Integer i = 1; i <= n; ++i) {
            lua_rawgeti(L_, -1, i);
            if (lua_istable(L_, -1)) {
                cruise::ButtonEvent ev;

                lua_getfield(L_, -1, "type");
                if (lua_isstring(L_, -1)) ev.type = button_type_from_string(lua_tostring(L_, -1));
                lua_pop(L_, 1);

                lua_getfield(L_, -1, "pressed");
                ev.pressed = lua_toboolean(L_, -1);
                lua_pop(L_, 1);

                out.push_back(ev);
            }
            lua_pop(L_, 1);
        }
    }
    lua_pop(L_, 1);
}

bool LuaScenario::read_frame_table_(int idx, ScenarioFrame& out_frame) {
    if (!lua_istable(L_, idx)) return false;
    idx = lua_absindex(L_, idx);

    auto get_bool = [&](const char* k, bool def) -> bool {
        lua_getfield(L_, idx, k);
        bool v = def;
        if (lua_isboolean(L_, -1)) v = lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    auto get_num = [&](const char* k, double def) -> double {
        lua_getfield(L_, idx, k);
        double v = def;
        if (lua_isnumber(L_, -1)) v = lua_tonumber(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    auto& cs = out_frame.state;
    cs.cruise_available = get_bool("cruise_available", true);
    cs.cruise_enabled = get_bool("cruise_enabled", false);
    cs.cruise_standstill = get_bool("cruise_standstill", false);
    cs.gas_pressed = get_bool("gas_pressed", false);
    cs.v_ego_mps = get_num("v_ego", 0.0);
    cs.cruise_speed_mps = get_num("cruise_speed", 0.0);
    cs.cruise_speed_cluster_mps = get_num("cruise_speed_cluster", cs.cruise_speed_mps);
    out_frame.long_enabled = get_bool("long_enabled", cs.cruise_enabled);

    read_buttons_(idx, cs.button_events);
    read_number_array_(idx, "psis", out_frame.psis);
    read_number_array_(idx, "curvatures", out_frame.curvatures);
    read_number_array_(idx, "curvature_rates", out_frame.curvature_rates);

    return true;
}

bool LuaScenario::get_frame(double t_s, const ReplayOutputs& prev, ScenarioFrame& out_frame) {
    if (!L_) return false;

    lua_getglobal(L_, "scenario_frame");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] scenario_frame() missing");
        return false;
    }

    lua_pushnumber(L_, t_s);
    push_outputs_table_(prev);

    if (lua_pcall(L_, 2, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_frame failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    out_frame.reset();
    const bool ok = read_frame_table_(-1, out_frame);
    lua_pop(L_, 1);
    return ok;
}

cruise::ButtonType LuaScenario::button_type_from_string(const std::string& name) {
    using cruise::ButtonType;
    if (name == "accel") return ButtonType::AccelCruise;
    if (name == "decel") return ButtonType::DecelCruise;
    if (name == "set") return ButtonType::SetCruise;
    if (name == "resume") return ButtonType::ResumeCruise;
    if (name == "cancel") return ButtonType::Cancel;
    if (name == "gap") return ButtonType::GapAdjust;
    return ButtonType::Unknown;
}

} // namespace sim
