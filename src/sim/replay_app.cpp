// src/sim/replay_app.cpp
#include "sim/replay_app.hpp"
#include "config/settings_provider.hpp"
#include "config/yaml_settings_store.hpp"
#include "cruise/cruise_speed_controller.hpp"
#include "lateral/curvature_lag_compensator.hpp"
#include "utils/conversions.hpp"
#include "utils/logging.hpp"

#include <fstream>
#include <iomanip>
#include <memory>

namespace sim {

ReplayApp::ReplayApp(ReplayAppConfig cfg) : cfg_(std::move(cfg)), lua_() {
    if (cfg_.enable_debug_log_file) {
        utils::open_log_file(cfg_.debug_log_path);
    }
}

int ReplayApp::run() {
    const double dt = cfg_.dt_s;

    // ========================================================================
    // Settings + controllers
    // ========================================================================
    std::unique_ptr<config::SettingsProvider> settings;
    if (!cfg_.settings_path.empty()) {
        settings = std::make_unique<config::YamlSettingsStore>(cfg_.settings_path);
        LOG_INFO("[ReplayApp] Settings from %s", cfg_.settings_path.c_str());
    } else {
        settings = std::make_unique<config::MemorySettingsStore>();
        LOG_INFO("[ReplayApp] Using built-in settings");
    }

    const config::VehicleParams& vp = cfg_.vehicle_params;
    cruise::CruiseSpeedController cruise_ctl(vp, *settings);

    // ---- Scenario ----
    if (!lua_.init(cfg_.lua_script_path, cfg_.scenario_arg)) {
        LOG_ERROR("Failed to init Lua scenario: %s", cfg_.lua_script_path.c_str());
        return 1;
    }
    LOG_INFO("Lua scenario loaded: %s", cfg_.lua_script_path.c_str());

    // ---- CSV logging ----
    std::ofstream csv(cfg_.csv_log_path);
    if (!csv) {
        LOG_ERROR("Failed to open CSV: %s", cfg_.csv_log_path.c_str());
        return 1;
    }

    csv << "t_s,"
        << "cruise_available,cruise_enabled,standstill,v_ego_kph,buttons,"
        << "target_kph,cluster_kph,initialized,"
        << "curvature,curvature_rate\n";
    csv << std::fixed << std::setprecision(6);

    const int max_iters = static_cast<int>(cfg_.duration_s / dt);

    const double log_period_s = (cfg_.log_hz > 0.0) ?
        1.0 / cfg_.log_hz : 0.1;
    double next_log = 0.0;

    // ---- Main loop ----
    LOG_INFO("Starting replay (duration=%.1fs, dt=%.4fs)", cfg_.duration_s, dt);

    ScenarioFrame frame;
    ReplayOutputs out;
    bool was_enabled = false;
    size_t engagements = 0;

    for (int iter = 0; iter < max_iters; ++iter) {
        const double t = iter * dt;

        if (!lua_.get_frame(t, out, frame)) {
            LOG_ERROR("[t=%.2f] scenario_frame failed, stopping", t);
            csv.close();
            return 1;
        }

        const auto& cs = frame.state;

        cruise_ctl.update(cs, frame.long_enabled, vp.is_metric, t);

        if (cs.cruise_enabled && !was_enabled) {
            cruise_ctl.initialize(cs, vp.is_metric);
            ++engagements;
        }
        was_enabled = cs.cruise_enabled;

        const auto cmd = lateral::CurvatureLagCompensator::compensate(
            vp.steer_actuator_delay_s, cs.v_ego_mps,
            frame.psis, frame.curvatures, frame.curvature_rates);

        out.t_s = t;
        out.cruise_initialized = cruise_ctl.is_initialized();
        out.target_kph = cruise_ctl.target_speed_display_kph();
        out.cluster_kph = cruise_ctl.cluster_speed_display_kph();
        out.curvature = cmd.curvature;
        out.curvature_rate = cmd.curvature_rate;

        // Always log cycles with button activity
        if (t >= next_log || !cs.button_events.empty()) {
            csv << t << ","
                << cs.cruise_available << "," << cs.cruise_enabled << ","
                << cs.cruise_standstill << "," << cs.v_ego_mps * utils::MS_TO_KPH << ","
                << cs.button_events.size() << ","
                << out.target_kph << "," << out.cluster_kph << ","
                << out.cruise_initialized << ","
                << out.curvature << "," << out.curvature_rate << "\n";

            if (t >= next_log) next_log += log_period_s;
        }
    }

    LOG_INFO("========================================");
    LOG_INFO("Replay Summary");
    LOG_INFO("========================================");
    LOG_INFO("Cycles: %d", max_iters);
    LOG_INFO("Engagements: %zu", engagements);
    LOG_INFO("Final set speed: %.1f kph (%s)", out.target_kph,
             out.cruise_initialized ? "set" : "unset");
    LOG_INFO("========================================");

    LOG_INFO("Replay complete. CSV written to: %s", cfg_.csv_log_path.c_str());
    csv.close();
    return 0;
}

} // namespace sim
