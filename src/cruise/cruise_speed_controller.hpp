// src/cruise/cruise_speed_controller.hpp
#pragma once

#include <memory>
#include <optional>

#include "config/settings_provider.hpp"
#include "config/vehicle_params.hpp"
#include "cruise/button_hold.hpp"
#include "cruise/speed_adjust_policy.hpp"
#include "cruise/vehicle_state.hpp"

namespace cruise {

/**
 * CruiseSpeedController - Cruise set-speed state machine
 *
 * Owns the target and cluster set speed for one drive session. Call
 * update() once per control cycle and initialize() on the transition into
 * active cruise. Not thread-safe: keep it on the control loop.
 *
 * The button policy is fixed at construction from the vehicle brand. The
 * settings provider is read on every update() and must outlive the
 * controller.
 */
class CruiseSpeedController {
public:
    CruiseSpeedController(const config::VehicleParams& params,
                          const config::SettingsProvider& settings);

    // Explicit policy, brand ignored
    CruiseSpeedController(const config::VehicleParams& params,
                          const config::SettingsProvider& settings,
                          AdjustPolicyKind policy);

    void update(const VehicleState& cs, bool long_enabled, bool is_metric, double now_s);

    void initialize(const VehicleState& cs, bool is_metric);

    bool is_initialized() const { return target_kph_.has_value(); }

    std::optional<double> target_speed_kph() const { return target_kph_; }
    std::optional<double> cluster_speed_kph() const { return cluster_kph_; }
    std::optional<double> previous_cycle_speed_kph() const { return previous_kph_; }

    // kCruiseInitialKph while unset, for displays that expect a number
    double target_speed_display_kph() const { return target_kph_.value_or(kCruiseInitialKph); }
    double cluster_speed_display_kph() const { return cluster_kph_.value_or(kCruiseInitialKph); }

    bool reverse_adjustment_direction() const { return reverse_acc_change_; }

    AdjustPolicyKind policy_kind() const { return policy_->kind(); }
    const SpeedAdjustPolicy& policy() const { return *policy_; }
    const ButtonHoldTracker& button_holds() const { return holds_; }

    // Forget everything, as at the start of a drive
    void reset();

private:
    config::VehicleParams params_;
    const config::SettingsProvider* settings_;
    std::unique_ptr<SpeedAdjustPolicy> policy_;
    ButtonHoldTracker holds_;

    std::optional<double> target_kph_;
    std::optional<double> cluster_kph_;
    std::optional<double> previous_kph_;

    bool reverse_acc_change_ = false;
};

} // namespace cruise
