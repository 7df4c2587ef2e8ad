// src/cruise/ramping_speed_policy.hpp
#pragma once

#include "cruise/speed_adjust_policy.hpp"

namespace cruise {

/**
 * RampingSpeedPolicy - Press-and-hold ramp for cars that expect it
 *
 * Works in the cluster's display unit (mph fit on imperial cars). A held
 * button changes the speed once per second, or twice per second once
 * fast mode is latched. Release edges give the single-step change unless
 * the hold already ramped. Fast mode latches when a held button changed
 * the speed and clears when both buttons are up.
 */
class RampingSpeedPolicy : public SpeedAdjustPolicy {
public:
    std::optional<double> adjust(const std::optional<double>& v_cruise_kph,
                                 const AdjustContext& ctx) override;

    AdjustPolicyKind kind() const override { return AdjustPolicyKind::Ramping; }
    double min_kph() const override { return kCruiseMinRampingKph; }

    void reset() override;

    bool accel_pressed() const { return accel_pressed_; }
    bool decel_pressed() const { return decel_pressed_; }
    bool fast_mode() const { return fast_mode_; }

    static double to_display_unit(double v_kph, bool is_metric);
    static double from_display_unit(double v_display, bool is_metric);

private:
    void latch_buttons(const AdjustContext& ctx);
    double ramp(double v_display, const AdjustContext& ctx) const;
    bool hold_elapsed(double pressed_at_s, double now_s) const;

    static double up_to_boundary(double v);
    static double down_to_boundary(double v);

    bool accel_pressed_ = false;
    bool decel_pressed_ = false;
    double accel_pressed_last_s_ = 0.0;
    double decel_pressed_last_s_ = 0.0;
    bool fast_mode_ = false;
};

} // namespace cruise
