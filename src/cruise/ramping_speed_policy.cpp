// src/cruise/ramping_speed_policy.cpp
#include "cruise/ramping_speed_policy.hpp"
#include "utils/control_math.hpp"
#include "utils/conversions.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace cruise {

std::optional<double> RampingSpeedPolicy::adjust(const std::optional<double>& v_cruise_kph,
                                                 const AdjustContext& ctx) {
    latch_buttons(ctx);

    std::optional<double> out = v_cruise_kph;
    if (v_cruise_kph) {
        double v = to_display_unit(*v_cruise_kph, ctx.is_metric);
        if (ctx.long_enabled) {
            v = utils::clip(ramp(v, ctx), min_kph(), max_kph());
        }
        // The mph ceiling converts to well above max_kph(); bound the stored value too
        out = utils::clip(from_display_unit(v, ctx.is_metric), min_kph(), max_kph());
    }

    if (accel_pressed_ || decel_pressed_) {
        if (out != v_cruise_kph) {
            // The hold changed speed: restart the hold clock at the faster rate
            accel_pressed_last_s_ = ctx.now_s;
            decel_pressed_last_s_ = ctx.now_s;
            if (!fast_mode_) {
                LOG_DEBUG("[RampingSpeedPolicy] fast mode on at %.1f", *out);
            }
            fast_mode_ = true;
        }
    } else {
        fast_mode_ = false;
    }

    return out;
}

void RampingSpeedPolicy::reset() {
    accel_pressed_ = false;
    decel_pressed_ = false;
    accel_pressed_last_s_ = 0.0;
    decel_pressed_last_s_ = 0.0;
    fast_mode_ = false;
}

void RampingSpeedPolicy::latch_buttons(const AdjustContext& ctx) {
    for (const auto& b : ctx.cs.button_events) {
        if (b.type == ButtonType::AccelCruise) {
            accel_pressed_ = b.pressed;
            if (b.pressed) accel_pressed_last_s_ = ctx.now_s;
        } else if (b.type == ButtonType::DecelCruise) {
            decel_pressed_ = b.pressed;
            if (b.pressed) decel_pressed_last_s_ = ctx.now_s;
        }
    }
}

double RampingSpeedPolicy::ramp(double v, const AdjustContext& ctx) const {
    const bool reverse = ctx.reverse_acc_change;
    const bool suppress_up = increment_suppressed(ctx);

    if (accel_pressed_) {
        if (!suppress_up && hold_elapsed(accel_pressed_last_s_, ctx.now_s)) {
            v = reverse ? v + 1.0 : up_to_boundary(v);
        }
        return v;
    }

    if (decel_pressed_) {
        if (hold_elapsed(decel_pressed_last_s_, ctx.now_s)) {
            v = reverse ? v - 1.0 : down_to_boundary(v);
        }
        return v;
    }

    const double v_ego_display = ctx.cs.v_ego_mps *
        (ctx.is_metric ? utils::MS_TO_KPH : utils::MS_TO_MPH);

    for (const auto& b : ctx.cs.button_events) {
        if (!b.pressed && !fast_mode_) {
            if (b.type == ButtonType::AccelCruise && !suppress_up) {
                v = reverse ? up_to_boundary(v) : v + 1.0;
            } else if (b.type == ButtonType::DecelCruise) {
                v = reverse ? down_to_boundary(v) : v - 1.0;
            }
        }

        if (ctx.cs.gas_pressed && is_set_or_decel(b.type)) {
            v = std::max(v, v_ego_display);
        }
    }
    return v;
}

bool RampingSpeedPolicy::hold_elapsed(double pressed_at_s, double now_s) const {
    const double held_s = now_s - pressed_at_s;
    return held_s >= kRampHoldPeriodS || (fast_mode_ && held_s >= kRampFastHoldPeriodS);
}

double RampingSpeedPolicy::up_to_boundary(double v) {
    return v + kRampingDelta - utils::floor_mod(v, kRampingDelta);
}

double RampingSpeedPolicy::down_to_boundary(double v) {
    return v - (kRampingDelta - utils::floor_mod(kRampingDelta - v, kRampingDelta));
}

double RampingSpeedPolicy::to_display_unit(double v_kph, bool is_metric) {
    if (is_metric) return v_kph;
    return std::round(v_kph * kDisplayMphGain + kDisplayMphOffset);
}

double RampingSpeedPolicy::from_display_unit(double v_display, bool is_metric) {
    if (is_metric) return v_display;
    return std::round((std::round(v_display) - kDisplayMphOffset) / kDisplayMphGain);
}

} // namespace cruise
