// src/cruise/simple_speed_policy.cpp
#include "cruise/simple_speed_policy.hpp"
#include "utils/control_math.hpp"
#include "utils/conversions.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace cruise {

std::optional<double> SimpleSpeedPolicy::adjust(const std::optional<double>& v_cruise_kph,
                                                const AdjustContext& ctx) {
    if (!v_cruise_kph || !ctx.long_enabled) return v_cruise_kph;

    const uint32_t threshold = ctx.holds.long_press_cycles();

    bool found = false;
    bool long_press = false;
    ButtonType button = ButtonType::Unknown;

    for (const auto& b : ctx.cs.button_events) {
        if (!ButtonHoldTracker::is_tracked(b.type) || b.pressed) continue;
        if (is_past_long_press(ctx.holds.get(b.type), threshold)) {
            return v_cruise_kph;  // release after a long press: nothing more to do
        }
        button = b.type;
        found = true;
        break;
    }

    if (!found) {
        for (ButtonType type : {ButtonType::DecelCruise, ButtonType::AccelCruise}) {
            if (is_long_press_tick(ctx.holds.get(type))) {
                button = type;
                long_press = true;
                found = true;
                break;
            }
        }
    }

    if (!found) return v_cruise_kph;

    if (button == ButtonType::AccelCruise && increment_suppressed(ctx)) {
        LOG_DEBUG("[SimpleSpeedPolicy] '+' ignored at standstill");
        return v_cruise_kph;
    }

    double v = step(*v_cruise_kph, button, long_press, ctx.is_metric, ctx.reverse_acc_change);

    if (ctx.cs.gas_pressed && is_set_or_decel(button)) {
        v = std::max(v, ctx.cs.v_ego_mps * utils::MS_TO_KPH);
    }

    v = utils::clip(utils::round_to_tenth(v), min_kph(), max_kph());

    LOG_TRACE("[SimpleSpeedPolicy] %s%s: %.1f -> %.1f kph",
              button == ButtonType::AccelCruise ? "+" : "-",
              long_press ? " (long)" : "", *v_cruise_kph, v);
    return v;
}

double SimpleSpeedPolicy::step(double v_kph, ButtonType button, bool long_press,
                               bool is_metric, bool reverse) {
    const bool up = (button == ButtonType::AccelCruise);
    const double base = is_metric ? kIntervalMetric : kIntervalImperial;
    const double multiplier = is_metric ? kLongPressMultiplierMetric
                                        : kLongPressMultiplierImperial;

    // Which press gets the coarse, grid-snapping interval
    const bool coarse = reverse ? !long_press : long_press;
    const double delta = coarse ? base * multiplier : base;

    if (coarse && std::fmod(v_kph, delta) != 0.0) {
        const double cells = v_kph / delta;
        return (up ? std::ceil(cells) : std::floor(cells)) * delta;
    }
    return v_kph + (up ? delta : -delta);
}

} // namespace cruise
