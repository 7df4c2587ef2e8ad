// src/cruise/simple_speed_policy.hpp
#pragma once

#include "cruise/speed_adjust_policy.hpp"

namespace cruise {

/**
 * SimpleSpeedPolicy - Edge-driven set speed with long-press repeat
 *
 * One button action per cycle. A release edge wins; without one, a held
 * button fires every kLongPressCycles. Short presses step by the base
 * interval and long presses by interval * multiplier, snapping to the
 * interval grid first when the current speed is off-grid. Reversing the
 * adjustment direction swaps which of the two presses gets the big step.
 */
class SimpleSpeedPolicy : public SpeedAdjustPolicy {
public:
    std::optional<double> adjust(const std::optional<double>& v_cruise_kph,
                                 const AdjustContext& ctx) override;

    AdjustPolicyKind kind() const override { return AdjustPolicyKind::Simple; }
    double min_kph() const override { return kCruiseMinKph; }

private:
    static double step(double v_kph, ButtonType button, bool long_press,
                       bool is_metric, bool reverse);
};

} // namespace cruise
