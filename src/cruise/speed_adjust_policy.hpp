// src/cruise/speed_adjust_policy.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "cruise/button_hold.hpp"
#include "cruise/cruise_constants.hpp"
#include "cruise/vehicle_state.hpp"

namespace cruise {

enum class AdjustPolicyKind : uint8_t {
    Simple = 0,   // edge + long-press repeat
    Ramping,      // continuous-hold ramp in display units
};

const char* to_string(AdjustPolicyKind kind);

// Chosen once per vehicle; never consulted inside update()
AdjustPolicyKind policy_kind_for_brand(const std::string& brand);

/**
 * AdjustContext - Everything a policy may read in one cycle
 */
struct AdjustContext {
    const VehicleState& cs;
    bool long_enabled;
    bool is_metric;
    bool reverse_acc_change;
    double now_s;
    const ButtonHoldTracker& holds;  // state as of the end of the previous cycle
};

/**
 * SpeedAdjustPolicy - Locally synthesized set-speed logic
 *
 * Runs only when the car's cruise is enabled and the car does not own the
 * set speed. Receives the current target (empty = never set) and returns
 * the new one. Implementations clamp to [min_kph(), max_kph()] whenever
 * they produce a value.
 */
class SpeedAdjustPolicy {
public:
    virtual ~SpeedAdjustPolicy() = default;

    virtual std::optional<double> adjust(const std::optional<double>& v_cruise_kph,
                                         const AdjustContext& ctx) = 0;

    virtual AdjustPolicyKind kind() const = 0;
    virtual double min_kph() const = 0;
    virtual double max_kph() const { return kCruiseMaxKph; }

    // Drop any latched button state
    virtual void reset() {}

protected:
    // Don't raise the set speed when "+" is only meant to leave standstill
    static bool increment_suppressed(const AdjustContext& ctx) {
        return ctx.holds.get(ButtonType::AccelCruise).started_at_standstill ||
               ctx.cs.cruise_standstill;
    }

    static bool is_set_or_decel(ButtonType type) {
        return type == ButtonType::DecelCruise || type == ButtonType::SetCruise;
    }
};

std::unique_ptr<SpeedAdjustPolicy> make_policy(AdjustPolicyKind kind);

} // namespace cruise
