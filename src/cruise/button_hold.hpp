// src/cruise/button_hold.hpp
#pragma once

#include <cstdint>

#include "cruise/cruise_constants.hpp"
#include "cruise/vehicle_state.hpp"

namespace cruise {

enum class ButtonPhase : uint8_t {
    Released = 0,
    Pressed,          // held, below or between long-press ticks
    LongPressFiring,  // hold count is a non-zero multiple of the threshold
};

/**
 * ButtonHold - Hold state of one cruise button
 *
 * hold_cycles counts cycles since the press edge (1 on the press cycle,
 * 0 when released). started_at_standstill is captured on every edge.
 */
struct ButtonHold {
    ButtonPhase phase = ButtonPhase::Released;
    uint32_t hold_cycles = 0;
    bool started_at_standstill = false;

    bool held() const { return phase != ButtonPhase::Released; }
};

// Cycle elapsed with no edge for this button
ButtonHold advance_hold(const ButtonHold& s, uint32_t long_press_cycles = kLongPressCycles);

// Press or release edge observed this cycle; the previous hold is discarded
ButtonHold apply_edge(bool pressed, bool standstill,
                      uint32_t long_press_cycles = kLongPressCycles);

inline bool is_long_press_tick(const ButtonHold& s) {
    return s.phase == ButtonPhase::LongPressFiring;
}

// A release now only terminates an earlier long press
inline bool is_past_long_press(const ButtonHold& s,
                               uint32_t long_press_cycles = kLongPressCycles) {
    return s.hold_cycles > long_press_cycles;
}

/**
 * ButtonHoldTracker - Hold state for the two adjustable buttons
 */
class ButtonHoldTracker {
public:
    explicit ButtonHoldTracker(uint32_t long_press_cycles = kLongPressCycles)
        : long_press_cycles_(long_press_cycles) {}

    // Advance held buttons, then apply this cycle's edges in order
    void update(const VehicleState& cs);

    static bool is_tracked(ButtonType type) {
        return type == ButtonType::AccelCruise || type == ButtonType::DecelCruise;
    }

    // Only valid for tracked types
    const ButtonHold& get(ButtonType type) const {
        return type == ButtonType::AccelCruise ? accel_ : decel_;
    }

    uint32_t long_press_cycles() const { return long_press_cycles_; }

    void reset() {
        accel_ = ButtonHold{};
        decel_ = ButtonHold{};
    }

private:
    ButtonHold& get_mut(ButtonType type) {
        return type == ButtonType::AccelCruise ? accel_ : decel_;
    }

    uint32_t long_press_cycles_;
    ButtonHold accel_{};
    ButtonHold decel_{};
};

} // namespace cruise
