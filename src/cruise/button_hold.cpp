// src/cruise/button_hold.cpp
#include "cruise/button_hold.hpp"

namespace cruise {

namespace {

ButtonPhase phase_for(uint32_t hold_cycles, uint32_t long_press_cycles) {
    if (hold_cycles == 0) return ButtonPhase::Released;
    if (long_press_cycles > 0 && hold_cycles % long_press_cycles == 0) {
        return ButtonPhase::LongPressFiring;
    }
    return ButtonPhase::Pressed;
}

} // namespace

ButtonHold advance_hold(const ButtonHold& s, uint32_t long_press_cycles) {
    if (!s.held()) return s;

    ButtonHold next = s;
    next.hold_cycles = s.hold_cycles + 1;
    next.phase = phase_for(next.hold_cycles, long_press_cycles);
    return next;
}

ButtonHold apply_edge(bool pressed, bool standstill, uint32_t long_press_cycles) {
    ButtonHold next;
    next.hold_cycles = pressed ? 1u : 0u;
    next.phase = phase_for(next.hold_cycles, long_press_cycles);
    next.started_at_standstill = standstill;
    return next;
}

void ButtonHoldTracker::update(const VehicleState& cs) {
    accel_ = advance_hold(accel_, long_press_cycles_);
    decel_ = advance_hold(decel_, long_press_cycles_);

    for (const auto& b : cs.button_events) {
        if (!is_tracked(b.type)) continue;
        get_mut(b.type) = apply_edge(b.pressed, cs.cruise_standstill, long_press_cycles_);
    }
}

} // namespace cruise
