// src/cruise/vehicle_state.hpp
#pragma once

#include <cstdint>
#include <vector>

namespace cruise {

enum class ButtonType : uint8_t {
    Unknown = 0,
    AccelCruise,   // "+" / resume-accel
    DecelCruise,   // "-" / set-decel
    SetCruise,
    ResumeCruise,
    Cancel,
    GapAdjust,
};

struct ButtonEvent {
    ButtonType type = ButtonType::Unknown;
    bool pressed = false;   // false = release edge
};

/**
 * VehicleState - One control cycle of vehicle inputs
 *
 * Produced by the state-estimation pipeline. Speeds are in m/s as reported;
 * the controller converts to kph internally.
 */
struct VehicleState {
    // Cruise system as reported by the car
    bool cruise_available = false;
    bool cruise_enabled = false;
    bool cruise_standstill = false;
    double cruise_speed_mps = 0.0;          // native set speed (PCM-owned cars)
    double cruise_speed_cluster_mps = 0.0;  // what the instrument cluster shows

    bool gas_pressed = false;
    double v_ego_mps = 0.0;

    // In arrival order for this cycle
    std::vector<ButtonEvent> button_events;

    bool has_event(ButtonType type) const {
        for (const auto& b : button_events) {
            if (b.type == type) return true;
        }
        return false;
    }
};

} // namespace cruise
