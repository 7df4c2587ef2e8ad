// src/config/vehicle_params.hpp
#pragma once

#include <string>

namespace config {

// Vehicle-parameter provider output consumed by the control core
struct VehicleParams {
    std::string brand = "generic";

    // PCM owns engagement / also owns the set speed
    bool pcm_cruise = false;
    bool pcm_cruise_speed = false;

    // Unit system of the driver-facing display
    bool is_metric = true;

    double steer_actuator_delay_s = 0.1;

    bool owns_set_speed() const { return pcm_cruise && pcm_cruise_speed; }
};

} // namespace config
