// src/config/vehicle_config.hpp
#pragma once

#include <string>
#include "config/vehicle_params.hpp"

namespace config {

/**
 * VehicleConfig - Loads vehicle parameters from YAML files
 *
 * Usage:
 *   auto config = VehicleConfig::load("config/vehicles/honda_civic.yaml");
 *   cruise::CruiseSpeedController ctl(config.params, settings);
 *
 * Falls back to hardcoded defaults if file not found.
 */
class VehicleConfig {
public:
    std::string name;
    std::string description;
    int year = 0;

    VehicleParams params;

    /**
     * Load vehicle config from YAML file
     * @param yaml_path Path to YAML file (e.g., "config/vehicles/default.yaml")
     * @return VehicleConfig with loaded parameters
     * @throws std::runtime_error if file exists but is invalid
     */
    static VehicleConfig load(const std::string& yaml_path);

    /**
     * Default: generic metric car, openpilot-owned set speed
     */
    static VehicleConfig get_default();

    /**
     * @throws std::runtime_error if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;

    VehicleConfig() = default;
};

} // namespace config
