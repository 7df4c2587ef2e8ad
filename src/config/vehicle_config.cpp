// src/config/vehicle_config.cpp
#include "config/vehicle_config.hpp"
#include "cruise/speed_adjust_policy.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace config {

VehicleConfig VehicleConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[VehicleConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[VehicleConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[VehicleConfig] Loading vehicle config from: %s", yaml_path.c_str());

    try {
        YAML::Node config = YAML::LoadFile(yaml_path);

        VehicleConfig vehicle = get_default();

        // ====================================================================
        // Vehicle metadata
        // ====================================================================
        if (config["vehicle"]) {
            auto v = config["vehicle"];
            vehicle.name = v["name"].as<std::string>("Unknown Vehicle");
            vehicle.description = v["description"].as<std::string>("");
            vehicle.year = v["year"].as<int>(2024);
            vehicle.params.brand = v["brand"].as<std::string>(vehicle.params.brand);
        }

        // ====================================================================
        // Longitudinal: who owns cruise, display units
        // ====================================================================
        if (config["cruise"]) {
            auto c = config["cruise"];
            vehicle.params.pcm_cruise = c["pcm_cruise"].as<bool>(false);
            vehicle.params.pcm_cruise_speed = c["pcm_cruise_speed"].as<bool>(false);
            vehicle.params.is_metric = c["is_metric"].as<bool>(true);
        }

        // ====================================================================
        // Lateral
        // ====================================================================
        if (config["lateral"]) {
            auto lat = config["lateral"];
            vehicle.params.steer_actuator_delay_s =
                lat["steer_actuator_delay_s"].as<double>(vehicle.params.steer_actuator_delay_s);
        }

        vehicle.validate();

        LOG_INFO("[VehicleConfig] Successfully loaded: %s", vehicle.name.c_str());
        vehicle.print_summary();

        return vehicle;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[VehicleConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[VehicleConfig] Load error: ") + e.what()
        );
    }
}

VehicleConfig VehicleConfig::get_default() {
    VehicleConfig vehicle;

    vehicle.name = "Generic Metric Vehicle (Default)";
    vehicle.description = "openpilot-owned set speed, simple button policy";
    vehicle.year = 2024;

    vehicle.params.brand = "generic";
    vehicle.params.pcm_cruise = false;
    vehicle.params.pcm_cruise_speed = false;
    vehicle.params.is_metric = true;
    vehicle.params.steer_actuator_delay_s = 0.1;

    return vehicle;
}

void VehicleConfig::validate() const {
    if (params.brand.empty()) {
        throw std::runtime_error("Invalid brand: must not be empty");
    }
    if (params.steer_actuator_delay_s < 0.0 || params.steer_actuator_delay_s > 1.0) {
        throw std::runtime_error("Invalid steer_actuator_delay_s: must be 0 <= delay <= 1");
    }
    if (params.pcm_cruise_speed && !params.pcm_cruise) {
        throw std::runtime_error("Invalid cruise ownership: pcm_cruise_speed requires pcm_cruise");
    }

    LOG_DEBUG("[VehicleConfig] Validation passed");
}

void VehicleConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Vehicle Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    if (!description.empty()) {
        LOG_INFO("Description: %s", description.c_str());
    }
    LOG_INFO("----------------------------------------");
    LOG_INFO("Brand: %s (%s button policy)", params.brand.c_str(),
             cruise::to_string(cruise::policy_kind_for_brand(params.brand)));
    LOG_INFO("Set speed owner: %s", params.owns_set_speed() ? "PCM" : "local");
    LOG_INFO("Units: %s", params.is_metric ? "metric" : "imperial");
    LOG_INFO("Steer actuator delay: %.3f s", params.steer_actuator_delay_s);
    LOG_INFO("========================================");
}

} // namespace config
