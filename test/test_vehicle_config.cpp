// test/test_vehicle_config.cpp
/**
 * Unit Test: VehicleConfig
 *
 * Tests YAML loading, validation, and default configuration.
 *
 * Test Coverage:
 *   1. Default configuration generation
 *   2. Valid YAML loading
 *   3. Missing file fallback to defaults
 *   4. Parameter validation (delay, brand, cruise ownership)
 *   5. Malformed YAML handling
 */

#include "config/vehicle_config.hpp"
#include "cruise/speed_adjust_policy.hpp"
#include "utils/logging.hpp"
#include "test_common.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>


// Test 1: Default configuration
void test_default_config(TestResult& result) {
    section("Test 1: Default Configuration");

    config::VehicleConfig cfg = config::VehicleConfig::get_default();

    result.check(cfg.params.brand == "generic", "Default brand is generic");
    result.check(!cfg.params.owns_set_speed(), "Default set speed is owned locally");
    result.check(cfg.params.is_metric, "Default units are metric");
    result.check(is_close(cfg.params.steer_actuator_delay_s, 0.1),
                 "Default steer actuator delay is 0.1 s");

    try {
        cfg.validate();
        result.pass("Default configuration passes validation");
    } catch (const std::exception& e) {
        result.fail(std::string("Default configuration failed validation: ") + e.what());
    }
}

// Test 2: Valid YAML loading
void test_valid_yaml(TestResult& result) {
    section("Test 2: Valid YAML Loading");

    const char* temp_yaml = "/tmp/test_vctl_vehicle_valid.yaml";
    std::ofstream yaml_file(temp_yaml);
    yaml_file << R"(
vehicle:
  name: "Test Civic"
  description: "Imperial cluster, PCM engages"
  brand: honda
  year: 2019

cruise:
  pcm_cruise: true
  pcm_cruise_speed: false
  is_metric: false

lateral:
  steer_actuator_delay_s: 0.15
)";
    yaml_file.close();

    try {
        auto cfg = config::VehicleConfig::load(temp_yaml);

        result.check(cfg.name == "Test Civic", "Name loaded: " + cfg.name);
        result.check(cfg.year == 2019, "Year loaded: " + std::to_string(cfg.year));
        result.check(cfg.params.brand == "honda", "Brand loaded: " + cfg.params.brand);
        result.check(cfg.params.pcm_cruise && !cfg.params.pcm_cruise_speed,
                     "PCM engages, set speed stays local");
        result.check(!cfg.params.owns_set_speed(), "owns_set_speed() is false");
        result.check(!cfg.params.is_metric, "Imperial units loaded");
        result.check(is_close(cfg.params.steer_actuator_delay_s, 0.15),
                     "Steer actuator delay loaded: " + num(cfg.params.steer_actuator_delay_s));
        result.check(cruise::policy_kind_for_brand(cfg.params.brand) ==
                         cruise::AdjustPolicyKind::Ramping,
                     "Brand selects the ramping policy");
    } catch (const std::exception& e) {
        result.fail(std::string("Exception loading valid YAML: ") + e.what());
    }

    std::remove(temp_yaml);

    // Sections are optional; missing ones keep defaults
    const char* partial_yaml = "/tmp/test_vctl_vehicle_partial.yaml";
    std::ofstream partial(partial_yaml);
    partial << "vehicle:\n  name: \"Partial\"\n  brand: toyota\n";
    partial.close();

    try {
        auto cfg = config::VehicleConfig::load(partial_yaml);
        result.check(cfg.params.brand == "toyota" && cfg.params.is_metric &&
                         is_close(cfg.params.steer_actuator_delay_s, 0.1),
                     "Partial file keeps defaults for missing sections");
    } catch (const std::exception& e) {
        result.fail(std::string("Exception loading partial YAML: ") + e.what());
    }

    std::remove(partial_yaml);
}

// Test 3: Missing file
void test_missing_file(TestResult& result) {
    section("Test 3: Missing File Fallback");

    const char* missing_file = "/tmp/nonexistent_vctl_vehicle_config.yaml";

    try {
        auto cfg = config::VehicleConfig::load(missing_file);
        result.check(cfg.params.brand == "generic" && cfg.params.is_metric,
                     "Missing file falls back to default configuration");
    } catch (const std::exception& e) {
        result.fail(std::string("Missing file should not throw: ") + e.what());
    }
}

// Loads YAML text and expects a validation error mentioning `needle`
void expect_rejected(TestResult& result, const char* path, const std::string& yaml,
                     const std::string& needle, const std::string& label) {
    std::ofstream yaml_file(path);
    yaml_file << yaml;
    yaml_file.close();

    try {
        config::VehicleConfig::load(path);
        result.fail(label + ": expected exception");
    } catch (const std::exception& e) {
        const std::string msg = e.what();
        if (msg.find(needle) != std::string::npos) {
            result.pass(label + ": rejected (" + msg + ")");
        } else {
            result.fail(label + ": unexpected message: " + msg);
        }
    }

    std::remove(path);
}

// Test 4: Validation
void test_validation(TestResult& result) {
    section("Test 4: Parameter Validation");

    expect_rejected(result, "/tmp/test_vctl_vehicle_neg_delay.yaml",
                    "vehicle:\n  brand: toyota\nlateral:\n  steer_actuator_delay_s: -0.1\n",
                    "steer_actuator_delay_s", "Negative actuator delay");

    expect_rejected(result, "/tmp/test_vctl_vehicle_big_delay.yaml",
                    "vehicle:\n  brand: toyota\nlateral:\n  steer_actuator_delay_s: 2.5\n",
                    "steer_actuator_delay_s", "Actuator delay above 1 s");

    expect_rejected(result, "/tmp/test_vctl_vehicle_empty_brand.yaml",
                    "vehicle:\n  brand: \"\"\n",
                    "brand", "Empty brand");

    expect_rejected(result, "/tmp/test_vctl_vehicle_pcm_speed.yaml",
                    "vehicle:\n  brand: hyundai\ncruise:\n  pcm_cruise: false\n  pcm_cruise_speed: true\n",
                    "pcm_cruise_speed", "PCM set speed without PCM cruise");

    config::VehicleConfig cfg = config::VehicleConfig::get_default();
    cfg.params.pcm_cruise = true;
    cfg.params.pcm_cruise_speed = true;
    try {
        cfg.validate();
        result.check(cfg.params.owns_set_speed(), "PCM-owned set speed is valid");
    } catch (const std::exception& e) {
        result.fail(std::string("PCM-owned set speed rejected: ") + e.what());
    }
}

// Test 5: Malformed YAML
void test_malformed_yaml(TestResult& result) {
    section("Test 5: Malformed YAML");

    expect_rejected(result, "/tmp/test_vctl_vehicle_malformed.yaml",
                    "vehicle:\n  brand: [toyota\n  name: broken\n",
                    "YAML parse error", "Unterminated sequence");
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            VehicleConfig Unit Tests                          ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    // Suppress INFO logs during tests
    utils::set_level(utils::LogLevel::Warn);

    TestResult result;

    test_default_config(result);
    test_valid_yaml(result);
    test_missing_file(result);
    test_validation(result);
    test_malformed_yaml(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
