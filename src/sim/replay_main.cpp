// src/sim/replay_main.cpp
#include "sim/replay_app.hpp"
#include "config/vehicle_config.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <getopt.h>

void print_usage(const char* prog_name) {
    printf("Usage: %s [options] scenario.lua\n", prog_name);
    printf("\nOptions:\n");
    printf("  --vehicle PATH        Vehicle config YAML (default: built-in)\n");
    printf("  --settings PATH       Runtime settings YAML (default: built-in)\n");
    printf("  --arg VALUE           Argument passed to scenario_init()\n");
    printf("  --dt SEC              Control period in seconds (default: 0.01)\n");
    printf("  --duration SEC        Replay duration in seconds (default: 30)\n");
    printf("  --csv PATH            Output CSV (default: replay_out.csv)\n");
    printf("  --log-file PATH       Mirror log output to a file\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error|off (default: info)\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  %s config/lua/cruise_hold.lua\n\n", prog_name);
    printf("  %s --vehicle config/vehicles/honda_imperial.yaml \\\n", prog_name);
    printf("     --settings config/settings.yaml config/lua/cruise_hold.lua\n\n");
}

int main(int argc, char** argv) {
    sim::ReplayAppConfig cfg{};

    std::string vehicle_config_path;
    std::string log_level = "info";

    static struct option long_options[] = {
        {"vehicle",   required_argument, 0, 'v'},
        {"settings",  required_argument, 0, 's'},
        {"arg",       required_argument, 0, 'a'},
        {"dt",        required_argument, 0, 'd'},
        {"duration",  required_argument, 0, 'D'},
        {"csv",       required_argument, 0, 'c'},
        {"log-file",  required_argument, 0, 'f'},
        {"log-level", required_argument, 0, 'l'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'v':
                vehicle_config_path = optarg;
                break;
            case 's':
                cfg.settings_path = optarg;
                break;
            case 'a':
                cfg.scenario_arg = optarg;
                break;
            case 'd':
                cfg.dt_s = std::atof(optarg);
                if (cfg.dt_s <= 0 || cfg.dt_s > 1.0) {
                    fprintf(stderr, "Error: Invalid timestep: %s (must be 0 < dt <= 1.0)\n", optarg);
                    return 1;
                }
                break;
            case 'D':
                cfg.duration_s = std::atof(optarg);
                if (cfg.duration_s <= 0) {
                    fprintf(stderr, "Error: Invalid duration: %s\n", optarg);
                    return 1;
                }
                break;
            case 'c':
                cfg.csv_log_path = optarg;
                break;
            case 'f':
                cfg.debug_log_path = optarg;
                cfg.enable_debug_log_file = true;
                break;
            case 'l':
                log_level = optarg;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (optind >= argc) {
        print_usage(argv[0]);
        return 1;
    }
    cfg.lua_script_path = argv[optind];

    utils::set_level(utils::level_from_string(log_level));

    // ========================================================================
    // Vehicle configuration: command-line path, else defaults
    // ========================================================================
    config::VehicleConfig vehicle;
    try {
        if (!vehicle_config_path.empty()) {
            vehicle = config::VehicleConfig::load(vehicle_config_path);
        } else {
            LOG_INFO("No vehicle config specified, using defaults");
            vehicle = config::VehicleConfig::get_default();
            vehicle.print_summary();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("%s", e.what());
        return 1;
    }
    cfg.vehicle_params = vehicle.params;

    LOG_INFO("========================================");
    LOG_INFO("Cruise / Lateral Replay");
    LOG_INFO("Scenario: %s", cfg.lua_script_path.c_str());
    LOG_INFO("Vehicle: %s", vehicle.name.c_str());
    LOG_INFO("========================================");

    sim::ReplayApp app(cfg);
    return app.run();
}
