// src/config/scenario_config.hpp
#pragma once

#include "config/config_error.hpp"
#include "utils/vec3.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <string>
#include <vector>

namespace config {

/**
 * EnvironmentSpec - Where the environment state comes from
 *
 *   type: static -> csv table loaded into env::StaticEnvironment
 *   type: lua    -> script driving env::LuaEnvironment
 */
struct EnvironmentSpec {
    std::string type = "static";
    std::string csv_path;
    std::string script_path;
};

/**
 * SensorSpec - One sensor entry of a scenario
 *
 * params holds the raw override mapping, resolved later by SensorConfig.
 */
struct SensorSpec {
    std::string id;
    std::string modality;
    utils::Vec3 position;
    uint64_t seed = 0;        // 0 = derive from the scenario seed
    bool enabled = true;
    YAML::Node params;
};

/**
 * ScenarioConfig - Loads a simulation scenario from YAML
 *
 * Usage:
 *   auto scenario = ScenarioConfig::load("config/scenarios/substation.yaml");
 *   sim::ScenarioRunner runner(scenario);
 *
 * Falls back to the built-in default scenario if the file is not found.
 */
class ScenarioConfig {
public:
    std::string name = "default";
    double dt_s = 1.0;
    double duration_s = 60.0;
    double start_hours = 0.0;     // operating hours at t = 0
    uint64_t seed = 0;
    unsigned threads = 1;
    std::string csv_out = "twinsense_out.csv";

    EnvironmentSpec environment;
    std::vector<SensorSpec> sensors;

    /**
     * Load scenario from YAML file
     * @throws ConfigError if the file exists but is malformed or invalid
     *
     * If the file doesn't exist, returns the default scenario with a warning.
     */
    static ScenarioConfig load(const std::string& yaml_path);

    /**
     * Built-in scenario: one EMF and one thermal sensor over the
     * shipped substation environment table.
     */
    static ScenarioConfig get_default();

    /**
     * @throws ConfigError if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;

    ScenarioConfig() = default;
};

} // namespace config
