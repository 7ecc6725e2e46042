// src/config/scenario_config.cpp
#include "config/scenario_config.hpp"
#include "config/modality.hpp"
#include "utils/logging.hpp"
#include <fstream>
#include <set>

namespace config {

namespace {

utils::Vec3 parse_position(const YAML::Node& node, const std::string& sensor_id) {
    if (!node) return {};
    if (!node.IsSequence() || node.size() != 3) {
        throw ConfigError("[ScenarioConfig] sensor " + sensor_id + ": position must be [x, y, z]");
    }
    return {node[0].as<double>(), node[1].as<double>(), node[2].as<double>()};
}

} // namespace

ScenarioConfig ScenarioConfig::load(const std::string& yaml_path) {
    // Check if file exists
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[ScenarioConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[ScenarioConfig] Using default scenario");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[ScenarioConfig] Loading scenario from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        if (!root.IsMap()) {
            throw ConfigError("[ScenarioConfig] " + yaml_path + ": top level must be a mapping");
        }

        ScenarioConfig scenario;

        // ====================================================================
        // Scenario timing
        // ====================================================================
        if (root["scenario"]) {
            auto s = root["scenario"];
            scenario.name = s["name"].as<std::string>(scenario.name);
            scenario.dt_s = s["dt_s"] ? s["dt_s"].as<double>() : scenario.dt_s;
            scenario.duration_s = s["duration_s"] ? s["duration_s"].as<double>() : scenario.duration_s;
            scenario.start_hours = s["start_hours"] ? s["start_hours"].as<double>() : scenario.start_hours;
            scenario.seed = s["seed"] ? s["seed"].as<uint64_t>() : scenario.seed;
            scenario.threads = s["threads"] ? s["threads"].as<unsigned>() : scenario.threads;
            scenario.csv_out = s["csv_out"].as<std::string>(scenario.csv_out);
        }

        // ====================================================================
        // Environment source
        // ====================================================================
        if (root["environment"]) {
            auto e = root["environment"];
            scenario.environment.type = e["type"].as<std::string>(scenario.environment.type);
            scenario.environment.csv_path = e["csv"].as<std::string>("");
            scenario.environment.script_path = e["script"].as<std::string>("");
        }

        // ====================================================================
        // Sensors
        // ====================================================================
        if (root["sensors"]) {
            auto list = root["sensors"];
            if (!list.IsSequence()) {
                throw ConfigError("[ScenarioConfig] 'sensors' must be a sequence");
            }
            for (const auto& n : list) {
                SensorSpec spec;
                if (!n["id"] || !n["modality"]) {
                    throw ConfigError("[ScenarioConfig] every sensor needs 'id' and 'modality'");
                }
                spec.id = n["id"].as<std::string>();
                spec.modality = n["modality"].as<std::string>();
                spec.position = parse_position(n["position"], spec.id);
                spec.seed = n["seed"] ? n["seed"].as<uint64_t>() : 0;
                spec.enabled = n["enabled"] ? n["enabled"].as<bool>() : true;
                spec.params = n["params"] ? n["params"] : YAML::Node(YAML::NodeType::Map);
                scenario.sensors.push_back(spec);
            }
        }

        scenario.validate();

        LOG_INFO("[ScenarioConfig] Successfully loaded: %s", scenario.name.c_str());
        return scenario;

    } catch (const ConfigError&) {
        throw;
    } catch (const YAML::Exception& e) {
        throw ConfigError(
            std::string("[ScenarioConfig] YAML parse error: ") + e.what()
        );
    }
}

ScenarioConfig ScenarioConfig::get_default() {
    ScenarioConfig scenario;

    scenario.name = "substation-default";
    scenario.dt_s = 1.0;
    scenario.duration_s = 60.0;
    scenario.seed = 42;
    scenario.threads = 2;

    scenario.environment.type = "static";
    scenario.environment.csv_path = "config/environments/substation.csv";

    SensorSpec emf;
    emf.id = "emf-01";
    emf.modality = "emf";
    emf.position = {0.0, 0.0, 10.0};
    emf.params = YAML::Node(YAML::NodeType::Map);
    emf.params["noise_characteristics"]["stddev"] = 0.5;
    scenario.sensors.push_back(emf);

    SensorSpec thermal;
    thermal.id = "thermal-01";
    thermal.modality = "thermal";
    thermal.position = {2.0, 0.0, 3.0};
    thermal.params = YAML::Node(YAML::NodeType::Map);
    thermal.params["noise_characteristics"]["stddev"] = 0.2;
    thermal.params["resolution"] = 0.1;
    scenario.sensors.push_back(thermal);

    return scenario;
}

void ScenarioConfig::validate() const {
    if (dt_s <= 0.0) {
        throw ConfigError("[ScenarioConfig] Invalid dt_s: must be > 0");
    }
    if (duration_s < 0.0) {
        throw ConfigError("[ScenarioConfig] Invalid duration_s: must be >= 0");
    }
    if (start_hours < 0.0) {
        throw ConfigError("[ScenarioConfig] Invalid start_hours: must be >= 0");
    }
    if (threads == 0) {
        throw ConfigError("[ScenarioConfig] Invalid threads: must be >= 1");
    }

    if (environment.type == "static") {
        // empty csv_path = empty environment
    } else if (environment.type == "lua") {
        if (environment.script_path.empty()) {
            throw ConfigError("[ScenarioConfig] Lua environment needs 'script'");
        }
    } else {
        throw ConfigError("[ScenarioConfig] Unknown environment type: " + environment.type);
    }

    std::set<std::string> ids;
    for (const auto& s : sensors) {
        if (s.id.empty()) {
            throw ConfigError("[ScenarioConfig] Sensor id must not be empty");
        }
        if (!ids.insert(s.id).second) {
            throw ConfigError("[ScenarioConfig] Duplicate sensor id: " + s.id);
        }
        Modality m;
        if (!parse_modality(s.modality, m)) {
            throw ConfigError("[ScenarioConfig] Sensor " + s.id + ": unknown modality '" + s.modality + "'");
        }
    }

    LOG_DEBUG("[ScenarioConfig] Validation passed");
}

void ScenarioConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Scenario Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    LOG_INFO("Timing: dt=%.3f s, duration=%.1f s, start at %.2f h", dt_s, duration_s, start_hours);
    LOG_INFO("Seed: %llu, threads: %u", static_cast<unsigned long long>(seed), threads);
    if (environment.type == "lua") {
        LOG_INFO("Environment: lua (%s)", environment.script_path.c_str());
    } else {
        LOG_INFO("Environment: static (%s)",
                 environment.csv_path.empty() ? "empty" : environment.csv_path.c_str());
    }
    LOG_INFO("----------------------------------------");
    for (const auto& s : sensors) {
        LOG_INFO("  %-14s %-12s (%.1f, %.1f, %.1f)%s", s.id.c_str(), s.modality.c_str(),
                 s.position.x, s.position.y, s.position.z, s.enabled ? "" : " [disabled]");
    }
    LOG_INFO("Output: %s", csv_out.c_str());
    LOG_INFO("========================================");
}

} // namespace config
