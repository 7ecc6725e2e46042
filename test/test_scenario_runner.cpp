// test/test_scenario_runner.cpp
#include "sim/scenario_runner.hpp"
#include "env/static_environment.hpp"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdio>
#include <cmath>
#include <cstdint>
#include <string>

// ANSI color codes
#define COLOR_GREEN "\033[32m"
#define COLOR_RED "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET "\033[0m"

const char* kQuiet = R"(
frequency_noise: false
orientation_uncertainty: false
calibration_gain_drift_percent_per_hour: 0.0
calibration_offset_drift_per_hour: 0.0
calibration_nonlinearity_factor: 0.0
noise_characteristics:
  stddev: 0.0
)";

config::ScenarioConfig make_scenario() {
    config::ScenarioConfig scenario;
    scenario.name = "runner-test";
    scenario.dt_s = 0.5;
    scenario.duration_s = 2.0;
    scenario.start_hours = 10.0;
    scenario.seed = 5;
    scenario.threads = 2;
    scenario.csv_out = "/tmp/test_twinsense_runner.csv";

    config::SensorSpec emf;
    emf.id = "emf-01";
    emf.modality = "emf";
    emf.position = {0.0, 0.0, 10.0};
    emf.params = YAML::Load(kQuiet);
    scenario.sensors.push_back(emf);

    config::SensorSpec thermal;
    thermal.id = "thermal-01";
    thermal.modality = "thermal";
    thermal.position = {5.0, 0.0, 1.0};
    thermal.params = YAML::Load(kQuiet);
    thermal.params["drift_parameters"]["baseline_drift_per_hour"] = 1.0;
    scenario.sensors.push_back(thermal);

    return scenario;
}

env::StaticEnvironment make_environment() {
    env::StaticEnvironment e;
    e.set_uniform("ac_field_strength", 340.0);
    e.set_uniform("corona_discharge", 0.4);
    e.set_uniform("temperature_celsius", 20.0);
    return e;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool test_step_timing() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 1: Step Timing ===" << COLOR_RESET << "\n";

    auto environment = make_environment();
    sim::ScenarioRunner runner(make_scenario());
    runner.set_environment(&environment);
    runner.init();

    auto samples = runner.step(3);

    bool pass = runner.iteration_count() == 5 &&
                samples.size() == 2 &&
                samples[0].timestamp_usec == 1500000 &&
                samples[0].sensor_id == "emf-01" &&
                samples[1].sensor_id == "thermal-01";

    // thermal: 20 C + 1.0/h baseline drift after 10 h (+ 1.5 s)
    const double expected = 20.0 + 10.0 + 1.5 / 3600.0;
    pass = pass && std::abs(samples[1].observed.value - expected) < 1e-9;

    std::cout << "  Iterations: " << runner.iteration_count() << "\n";
    std::cout << "  Step 3 timestamp: " << (samples.empty() ? 0 : samples[0].timestamp_usec) << " us\n";
    std::cout << "  Thermal with drift: " << (samples.size() > 1 ? samples[1].observed.value : 0.0) << "\n";
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";

    return pass;
}

bool test_csv_rows() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 2: CSV Rows ===" << COLOR_RESET << "\n";

    auto environment = make_environment();
    sim::ScenarioRunner runner(make_scenario());
    runner.set_environment(&environment);
    runner.init();

    auto samples = runner.step(3);
    if (samples.size() != 2) {
        std::cout << "  Result: " << COLOR_RED "FAIL" << COLOR_RESET << " (no samples)\n";
        return false;
    }

    std::ostringstream header;
    sim::ScenarioRunner::write_csv_header(header);

    std::ostringstream emf_row;
    sim::ScenarioRunner::write_csv_row(emf_row, samples[0]);

    std::ostringstream thermal_row;
    sim::ScenarioRunner::write_csv_row(thermal_row, samples[1]);

    size_t columns = 1;
    for (char c : header.str()) {
        if (c == ',') ++columns;
    }

    bool pass = columns == 16 &&
                starts_with(header.str(), "timestamp_usec,sensor_id,modality,x,y,z,quantity,value,spectrum_fundamental") &&
                starts_with(emf_row.str(), "1500000,emf-01,emf,0,0,10,ac_field_strength_v_per_m,340,340,") &&
                ends_with(emf_row.str(), ",0,corona_discharge:40:0.9\n") &&
                ends_with(thermal_row.str(), ",,,,,,,,\n");

    std::cout << "  Header columns: " << columns << "\n";
    std::cout << "  EMF row:     " << emf_row.str();
    std::cout << "  Thermal row: " << thermal_row.str();
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";

    return pass;
}

bool test_full_run() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 3: Full Run To CSV ===" << COLOR_RESET << "\n";

    auto environment = make_environment();
    auto scenario = make_scenario();
    sim::ScenarioRunner runner(scenario);
    runner.set_environment(&environment);

    int rc = runner.run();

    std::ifstream csv(scenario.csv_out);
    size_t lines = 0;
    std::string line;
    while (std::getline(csv, line)) {
        ++lines;
    }
    csv.close();
    std::remove(scenario.csv_out.c_str());

    const std::string meta_path = sim::ScenarioRunner::metadata_path(scenario.csv_out);
    bool meta_ok = false;
    try {
        YAML::Node meta = YAML::LoadFile(meta_path);
        meta_ok = meta["sensors"].size() == 2;
    } catch (const YAML::Exception& e) {
        std::cout << "  Metadata error: " << e.what() << "\n";
    }
    std::remove(meta_path.c_str());

    bool pass = rc == 0 && lines == 11 && meta_ok;   // header + 5 steps * 2 sensors

    std::cout << "  Exit code: " << rc << "\n";
    std::cout << "  CSV lines: " << lines << " (expected 11)\n";
    std::cout << "  Metadata written: " << (meta_ok ? "yes" : "no") << "\n";
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";

    return pass;
}

bool test_metadata_document() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 4: Sensor Metadata Document ===" << COLOR_RESET << "\n";

    auto environment = make_environment();
    auto scenario = make_scenario();
    sim::ScenarioRunner runner(scenario);
    runner.set_environment(&environment);
    runner.init();

    std::ostringstream os;
    sim::ScenarioRunner::write_metadata(os, scenario, runner.bank().metadata());

    bool pass = false;
    try {
        YAML::Node doc = YAML::Load(os.str());
        YAML::Node sensors = doc["sensors"];
        YAML::Node emf = sensors[0];
        YAML::Node thermal = sensors[1];

        pass = doc["scenario"]["name"].as<std::string>() == "runner-test" &&
               doc["scenario"]["dt_s"].as<double>() == 0.5 &&
               sensors.size() == 2 &&
               emf["sensor_id"].as<std::string>() == "emf-01" &&
               emf["type"].as<std::string>() == "emf" &&
               emf["seed"].as<uint64_t>() == 6 &&
               emf["position"][2].as<double>() == 10.0 &&
               emf["enable_spectrum_output"].as<bool>() &&
               emf["frequency_range_hz"][1].as<double>() == 60.0 &&
               emf["noise_characteristics"]["stddev"].as<double>() == 0.0 &&
               emf["pipeline"][0].as<std::string>() == "FrequencyAnalysis" &&
               emf["ground_truth"].size() == 3 &&
               emf["ground_truth"][0]["type"].as<std::string>() == "corona_discharge" &&
               emf["ground_truth"][2]["threshold"].as<double>() == 500.0 &&
               !emf["output_max"] &&
               thermal["sensor_id"].as<std::string>() == "thermal-01" &&
               !thermal["enable_spectrum_output"].as<bool>() &&
               !thermal["frequency_range_hz"] &&
               thermal["drift_parameters"]["baseline_drift_per_hour"].as<double>() == 1.0;
    } catch (const YAML::Exception& e) {
        std::cout << "  YAML error: " << e.what() << "\n";
    }

    std::cout << "  Metadata path: " << sim::ScenarioRunner::metadata_path(scenario.csv_out) << "\n";
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";

    return pass;
}

bool test_init_errors() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 5: Init Errors ===" << COLOR_RESET << "\n";

    bool step_rejected = false;
    try {
        sim::ScenarioRunner runner(make_scenario());
        (void)runner.step(0);
    } catch (const std::logic_error&) {
        step_rejected = true;
    }

    bool missing_table = false;
    try {
        auto scenario = make_scenario();
        scenario.environment.csv_path = "/tmp/nonexistent_twinsense_env.csv";
        sim::ScenarioRunner runner(scenario);
        runner.init();
    } catch (const std::runtime_error&) {
        missing_table = true;
    }

    bool missing_script = false;
    try {
        auto scenario = make_scenario();
        scenario.environment.type = "lua";
        scenario.environment.script_path = "/tmp/nonexistent_twinsense.lua";
        sim::ScenarioRunner runner(scenario);
        runner.init();
    } catch (const std::runtime_error&) {
        missing_script = true;
    }

    bool bad_sensor = false;
    try {
        auto scenario = make_scenario();
        config::SensorSpec gas;
        gas.id = "gas-01";
        gas.modality = "chemical";
        gas.params = YAML::Node(YAML::NodeType::Map);
        scenario.sensors.push_back(gas);
        auto environment = make_environment();
        sim::ScenarioRunner runner(scenario);
        runner.set_environment(&environment);
        runner.init();
    } catch (const config::ConfigError&) {
        bad_sensor = true;
    }

    bool pass = step_rejected && missing_table && missing_script && bad_sensor;

    std::cout << "  step() before init() rejected: " << (step_rejected ? "yes" : "no") << "\n";
    std::cout << "  Missing environment table: " << (missing_table ? "yes" : "no") << "\n";
    std::cout << "  Missing Lua script: " << (missing_script ? "yes" : "no") << "\n";
    std::cout << "  Invalid sensor config: " << (bad_sensor ? "yes" : "no") << "\n";
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";

    return pass;
}

int main() {
    std::cout << COLOR_YELLOW << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║        ScenarioRunner Validation Tests                    ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝" << COLOR_RESET << "\n";

    int passed = 0;
    int total = 0;

    passed += test_step_timing(); total++;
    passed += test_csv_rows(); total++;
    passed += test_full_run(); total++;
    passed += test_metadata_document(); total++;
    passed += test_init_errors(); total++;

    std::cout << "\n" << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n";
    std::cout << "  " << COLOR_YELLOW << "Summary: " << COLOR_RESET;

    if (passed == total) {
        std::cout << COLOR_GREEN << passed << "/" << total << " tests passed ✓" << COLOR_RESET << "\n";
    } else {
        std::cout << COLOR_RED << passed << "/" << total << " tests passed ✗" << COLOR_RESET << "\n";
    }

    std::cout << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n\n";

    return (passed == total) ? 0 : 1;
}
