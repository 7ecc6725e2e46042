// src/sim/scenario_runner.hpp
#pragma once

#include "config/scenario_config.hpp"
#include "env/environment_query.hpp"
#include "env/lua_environment.hpp"
#include "sensors/sensor_bank.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace sim {

struct RunnerOptions {
    std::string debug_log_path;       // empty = stderr only
};

/**
 * ScenarioRunner - Drives sensors through a scenario timeline
 *
 * Per timestep:
 *   timestamp_usec = round(iter * dt_s * 1e6)
 *   elapsed_hours  = start_hours + iter * dt_s / 3600
 * every enabled sensor produces one LabeledSample, written as a CSV row.
 * run() also writes the sensor metadata next to the CSV.
 */
class ScenarioRunner {
public:
    explicit ScenarioRunner(config::ScenarioConfig cfg, RunnerOptions opts = {});

    /**
     * Build environment and sensors
     * @throws config::ConfigError for invalid sensor parameters
     * @throws std::runtime_error if the environment cannot be loaded
     */
    void init();

    /**
     * Use a caller-owned environment instead of the configured one
     * (must outlive the runner)
     */
    void set_environment(const env::EnvironmentQuery* env) { env_ = env; }

    /**
     * Sample all sensors for one iteration
     */
    std::vector<sensors::LabeledSample> step(uint64_t iter);

    /**
     * Full timeline + CSV output (calls init() if not done yet)
     * @return process exit code
     */
    int run();

    size_t iteration_count() const;

    const sensors::SensorBank& bank() const { return bank_; }

    static void write_csv_header(std::ostream& os);
    static void write_csv_row(std::ostream& os, const sensors::LabeledSample& s);

    /**
     * Sensor metadata document (YAML) written beside the samples:
     * scenario timing plus, per sensor, noise, drift, frequency and
     * label-rule parameters
     */
    static void write_metadata(std::ostream& os, const config::ScenarioConfig& scenario,
                               const std::vector<sensors::SensorMetadata>& sensors);

    /** <csv_path>.meta.yaml */
    static std::string metadata_path(const std::string& csv_path);

private:
    config::ScenarioConfig cfg_;
    RunnerOptions opts_;

    std::unique_ptr<env::EnvironmentQuery> owned_env_;
    env::LuaEnvironment* lua_env_ = nullptr;
    const env::EnvironmentQuery* env_ = nullptr;

    sensors::SensorBank bank_;
    bool ready_ = false;
};

} // namespace sim
