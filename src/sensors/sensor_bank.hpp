// src/sensors/sensor_bank.hpp
#pragma once

#include "config/scenario_config.hpp"
#include "env/environment_query.hpp"
#include "sensors/sensor_base.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sensors {

/**
 * SensorBankConfig - How the bank builds and samples its sensors
 */
struct SensorBankConfig {
    unsigned threads = 1;       // worker threads per timestep

    // Global random seed (0 = random); sensors without their own seed get
    // random_seed + index + 1
    uint64_t random_seed = 0;
};

/**
 * SensorBank - Manages all sensors in the simulation
 *
 * Responsibilities:
 * - Create sensors from scenario entries
 * - Sample every enabled sensor each timestep, in parallel
 * - Return samples in registration order regardless of thread count
 */
class SensorBank {
public:
    explicit SensorBank(const SensorBankConfig& cfg = {})
        : cfg_(cfg) {}

    SensorBank(const SensorBank&) = delete;
    SensorBank& operator=(const SensorBank&) = delete;

    /**
     * Create and add one sensor per spec
     * @throws config::ConfigError if any spec is invalid
     */
    void build(const std::vector<config::SensorSpec>& specs);

    void add_sensor(std::unique_ptr<SensorBase> sensor);

    /**
     * Sample all enabled sensors for one timestep
     *
     * Sensors are split across cfg.threads workers by index; the result
     * is identical to a serial run.
     */
    std::vector<LabeledSample> sample_all(const env::EnvironmentQuery& env,
                                          uint64_t timestamp_usec,
                                          double elapsed_hours);

    /**
     * Reset all sensors
     */
    void reset();

    /**
     * Get individual sensor by id (for debugging)
     */
    SensorBase* get_sensor(const std::string& id);

    /**
     * Metadata of every sensor (disabled ones included), in registration order
     */
    std::vector<SensorMetadata> metadata() const;

    size_t sensor_count() const { return sensors_.size(); }
    size_t enabled_count() const;

    unsigned threads() const { return cfg_.threads; }
    void set_threads(unsigned n) { cfg_.threads = n == 0 ? 1 : n; }

private:
    SensorBankConfig cfg_;
    std::vector<std::unique_ptr<SensorBase>> sensors_;
};

} // namespace sensors
