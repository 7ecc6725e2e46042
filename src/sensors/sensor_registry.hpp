// src/sensors/sensor_registry.hpp
#pragma once

#include "config/scenario_config.hpp"
#include "sensors/sensor_base.hpp"
#include <memory>

namespace sensors {

/**
 * make_sensor() - Build a sensor from its scenario entry
 *
 * Resolves spec.params against the modality defaults.
 *
 * @throws config::ConfigError for an unknown modality or invalid params
 */
std::unique_ptr<SensorBase> make_sensor(const config::SensorSpec& spec);

} // namespace sensors
