// src/sensors/sensor_registry.cpp
#include "sensors/sensor_registry.hpp"
#include "config/sensor_config.hpp"
#include "sensors/modality_sensor.hpp"

namespace sensors {

std::unique_ptr<SensorBase> make_sensor(const config::SensorSpec& spec) {
    config::Modality modality;
    if (!config::parse_modality(spec.modality, modality)) {
        throw config::ConfigError("[SensorRegistry] " + spec.id + ": unknown modality '" +
                                  spec.modality + "'");
    }

    auto cfg = config::SensorConfig::resolve(spec.id, modality, spec.params);
    auto sensor = std::make_unique<ModalitySensor>(std::move(cfg), spec.position, spec.seed);
    sensor->set_enabled(spec.enabled);
    return sensor;
}

} // namespace sensors
