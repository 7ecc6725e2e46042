// src/sensors/sensor_out.hpp
#pragma once

#include "config/modality.hpp"
#include "config/sensor_config.hpp"
#include "labels/anomaly_label.hpp"
#include "stages/imperfection_stage.hpp"
#include "utils/vec3.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sensors {

/**
 * IdealReading - True field value at the sensor position
 */
struct IdealReading {
    double magnitude = 0.0;
    std::optional<utils::Vec3> field_vector;
    std::optional<double> dominant_frequency_hz;
};

/**
 * ObservedReading - What the instrument reports
 */
struct ObservedReading {
    std::string sensor_id;
    config::Modality modality = config::Modality::Emf;
    uint64_t timestamp_usec = 0;
    utils::Vec3 position;

    std::string quantity;                       // e.g. "ac_field_strength_v_per_m"
    double value = 0.0;
    std::optional<stages::Spectrum> spectrum;   // absent when spectrum output is off
};

/**
 * LabeledSample - One record per sensor per timestep
 */
struct LabeledSample {
    std::string sensor_id;
    uint64_t timestamp_usec = 0;
    utils::Vec3 position;
    config::Modality modality = config::Modality::Emf;

    ObservedReading observed;
    std::vector<labels::AnomalyLabel> ground_truth;
};

/**
 * SensorMetadata - Static description of a sensor, exported next to its samples
 *
 * Lets a training pipeline interpret the readings: which effects were
 * applied, with which noise, drift and frequency parameters, and which
 * label rules produced the ground truth.
 */
struct SensorMetadata {
    std::string sensor_id;
    config::Modality modality = config::Modality::Emf;
    utils::Vec3 position;
    bool enabled = true;
    uint64_t seed = 0;

    std::string quantity;
    double min_value = 0.0;
    double max_value = 0.0;            // may be +inf
    bool spectrum_output = false;      // samples carry a spectrum

    std::vector<std::string> stages;   // execution order
    config::SensorConfig params;       // resolved parameters
};

} // namespace sensors
