// src/config/sensor_config.hpp
#pragma once

#include "config/config_error.hpp"
#include "config/modality.hpp"
#include "utils/vec3.hpp"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace YAML {
class Node;
}

namespace config {

// ============================================================================
// Stage parameters
// ============================================================================

struct FrequencyAnalysisParams {
    double base_frequency_hz = 60.0;
    std::array<double, 4> harmonic_ratios{{0.1, 0.1, 0.1, 0.1}};  // 3rd, 5th, 7th, 9th
    bool frequency_noise = true;
    double frequency_noise_stddev = 0.02;
    double corona_hf_noise_factor = 0.15;
    std::string hf_noise_trigger_field = "corona_discharge";
    bool enable_spectrum_output = true;
};

constexpr std::array<int, 4> kHarmonicOrders{{3, 5, 7, 9}};

struct FrequencyResponseParams {
    std::map<std::string, double> curve;               // component -> multiplier (unlisted = 1.0)
    double temp_coeff_per_10c = 0.001;
    double ref_temp_c = 25.0;
    std::vector<std::pair<double, double>> frequency_gain;  // (frequency_hz, gain)
    double frequency_tolerance_hz = 1.0;
    double default_frequency_gain = 1.0;
};

struct AxisMisalignmentParams {
    bool enabled = false;
    double degrees = 1.0;
};

struct DirectionalParams {
    utils::Vec3 orientation{0.0, 0.0, 1.0};
    bool orientation_uncertainty = true;
    double orientation_uncertainty_stddev = 0.05;
    bool apply_to_scalar = false;
    utils::Vec3 assumed_field_direction{0.0, 0.0, 1.0};
};

struct InterferenceParams {
    double radius_m = 50.0;
    double frequency_coupling_factor = 1000.0;
    double spectrum_impact_factor = 0.1;
    double field_strength_impact_factor = 1.0;
    double field_strength_random_stddev = 0.2;
};

struct CalibrationParams {
    double gain_error_factor = 1.0;
    double gain_drift_percent_per_hour = 0.0001;
    double offset = 0.0;
    double offset_drift_per_hour = 0.01;
    double nonlinearity_factor = 0.0001;
};

struct NoiseParams {
    std::string type = "gaussian";   // gaussian | none
    double mean = 0.0;
    double stddev = 0.0;
};

// ============================================================================
// Ground-truth rules
// ============================================================================

/**
 * ConditionRule - Label raised while an environment field is present and non-zero
 *
 * Overridable as <key>_field, <key>_severity_scale, <key>_confidence.
 */
struct ConditionRule {
    std::string key;
    std::string anomaly_type;
    std::string field;
    double severity_scale = 1.0;
    double confidence = 1.0;
};

/**
 * ThresholdRule - Label raised while the observed value exceeds a threshold
 *
 * Overridable as <key>_threshold, <key>_severity_scale, <key>_confidence.
 */
struct ThresholdRule {
    std::string key;
    std::string anomaly_type;
    double threshold = 0.0;
    double severity_scale = 1.0;
    double confidence = 1.0;
};

// ============================================================================
// SensorConfig
// ============================================================================

/**
 * SensorConfig - Fully resolved parameters of one sensor
 *
 * Usage:
 *   YAML::Node overrides = YAML::Load("{base_frequency: 50.0, harmonic_3_ratio: 0.15}");
 *   auto cfg = SensorConfig::resolve("emf-01", Modality::Emf, overrides);
 *
 * Every key not present in the overrides falls back to the modality
 * default table. Unknown keys are ignored (logged at DEBUG).
 * Resolved once per sensor; stages only read it.
 */
class SensorConfig {
public:
    std::string sensor_id;
    Modality modality = Modality::Emf;

    std::optional<std::pair<double, double>> frequency_range_hz;

    FrequencyAnalysisParams analysis;
    FrequencyResponseParams response;
    AxisMisalignmentParams misalignment;
    DirectionalParams directional;
    InterferenceParams interference;
    std::map<std::string, double> cross_sensitivity;   // interferent field -> factor
    CalibrationParams calibration;
    double baseline_drift_per_hour = 0.0;
    NoiseParams noise;

    double resolution = 0.0;        // ADC quantum, 0 = none
    std::string target_chemical;    // chemical only

    std::vector<ConditionRule> conditions;
    std::vector<ThresholdRule> thresholds;

    /**
     * Resolve overrides against the modality defaults
     * @throws ConfigError on wrong value types or values outside their domain
     */
    static SensorConfig resolve(const std::string& sensor_id, Modality modality,
                                const YAML::Node& overrides);

    /**
     * Modality default table (not validated: chemical has no target yet)
     */
    static SensorConfig get_default(Modality modality);

    /**
     * @throws ConfigError if any parameter is invalid
     */
    void validate() const;

    /** Log the resolved parameters at DEBUG level */
    void print_summary() const;

    ConditionRule* find_condition(const std::string& key);
    ThresholdRule* find_threshold(const std::string& key);

    SensorConfig() = default;
};

} // namespace config
