// src/config/sensor_config.cpp
#include "config/sensor_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <set>

namespace config {

namespace {

/**
 * OverrideReader - Typed access to one override mapping
 *
 * Every key read is remembered so the leftovers can be reported as
 * unknown. Type mismatches become ConfigError naming the sensor and key.
 */
class OverrideReader {
public:
    OverrideReader(const YAML::Node& node, std::string sensor_id, std::string prefix = "")
        : node_(node), sensor_id_(std::move(sensor_id)), prefix_(std::move(prefix))
    {
        if (node_ && !node_.IsNull() && !node_.IsMap()) {
            fail(prefix_.empty() ? "params" : prefix_, "must be a mapping");
        }
    }

    bool has(const std::string& key) {
        used_.insert(key);
        return node_ && node_.IsMap() && node_[key];
    }

    double num(const std::string& key, double def) {
        if (!has(key)) return def;
        try {
            return node_[key].as<double>();
        } catch (const YAML::Exception&) {
            fail(key, "must be a number");
        }
        return def;
    }

    bool flag(const std::string& key, bool def) {
        if (!has(key)) return def;
        try {
            return node_[key].as<bool>();
        } catch (const YAML::Exception&) {
            fail(key, "must be a boolean");
        }
        return def;
    }

    std::string str(const std::string& key, const std::string& def) {
        if (!has(key)) return def;
        const YAML::Node v = node_[key];
        if (!v.IsScalar()) {
            fail(key, "must be a string");
        }
        return v.as<std::string>();
    }

    utils::Vec3 vec3(const std::string& key, const utils::Vec3& def) {
        if (!has(key)) return def;
        const YAML::Node v = node_[key];
        if (!v.IsSequence() || v.size() != 3) {
            fail(key, "must be a sequence of 3 numbers");
        }
        try {
            return {v[0].as<double>(), v[1].as<double>(), v[2].as<double>()};
        } catch (const YAML::Exception&) {
            fail(key, "must be a sequence of 3 numbers");
        }
        return def;
    }

    std::optional<std::pair<double, double>> range(const std::string& key,
                                                   std::optional<std::pair<double, double>> def) {
        if (!has(key)) return def;
        const YAML::Node v = node_[key];
        if (!v.IsSequence() || v.size() != 2) {
            fail(key, "must be a [min, max] pair");
        }
        try {
            return std::make_pair(v[0].as<double>(), v[1].as<double>());
        } catch (const YAML::Exception&) {
            fail(key, "must be a [min, max] pair of numbers");
        }
        return def;
    }

    // Mapping of name -> number; replaces the default wholesale
    std::map<std::string, double> num_map(const std::string& key,
                                          const std::map<std::string, double>& def) {
        if (!has(key)) return def;
        const YAML::Node v = node_[key];
        if (!v.IsMap()) {
            fail(key, "must be a mapping of name to number");
        }
        std::map<std::string, double> out;
        for (const auto& kv : v) {
            const std::string name = kv.first.as<std::string>();
            try {
                out[name] = kv.second.as<double>();
            } catch (const YAML::Exception&) {
                fail(key + "." + name, "must be a number");
            }
        }
        return out;
    }

    std::vector<std::pair<double, double>> freq_table(const std::string& key,
                                                      const std::vector<std::pair<double, double>>& def) {
        if (!has(key)) return def;
        const YAML::Node v = node_[key];
        if (!v.IsMap()) {
            fail(key, "must be a mapping of frequency to gain");
        }
        std::vector<std::pair<double, double>> out;
        for (const auto& kv : v) {
            try {
                out.emplace_back(kv.first.as<double>(), kv.second.as<double>());
            } catch (const YAML::Exception&) {
                fail(key + "." + kv.first.as<std::string>(), "frequency and gain must be numbers");
            }
        }
        return out;
    }

    OverrideReader child(const std::string& key) {
        has(key);
        return OverrideReader(node_ && node_.IsMap() ? node_[key] : YAML::Node(),
                              sensor_id_, prefix_.empty() ? key : prefix_ + "." + key);
    }

    void log_unknown() const {
        if (!node_ || !node_.IsMap()) return;
        for (const auto& kv : node_) {
            const std::string key = kv.first.as<std::string>();
            if (used_.count(key) == 0) {
                LOG_DEBUG("[SensorConfig] %s: ignoring unknown key '%s%s'",
                          sensor_id_.c_str(), prefix_.empty() ? "" : (prefix_ + ".").c_str(),
                          key.c_str());
            }
        }
    }

private:
    [[noreturn]] void fail(const std::string& key, const char* why) const {
        throw ConfigError("[SensorConfig] " + sensor_id_ + ": '" +
                          (prefix_.empty() || key == prefix_ ? key : prefix_ + "." + key) +
                          "' " + why);
    }

    const YAML::Node node_;
    std::string sensor_id_;
    std::string prefix_;
    std::set<std::string> used_;
};

void require(bool ok, const std::string& sensor_id, const std::string& what) {
    if (!ok) {
        throw ConfigError("[SensorConfig] " + sensor_id + ": invalid " + what);
    }
}

} // namespace

// ============================================================================
// Modality default tables
// ============================================================================

SensorConfig SensorConfig::get_default(Modality modality) {
    SensorConfig cfg;
    cfg.modality = modality;

    switch (modality) {
        case Modality::Emf:
            cfg.frequency_range_hz = std::make_pair(50.0, 60.0);
            cfg.analysis.base_frequency_hz = 60.0;
            cfg.conditions = {
                {"corona", "corona_discharge", "corona_discharge", 100.0, 0.9},
                {"arcing", "arcing", "arcing_intensity", 50.0, 0.85},
            };
            cfg.thresholds = {
                {"overload", "overload", 500.0, 1.0, 0.95},
            };
            break;

        case Modality::Acoustic:
            cfg.frequency_range_hz = std::make_pair(20.0, 20000.0);
            cfg.analysis.base_frequency_hz = 1000.0;
            cfg.analysis.hf_noise_trigger_field = "arcing_intensity";
            cfg.calibration.offset_drift_per_hour = 0.0;
            cfg.conditions = {
                {"arcing", "arcing", "arcing_intensity", 50.0, 0.8},
                {"corona", "corona_discharge", "corona_discharge", 100.0, 0.7},
            };
            cfg.thresholds = {
                {"acoustic_overload", "acoustic_overload", 120.0, 1.0, 0.9},
            };
            break;

        case Modality::Particulate:
            cfg.analysis.enable_spectrum_output = false;
            cfg.conditions = {
                {"smoke", "smoke", "smoke_density", 10.0, 0.85},
            };
            cfg.thresholds = {
                {"pm_exceedance", "pm_exceedance", 35.0, 1.0, 0.9},
            };
            break;

        case Modality::Thermal:
            cfg.analysis.enable_spectrum_output = false;
            cfg.calibration.offset_drift_per_hour = 0.001;
            cfg.conditions = {
                {"hotspot", "hotspot", "hotspot_intensity", 10.0, 0.9},
            };
            cfg.thresholds = {
                {"overtemperature", "overtemperature", 80.0, 1.0, 0.9},
            };
            break;

        case Modality::Chemical:
            cfg.analysis.enable_spectrum_output = false;
            cfg.conditions = {
                {"leak", "chemical_leak", "chemical_leak", 10.0, 0.9},
            };
            cfg.thresholds = {
                {"toxic", "toxic_exceedance", 50.0, 1.0, 0.9},
            };
            break;
    }

    return cfg;
}

// ============================================================================
// Resolution
// ============================================================================

SensorConfig SensorConfig::resolve(const std::string& sensor_id, Modality modality,
                                   const YAML::Node& overrides) {
    SensorConfig cfg = get_default(modality);
    cfg.sensor_id = sensor_id;

    OverrideReader r(overrides, sensor_id);

    cfg.frequency_range_hz = r.range("frequency_range_hz", cfg.frequency_range_hz);

    // Spectrum analysis
    auto& fa = cfg.analysis;
    fa.base_frequency_hz = r.num("base_frequency", fa.base_frequency_hz);
    for (size_t i = 0; i < kHarmonicOrders.size(); ++i) {
        const std::string key = "harmonic_" + std::to_string(kHarmonicOrders[i]) + "_ratio";
        fa.harmonic_ratios[i] = r.num(key, fa.harmonic_ratios[i]);
    }
    fa.frequency_noise = r.flag("frequency_noise", fa.frequency_noise);
    fa.frequency_noise_stddev = r.num("frequency_noise_stddev", fa.frequency_noise_stddev);
    fa.corona_hf_noise_factor = r.num("corona_hf_noise_factor", fa.corona_hf_noise_factor);
    fa.hf_noise_trigger_field = r.str("hf_noise_trigger_field", fa.hf_noise_trigger_field);
    fa.enable_spectrum_output = r.flag("enable_spectrum_output", fa.enable_spectrum_output);

    // Frequency response
    auto& fr = cfg.response;
    fr.curve = r.num_map("frequency_response_curve", fr.curve);
    fr.temp_coeff_per_10c = r.num("frequency_response_temp_coeff_per_10c", fr.temp_coeff_per_10c);
    fr.ref_temp_c = r.num("frequency_response_ref_temp_c", fr.ref_temp_c);
    fr.frequency_gain = r.freq_table("frequency_response_gain", fr.frequency_gain);
    fr.frequency_tolerance_hz = r.num("frequency_tolerance_hz", fr.frequency_tolerance_hz);
    fr.default_frequency_gain = r.num("default_frequency_gain", fr.default_frequency_gain);

    cfg.misalignment.enabled = r.flag("axis_misalignment_effect_on_spectrum", cfg.misalignment.enabled);
    cfg.misalignment.degrees = r.num("axis_misalignment_degrees", cfg.misalignment.degrees);

    // Directional sensitivity
    auto& ds = cfg.directional;
    ds.orientation = r.vec3("orientation", ds.orientation);
    ds.orientation_uncertainty = r.flag("orientation_uncertainty", ds.orientation_uncertainty);
    ds.orientation_uncertainty_stddev = r.num("orientation_uncertainty_stddev", ds.orientation_uncertainty_stddev);
    ds.apply_to_scalar = r.flag("apply_directional_sensitivity_to_scalar", ds.apply_to_scalar);
    ds.assumed_field_direction = r.vec3("assumed_dominant_field_direction", ds.assumed_field_direction);

    // Interference
    auto& ic = cfg.interference;
    {
        OverrideReader emi = r.child("emi_sources_config");
        ic.radius_m = emi.num("radius_m", ic.radius_m);
        emi.log_unknown();
    }
    ic.frequency_coupling_factor = r.num("emi_frequency_coupling_factor", ic.frequency_coupling_factor);
    ic.spectrum_impact_factor = r.num("emi_spectrum_impact_factor", ic.spectrum_impact_factor);
    ic.field_strength_impact_factor = r.num("emi_field_strength_impact_factor", ic.field_strength_impact_factor);
    ic.field_strength_random_stddev = r.num("emi_field_strength_random_stddev", ic.field_strength_random_stddev);

    cfg.cross_sensitivity = r.num_map("cross_sensitivity", cfg.cross_sensitivity);

    // Calibration & drift
    auto& cal = cfg.calibration;
    cal.gain_error_factor = r.num("calibration_gain_error_factor", cal.gain_error_factor);
    cal.gain_drift_percent_per_hour = r.num("calibration_gain_drift_percent_per_hour", cal.gain_drift_percent_per_hour);
    cal.offset = r.num("calibration_offset", cal.offset);
    cal.offset_drift_per_hour = r.num("calibration_offset_drift_per_hour", cal.offset_drift_per_hour);
    cal.nonlinearity_factor = r.num("calibration_nonlinearity_factor", cal.nonlinearity_factor);
    {
        OverrideReader drift = r.child("drift_parameters");
        cfg.baseline_drift_per_hour = drift.num("baseline_drift_per_hour", cfg.baseline_drift_per_hour);
        drift.log_unknown();
    }

    // Noise
    {
        OverrideReader nc = r.child("noise_characteristics");
        cfg.noise.type = nc.str("type", cfg.noise.type);
        cfg.noise.mean = nc.num("mean", cfg.noise.mean);
        cfg.noise.stddev = nc.num("stddev", cfg.noise.stddev);
        nc.log_unknown();
    }

    cfg.resolution = r.num("resolution", cfg.resolution);
    cfg.target_chemical = r.str("target_chemical", cfg.target_chemical);

    // Ground-truth rules
    for (auto& rule : cfg.conditions) {
        rule.field = r.str(rule.key + "_field", rule.field);
        rule.severity_scale = r.num(rule.key + "_severity_scale", rule.severity_scale);
        rule.confidence = r.num(rule.key + "_confidence", rule.confidence);
    }
    for (auto& rule : cfg.thresholds) {
        rule.threshold = r.num(rule.key + "_threshold", rule.threshold);
        rule.severity_scale = r.num(rule.key + "_severity_scale", rule.severity_scale);
        rule.confidence = r.num(rule.key + "_confidence", rule.confidence);
    }

    r.log_unknown();

    cfg.validate();

    LOG_DEBUG("[SensorConfig] %s resolved (%s)", sensor_id.c_str(), to_string(modality));
    return cfg;
}

// ============================================================================
// Validation
// ============================================================================

void SensorConfig::validate() const {
    const std::string& id = sensor_id;

    if (frequency_range_hz) {
        require(frequency_range_hz->first > 0.0 && frequency_range_hz->first < frequency_range_hz->second,
                id, "frequency_range_hz: must satisfy 0 < min < max");
    }

    require(analysis.base_frequency_hz > 0.0, id, "base_frequency: must be > 0");
    for (size_t i = 0; i < analysis.harmonic_ratios.size(); ++i) {
        require(analysis.harmonic_ratios[i] >= 0.0, id,
                "harmonic_" + std::to_string(kHarmonicOrders[i]) + "_ratio: must be >= 0");
    }
    require(analysis.frequency_noise_stddev >= 0.0, id, "frequency_noise_stddev: must be >= 0");
    require(analysis.corona_hf_noise_factor >= 0.0, id, "corona_hf_noise_factor: must be >= 0");

    for (const auto& kv : response.curve) {
        require(kv.second >= 0.0, id, "frequency_response_curve." + kv.first + ": must be >= 0");
    }
    for (const auto& fg : response.frequency_gain) {
        require(fg.first > 0.0, id, "frequency_response_gain: frequencies must be > 0");
        require(fg.second >= 0.0, id, "frequency_response_gain: gains must be >= 0");
    }
    require(response.frequency_tolerance_hz >= 0.0, id, "frequency_tolerance_hz: must be >= 0");
    require(response.default_frequency_gain >= 0.0, id, "default_frequency_gain: must be >= 0");

    require(directional.orientation_uncertainty_stddev >= 0.0, id,
            "orientation_uncertainty_stddev: must be >= 0");

    require(interference.radius_m >= 0.0, id, "emi_sources_config.radius_m: must be >= 0");
    require(interference.frequency_coupling_factor > 0.0, id, "emi_frequency_coupling_factor: must be > 0");
    require(interference.spectrum_impact_factor >= 0.0, id, "emi_spectrum_impact_factor: must be >= 0");
    require(interference.field_strength_impact_factor >= 0.0, id,
            "emi_field_strength_impact_factor: must be >= 0");
    require(interference.field_strength_random_stddev >= 0.0, id,
            "emi_field_strength_random_stddev: must be >= 0");

    require(noise.type == "gaussian" || noise.type == "none", id,
            "noise_characteristics.type: must be 'gaussian' or 'none'");
    require(noise.stddev >= 0.0, id, "noise_characteristics.stddev: must be >= 0");

    require(resolution >= 0.0, id, "resolution: must be >= 0");

    if (modality == Modality::Chemical) {
        require(!target_chemical.empty(), id, "target_chemical: required for chemical sensors");
    }

    for (const auto& rule : conditions) {
        require(!rule.field.empty(), id, rule.key + "_field: must not be empty");
        require(rule.severity_scale >= 0.0, id, rule.key + "_severity_scale: must be >= 0");
        require(rule.confidence >= 0.0 && rule.confidence <= 1.0, id,
                rule.key + "_confidence: must be in [0, 1]");
    }
    for (const auto& rule : thresholds) {
        require(std::isfinite(rule.threshold), id, rule.key + "_threshold: must be finite");
        require(rule.severity_scale >= 0.0, id, rule.key + "_severity_scale: must be >= 0");
        require(rule.confidence >= 0.0 && rule.confidence <= 1.0, id,
                rule.key + "_confidence: must be in [0, 1]");
    }

    LOG_DEBUG("[SensorConfig] %s: validation passed", id.c_str());
}

void SensorConfig::print_summary() const {
    LOG_DEBUG("----------------------------------------");
    LOG_DEBUG("Sensor: %s (%s)", sensor_id.c_str(), to_string(modality));
    if (frequency_range_hz) {
        LOG_DEBUG("  Band: %.1f - %.1f Hz, base %.1f Hz",
                 frequency_range_hz->first, frequency_range_hz->second, analysis.base_frequency_hz);
    }
    if (modality == Modality::Chemical) {
        LOG_DEBUG("  Target: %s (%zu interferents)", target_chemical.c_str(), cross_sensitivity.size());
    }
    LOG_DEBUG("  Calibration: gain %.4f (+%.5f %%/h), offset %.3f (+%.4f /h)",
             calibration.gain_error_factor, calibration.gain_drift_percent_per_hour,
             calibration.offset, calibration.offset_drift_per_hour);
    LOG_DEBUG("  Noise: %s mean=%.3f stddev=%.3f, resolution %.4f",
             noise.type.c_str(), noise.mean, noise.stddev, resolution);
    LOG_DEBUG("  Labels: %zu condition, %zu threshold", conditions.size(), thresholds.size());
}

ConditionRule* SensorConfig::find_condition(const std::string& key) {
    for (auto& rule : conditions) {
        if (rule.key == key) return &rule;
    }
    return nullptr;
}

ThresholdRule* SensorConfig::find_threshold(const std::string& key) {
    for (auto& rule : thresholds) {
        if (rule.key == key) return &rule;
    }
    return nullptr;
}

} // namespace config
