// src/sim/scenario_runner.cpp
#include "sim/scenario_runner.hpp"
#include "env/static_environment.hpp"
#include "utils/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace sim {

namespace {

const char* const kSpectrumColumns[] = {
    "fundamental", "3rd", "5th", "7th", "9th", "high_frequency_noise", "emi_noise_floor",
};

void emit_vec3(YAML::Emitter& out, const utils::Vec3& v) {
    out << YAML::Flow << YAML::BeginSeq << v.x << v.y << v.z << YAML::EndSeq;
}

void emit_sensor(YAML::Emitter& out, const sensors::SensorMetadata& m) {
    const config::SensorConfig& c = m.params;

    out << YAML::BeginMap;
    out << YAML::Key << "sensor_id" << YAML::Value << m.sensor_id;
    out << YAML::Key << "type" << YAML::Value << config::to_string(m.modality);
    out << YAML::Key << "position" << YAML::Value;
    emit_vec3(out, m.position);
    out << YAML::Key << "enabled" << YAML::Value << m.enabled;
    out << YAML::Key << "seed" << YAML::Value << m.seed;
    out << YAML::Key << "quantity" << YAML::Value << m.quantity;
    out << YAML::Key << "output_min" << YAML::Value << m.min_value;
    if (std::isfinite(m.max_value)) {
        out << YAML::Key << "output_max" << YAML::Value << m.max_value;
    }
    out << YAML::Key << "resolution" << YAML::Value << c.resolution;

    out << YAML::Key << "pipeline" << YAML::Value << YAML::Flow << m.stages;

    out << YAML::Key << "noise_characteristics" << YAML::Value << YAML::BeginMap
        << YAML::Key << "type" << YAML::Value << c.noise.type
        << YAML::Key << "mean" << YAML::Value << c.noise.mean
        << YAML::Key << "stddev" << YAML::Value << c.noise.stddev
        << YAML::EndMap;

    out << YAML::Key << "drift_parameters" << YAML::Value << YAML::BeginMap
        << YAML::Key << "baseline_drift_per_hour" << YAML::Value << c.baseline_drift_per_hour
        << YAML::Key << "calibration_gain_error_factor" << YAML::Value << c.calibration.gain_error_factor
        << YAML::Key << "calibration_gain_drift_percent_per_hour" << YAML::Value
        << c.calibration.gain_drift_percent_per_hour
        << YAML::Key << "calibration_offset" << YAML::Value << c.calibration.offset
        << YAML::Key << "calibration_offset_drift_per_hour" << YAML::Value << c.calibration.offset_drift_per_hour
        << YAML::Key << "calibration_nonlinearity_factor" << YAML::Value << c.calibration.nonlinearity_factor
        << YAML::EndMap;

    out << YAML::Key << "enable_spectrum_output" << YAML::Value << m.spectrum_output;
    if (c.frequency_range_hz) {
        out << YAML::Key << "frequency_range_hz" << YAML::Value << YAML::Flow << YAML::BeginSeq
            << c.frequency_range_hz->first << c.frequency_range_hz->second << YAML::EndSeq;
        out << YAML::Key << "base_frequency" << YAML::Value << c.analysis.base_frequency_hz;
        for (size_t i = 0; i < config::kHarmonicOrders.size(); ++i) {
            out << YAML::Key << ("harmonic_" + std::to_string(config::kHarmonicOrders[i]) + "_ratio")
                << YAML::Value << c.analysis.harmonic_ratios[i];
        }
        out << YAML::Key << "frequency_response_gain" << YAML::Value << YAML::BeginSeq;
        for (const auto& fg : c.response.frequency_gain) {
            out << YAML::Flow << YAML::BeginSeq << fg.first << fg.second << YAML::EndSeq;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "frequency_tolerance_hz" << YAML::Value << c.response.frequency_tolerance_hz;
        out << YAML::Key << "default_frequency_gain" << YAML::Value << c.response.default_frequency_gain;
    }

    if (m.modality == config::Modality::Chemical) {
        out << YAML::Key << "target_chemical" << YAML::Value << c.target_chemical;
        out << YAML::Key << "cross_sensitivity" << YAML::Value << c.cross_sensitivity;
    }

    out << YAML::Key << "ground_truth" << YAML::Value << YAML::BeginSeq;
    for (const auto& rule : c.conditions) {
        out << YAML::Flow << YAML::BeginMap
            << YAML::Key << "type" << YAML::Value << rule.anomaly_type
            << YAML::Key << "field" << YAML::Value << rule.field
            << YAML::Key << "severity_scale" << YAML::Value << rule.severity_scale
            << YAML::Key << "confidence" << YAML::Value << rule.confidence
            << YAML::EndMap;
    }
    for (const auto& rule : c.thresholds) {
        out << YAML::Flow << YAML::BeginMap
            << YAML::Key << "type" << YAML::Value << rule.anomaly_type
            << YAML::Key << "threshold" << YAML::Value << rule.threshold
            << YAML::Key << "severity_scale" << YAML::Value << rule.severity_scale
            << YAML::Key << "confidence" << YAML::Value << rule.confidence
            << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
}

} // namespace

ScenarioRunner::ScenarioRunner(config::ScenarioConfig cfg, RunnerOptions opts)
    : cfg_(std::move(cfg)),
      opts_(std::move(opts)),
      bank_(sensors::SensorBankConfig{cfg_.threads, cfg_.seed})
{
    if (!opts_.debug_log_path.empty()) {
        utils::open_log_file(opts_.debug_log_path);
    }
}

void ScenarioRunner::init() {
    if (ready_) {
        LOG_WARN("[ScenarioRunner] Already initialized");
        return;
    }

    // ========================================================================
    // Environment
    // ========================================================================
    if (!env_) {
        if (cfg_.environment.type == "lua") {
            auto lua = std::make_unique<env::LuaEnvironment>();
            if (!lua->init(cfg_.environment.script_path)) {
                throw std::runtime_error("[ScenarioRunner] Failed to load Lua environment: " +
                                         cfg_.environment.script_path);
            }
            lua_env_ = lua.get();
            owned_env_ = std::move(lua);
        } else if (!cfg_.environment.csv_path.empty()) {
            owned_env_ = std::make_unique<env::StaticEnvironment>(
                env::StaticEnvironment::load_csv(cfg_.environment.csv_path));
        } else {
            LOG_WARN("[ScenarioRunner] No environment table given, every field reads as absent");
            owned_env_ = std::make_unique<env::StaticEnvironment>();
        }
        env_ = owned_env_.get();
    }

    // ========================================================================
    // Sensors
    // ========================================================================
    bank_.build(cfg_.sensors);

    ready_ = true;
}

size_t ScenarioRunner::iteration_count() const {
    return static_cast<size_t>(std::floor(cfg_.duration_s / cfg_.dt_s + 1e-9)) + 1;
}

std::vector<sensors::LabeledSample> ScenarioRunner::step(uint64_t iter) {
    if (!ready_) {
        throw std::logic_error("[ScenarioRunner] step() before init()");
    }

    const double t_s = static_cast<double>(iter) * cfg_.dt_s;
    const uint64_t timestamp_usec = static_cast<uint64_t>(std::llround(t_s * 1e6));
    const double elapsed_hours = cfg_.start_hours + t_s / 3600.0;

    if (lua_env_) {
        lua_env_->set_time_s(t_s);
    }

    return bank_.sample_all(*env_, timestamp_usec, elapsed_hours);
}

void ScenarioRunner::write_csv_header(std::ostream& os) {
    os << "timestamp_usec,sensor_id,modality,x,y,z,quantity,value";
    for (const char* c : kSpectrumColumns) {
        os << ",spectrum_" << c;
    }
    os << ",labels\n";
}

void ScenarioRunner::write_csv_row(std::ostream& os, const sensors::LabeledSample& s) {
    os << s.timestamp_usec << ","
       << s.sensor_id << ","
       << config::to_string(s.modality) << ","
       << s.position.x << "," << s.position.y << "," << s.position.z << ","
       << s.observed.quantity << ","
       << s.observed.value;

    for (const char* c : kSpectrumColumns) {
        os << ",";
        if (s.observed.spectrum) {
            auto it = s.observed.spectrum->find(c);
            if (it != s.observed.spectrum->end()) {
                os << it->second;
            }
        }
    }

    // type:severity:confidence;...
    os << ",";
    for (size_t i = 0; i < s.ground_truth.size(); ++i) {
        const auto& l = s.ground_truth[i];
        if (i > 0) os << ";";
        os << l.anomaly_type << ":" << l.severity << ":" << l.confidence;
    }
    os << "\n";
}

std::string ScenarioRunner::metadata_path(const std::string& csv_path) {
    return csv_path + ".meta.yaml";
}

void ScenarioRunner::write_metadata(std::ostream& os, const config::ScenarioConfig& scenario,
                                    const std::vector<sensors::SensorMetadata>& sensors) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "scenario" << YAML::Value << YAML::BeginMap
        << YAML::Key << "name" << YAML::Value << scenario.name
        << YAML::Key << "dt_s" << YAML::Value << scenario.dt_s
        << YAML::Key << "duration_s" << YAML::Value << scenario.duration_s
        << YAML::Key << "start_hours" << YAML::Value << scenario.start_hours
        << YAML::Key << "seed" << YAML::Value << scenario.seed
        << YAML::Key << "samples" << YAML::Value << YAML::DoubleQuoted << scenario.csv_out
        << YAML::EndMap;

    out << YAML::Key << "sensors" << YAML::Value << YAML::BeginSeq;
    for (const auto& m : sensors) {
        emit_sensor(out, m);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    os << out.c_str() << "\n";
}

int ScenarioRunner::run() {
    if (!ready_) {
        init();
    }

    std::ofstream csv(cfg_.csv_out);
    if (!csv) {
        LOG_ERROR("Failed to open CSV: %s", cfg_.csv_out.c_str());
        return 1;
    }

    const std::string meta_path = metadata_path(cfg_.csv_out);
    std::ofstream meta(meta_path);
    if (!meta) {
        LOG_ERROR("Failed to open metadata file: %s", meta_path.c_str());
        return 1;
    }
    write_metadata(meta, cfg_, bank_.metadata());
    meta.close();
    LOG_INFO("Sensor metadata -> %s", meta_path.c_str());

    write_csv_header(csv);
    csv << std::fixed << std::setprecision(6);

    const size_t iters = iteration_count();
    const size_t progress_every = std::max<size_t>(1, iters / 10);

    LOG_INFO("Starting scenario '%s' (%zu steps, dt=%.3fs, %u threads)",
             cfg_.name.c_str(), iters, cfg_.dt_s, bank_.threads());

    const auto wall_start = std::chrono::steady_clock::now();
    size_t rows = 0;
    size_t labeled = 0;

    for (size_t iter = 0; iter < iters; ++iter) {
        const auto samples = step(iter);
        for (const auto& s : samples) {
            write_csv_row(csv, s);
            ++rows;
            if (!s.ground_truth.empty()) ++labeled;
        }

        if ((iter + 1) % progress_every == 0) {
            LOG_DEBUG("[t=%.1f] %zu/%zu steps", iter * cfg_.dt_s, iter + 1, iters);
        }
    }

    const double wall_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - wall_start).count();

    LOG_INFO("Scenario complete: %zu samples (%zu labeled) in %.3f s -> %s",
             rows, labeled, wall_s, cfg_.csv_out.c_str());
    return 0;
}

} // namespace sim
