// src/sensors/modality_sensor.cpp
#include "sensors/modality_sensor.hpp"
#include "stages/coupling_stages.hpp"
#include "stages/directional_stage.hpp"
#include "stages/drift_stages.hpp"
#include "stages/frequency_stages.hpp"
#include "stages/noise_stage.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace sensors {

ModalitySensor::ModalitySensor(config::SensorConfig cfg, const utils::Vec3& position, uint64_t seed)
    : cfg_(std::move(cfg)),
      profile_(profile_for(cfg_.modality)),
      position_(position),
      seed_(seed),
      evaluator_(cfg_.conditions, cfg_.thresholds),
      quantizer_(cfg_.resolution)
{
    cfg_.validate();
    cfg_.print_summary();
    build_pipeline();

    LOG_INFO("[Sensor] %s (%s) at (%.2f, %.2f, %.2f): %zu stages, %zu label rules",
             cfg_.sensor_id.c_str(), config::to_string(cfg_.modality),
             position_.x, position_.y, position_.z,
             pipeline_.stage_count(), evaluator_.rule_count());
}

void ModalitySensor::build_pipeline() {
    using namespace stages;

    if (profile_.frequency_analysis) {
        pipeline_.register_stage(std::make_unique<FrequencyAnalysisStage>(cfg_.analysis));
    }
    if (profile_.frequency_response) {
        pipeline_.register_stage(std::make_unique<FrequencyResponseStage>(cfg_.response));
    }
    if (profile_.axis_misalignment && cfg_.misalignment.enabled) {
        pipeline_.register_stage(std::make_unique<AxisMisalignmentStage>(cfg_.misalignment));
    }
    if (profile_.directional_sensitivity) {
        pipeline_.register_stage(std::make_unique<DirectionalSensitivityStage>(cfg_.directional));
    }
    if (profile_.interference_coupling) {
        pipeline_.register_stage(std::make_unique<InterferenceCouplingStage>(
            cfg_.interference, cfg_.analysis.base_frequency_hz));
    }
    if (profile_.cross_sensitivity && !cfg_.cross_sensitivity.empty()) {
        pipeline_.register_stage(std::make_unique<CrossSensitivityStage>(cfg_.cross_sensitivity));
    }

    pipeline_.register_stage(std::make_unique<CalibrationDriftStage>(cfg_.calibration));
    pipeline_.register_stage(std::make_unique<GeneralDriftStage>(cfg_.baseline_drift_per_hour));
    pipeline_.register_stage(std::make_unique<NoiseInjectionStage>(cfg_.noise));

    for (size_t i = 0; i < pipeline_.stage_count(); ++i) {
        const auto* stage = pipeline_.get_stage(i);
        LOG_DEBUG("  %zu. %s (rank %d)", i + 1, stage->name(), stage->rank());
    }
}

IdealReading ModalitySensor::read_ideal(const SampleContext& ctx) const {
    IdealReading ideal;

    const std::string field = profile_.ideal_field ? profile_.ideal_field : cfg_.target_chemical;
    auto magnitude = env::try_field_value(ctx.env, field, position_);

    if (profile_.vector_field) {
        ideal.field_vector = env::try_field_vector(ctx.env, profile_.vector_field, position_);
    }
    if (profile_.frequency_field) {
        auto f = env::try_field_value(ctx.env, profile_.frequency_field, position_);
        if (f && *f > 0.0) {
            ideal.dominant_frequency_hz = *f;
        }
    }

    if (magnitude) {
        ideal.magnitude = *magnitude;
    } else if (ideal.field_vector) {
        ideal.magnitude = ideal.field_vector->norm();
    } else {
        LOG_DEBUG("[Sensor] %s: %s absent, ideal value 0", cfg_.sensor_id.c_str(), field.c_str());
    }

    return ideal;
}

double ModalitySensor::condition_output(double value) const {
    if (!std::isfinite(value)) {
        LOG_WARN("[Sensor] %s: non-finite reading, clamped to %.2f",
                 cfg_.sensor_id.c_str(), profile_.min_value);
        return profile_.min_value;
    }
    value = quantizer_.quantize(value);
    return std::clamp(value, profile_.min_value, profile_.max_value);
}

ObservedReading ModalitySensor::apply_imperfections(const IdealReading& ideal, const SampleContext& ctx) {
    utils::NoiseGenerator rng(seed_ == 0 ? 0 : utils::mix_seed(seed_, ctx.timestamp_usec));

    stages::ReadingState in;
    in.primary = ideal.magnitude;
    in.field_vector = ideal.field_vector;
    in.dominant_frequency_hz = ideal.dominant_frequency_hz;

    stages::StageContext sctx{ctx.env, position_, ctx.elapsed_hours, rng, cfg_.sensor_id};
    stages::ReadingState out = pipeline_.run(in, sctx);

    ObservedReading obs;
    obs.sensor_id = cfg_.sensor_id;
    obs.modality = cfg_.modality;
    obs.timestamp_usec = ctx.timestamp_usec;
    obs.position = position_;
    obs.quantity = profile_.quantity;
    obs.value = condition_output(out.primary);
    obs.spectrum = std::move(out.spectrum);

    last_observed_ = obs.value;
    return obs;
}

SensorMetadata ModalitySensor::metadata() const {
    SensorMetadata m;
    m.sensor_id = cfg_.sensor_id;
    m.modality = cfg_.modality;
    m.position = position_;
    m.enabled = enabled();
    m.seed = seed_;
    m.quantity = profile_.quantity;
    m.min_value = profile_.min_value;
    m.max_value = profile_.max_value;
    m.spectrum_output = profile_.frequency_analysis && cfg_.analysis.enable_spectrum_output;

    for (size_t i = 0; i < pipeline_.stage_count(); ++i) {
        m.stages.push_back(pipeline_.get_stage(i)->name());
    }
    m.params = cfg_;
    return m;
}

std::vector<labels::AnomalyLabel> ModalitySensor::get_ground_truth(const SampleContext& ctx) const {
    return evaluator_.evaluate(ctx.env, position_, last_observed_);
}

} // namespace sensors
