// src/sensors/modality_sensor.hpp
#pragma once

#include "config/sensor_config.hpp"
#include "labels/ground_truth_evaluator.hpp"
#include "sensors/modality_profile.hpp"
#include "sensors/sensor_base.hpp"
#include "stages/stage_pipeline.hpp"
#include "utils/noise.hpp"
#include <cstdint>
#include <optional>

namespace sensors {

/**
 * ModalitySensor - Concrete sensor assembled from a modality profile
 *
 * The profile picks the stages, the SensorConfig parameterizes them and
 * the ground-truth rules. After the pipeline the value is quantized to
 * the configured resolution and clamped to the modality's physical limits.
 *
 * Randomness: each sample draws from its own generator seeded with
 * mix_seed(seed, timestamp_usec), so a fixed seed reproduces a run and
 * sensors can be sampled in parallel. seed 0 = non-deterministic.
 *
 * @throws config::ConfigError from the constructor if the config is invalid
 *         (e.g. a chemical sensor without target_chemical)
 */
class ModalitySensor : public SensorBase {
public:
    ModalitySensor(config::SensorConfig cfg, const utils::Vec3& position, uint64_t seed = 0);

    IdealReading read_ideal(const SampleContext& ctx) const override;

    ObservedReading apply_imperfections(const IdealReading& ideal,
                                        const SampleContext& ctx) override;

    std::vector<labels::AnomalyLabel> get_ground_truth(const SampleContext& ctx) const override;

    SensorMetadata metadata() const override;

    void reset() override { last_observed_.reset(); }

    const std::string& id() const override { return cfg_.sensor_id; }
    config::Modality modality() const override { return cfg_.modality; }

    const utils::Vec3& position() const override { return position_; }
    void set_position(const utils::Vec3& p) override { position_ = p; }

    const config::SensorConfig& config() const { return cfg_; }
    const stages::StagePipeline& pipeline() const { return pipeline_; }
    uint64_t seed() const { return seed_; }

    std::optional<double> last_observed() const { return last_observed_; }

private:
    void build_pipeline();
    double condition_output(double value) const;

    config::SensorConfig cfg_;
    const ModalityProfile& profile_;
    utils::Vec3 position_;
    uint64_t seed_;

    stages::StagePipeline pipeline_;
    labels::GroundTruthEvaluator evaluator_;
    utils::Quantizer quantizer_;

    std::optional<double> last_observed_;
};

} // namespace sensors
