// src/stages/directional_stage.hpp
#pragma once

#include "config/sensor_config.hpp"
#include "stages/imperfection_stage.hpp"

namespace stages {

/**
 * DirectionalSensitivityStage - Scales the primary by sensor/field alignment
 *
 *   alignment = clamp(dot(unit(orientation), unit(field)) + N(0, stddev), 0, 1)
 *
 * A reversed field gives 0, never a negative reading. Without a field
 * vector the stage passes the reading through, unless
 * apply_directional_sensitivity_to_scalar substitutes the assumed direction.
 * A zero-length orientation or field vector skips the stage with a warning.
 */
class DirectionalSensitivityStage : public ImperfectionStage {
public:
    explicit DirectionalSensitivityStage(const config::DirectionalParams& params)
        : params_(params) {}

    const char* name() const override { return "DirectionalSensitivity"; }
    int rank() const override { return rank::kDirectionalSensitivity; }

    ReadingState apply(const ReadingState& in, StageContext& ctx) const override;

    /**
     * Alignment factor in [0, 1], or nullopt when a direction is degenerate
     */
    std::optional<double> alignment(const utils::Vec3& field_direction,
                                    utils::NoiseGenerator& rng) const;

private:
    config::DirectionalParams params_;
};

} // namespace stages
