// src/stages/directional_stage.cpp
#include "stages/directional_stage.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace stages {

std::optional<double> DirectionalSensitivityStage::alignment(const utils::Vec3& field_direction,
                                                             utils::NoiseGenerator& rng) const {
    utils::Vec3 orientation;
    utils::Vec3 field;
    if (!utils::try_normalize(params_.orientation, orientation) ||
        !utils::try_normalize(field_direction, field)) {
        return std::nullopt;
    }

    double a = orientation.dot(field);
    if (params_.orientation_uncertainty) {
        a += rng.gaussian(params_.orientation_uncertainty_stddev);
    }
    return std::clamp(a, 0.0, 1.0);
}

ReadingState DirectionalSensitivityStage::apply(const ReadingState& in, StageContext& ctx) const {
    ReadingState out = in;

    utils::Vec3 direction;
    if (in.field_vector) {
        direction = *in.field_vector;
    } else if (params_.apply_to_scalar) {
        direction = params_.assumed_field_direction;
    } else {
        return out;
    }

    auto a = alignment(direction, ctx.rng);
    if (!a) {
        LOG_WARN("[DirectionalSensitivity] %s: zero-length orientation or field vector, stage skipped",
                 ctx.sensor_id.c_str());
        return out;
    }

    out.primary *= *a;
    return out;
}

} // namespace stages
