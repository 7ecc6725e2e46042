// src/stages/drift_stages.cpp
#include "stages/drift_stages.hpp"

namespace stages {

DriftState DriftState::at(const config::CalibrationParams& params, double elapsed_hours) {
    DriftState d;
    const double gain_rate = params.gain_drift_percent_per_hour / 100.0;
    d.gain = params.gain_error_factor * (1.0 + gain_rate * elapsed_hours);
    d.offset = params.offset + params.offset_drift_per_hour * elapsed_hours;
    return d;
}

ReadingState CalibrationDriftStage::apply(const ReadingState& in, StageContext& ctx) const {
    ReadingState out = in;
    const DriftState d = DriftState::at(params_, ctx.elapsed_hours);
    const double r = in.primary;
    out.primary = r * d.gain + d.offset + params_.nonlinearity_factor * r * r;
    return out;
}

ReadingState GeneralDriftStage::apply(const ReadingState& in, StageContext& ctx) const {
    ReadingState out = in;
    out.primary += per_hour_rate_ * ctx.elapsed_hours;
    return out;
}

} // namespace stages
