// src/stages/coupling_stages.cpp
#include "stages/coupling_stages.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace stages {

// ============================================================================
// InterferenceCouplingStage
// ============================================================================

double InterferenceCouplingStage::total_coupling(const std::vector<env::InterferenceSource>& sources,
                                                 const utils::Vec3& position,
                                                 double sensor_frequency_hz) const {
    double total = 0.0;
    for (const auto& src : sources) {
        const double d = position.distance_to(src.position);
        const double df = std::abs(src.frequency_hz - sensor_frequency_hz);
        total += src.strength * std::exp(-df / params_.frequency_coupling_factor) / (d * d + 1.0);
    }
    return total;
}

ReadingState InterferenceCouplingStage::apply(const ReadingState& in, StageContext& ctx) const {
    ReadingState out = in;

    const auto sources = env::try_nearby_sources(ctx.env, ctx.position, params_.radius_m);
    const double f_sensor = in.dominant_frequency_hz.value_or(base_frequency_hz_);
    const double total = total_coupling(sources, ctx.position, f_sensor);

    if (!sources.empty()) {
        const double variability = ctx.rng.gaussian(1.0, params_.field_strength_random_stddev);
        out.primary = std::max(0.0, out.primary + total * params_.field_strength_impact_factor * variability);

        LOG_TRACE("[InterferenceCoupling] %s: %zu sources, total coupling %.6f",
                  ctx.sensor_id.c_str(), sources.size(), total);
    }

    if (out.spectrum) {
        (*out.spectrum)[component::kEmiNoiseFloor] =
            sources.empty() ? 0.0 : std::max(0.0, total * params_.spectrum_impact_factor);
    }

    return out;
}

// ============================================================================
// CrossSensitivityStage
// ============================================================================

ReadingState CrossSensitivityStage::apply(const ReadingState& in, StageContext& ctx) const {
    ReadingState out = in;
    for (const auto& kv : factors_) {
        auto level = env::try_field_value(ctx.env, kv.first, ctx.position);
        if (level) {
            out.primary += *level * kv.second;
        }
    }
    return out;
}

} // namespace stages
