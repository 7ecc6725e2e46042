// src/stages/frequency_stages.cpp
#include "stages/frequency_stages.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace stages {

namespace {
constexpr const char* kTemperatureField = "temperature_celsius";
constexpr double kDegToRad = M_PI / 180.0;
} // namespace

// ============================================================================
// FrequencyAnalysisStage
// ============================================================================

ReadingState FrequencyAnalysisStage::apply(const ReadingState& in, StageContext& ctx) const {
    ReadingState out = in;

    if (!out.dominant_frequency_hz) {
        out.dominant_frequency_hz = params_.base_frequency_hz;
    }

    if (!params_.enable_spectrum_output) {
        out.spectrum.reset();
        return out;
    }

    const double fundamental = std::max(0.0, in.primary);

    Spectrum spectrum;
    spectrum[component::kFundamental] = fundamental;

    for (size_t i = 0; i < config::kHarmonicOrders.size(); ++i) {
        const int n = config::kHarmonicOrders[i];
        double strength = fundamental * params_.harmonic_ratios[i];
        if (params_.frequency_noise) {
            strength *= 1.0 + ctx.rng.gaussian(params_.frequency_noise_stddev) * std::sqrt(static_cast<double>(n));
        }
        spectrum[component::harmonic(n)] = std::max(0.0, strength);
    }

    auto trigger = env::try_field_value(ctx.env, params_.hf_noise_trigger_field, ctx.position);
    if (trigger && *trigger > 0.0) {
        spectrum[component::kHighFrequencyNoise] = fundamental * params_.corona_hf_noise_factor;
    }

    spectrum[component::kEmiNoiseFloor] = 0.0;

    out.spectrum = std::move(spectrum);
    return out;
}

// ============================================================================
// FrequencyResponseStage
// ============================================================================

double FrequencyResponseStage::scalar_gain(double frequency_hz) const {
    double best_gain = params_.default_frequency_gain;
    double best_diff = params_.frequency_tolerance_hz;
    bool matched = false;

    for (const auto& entry : params_.frequency_gain) {
        const double diff = std::abs(entry.first - frequency_hz);
        if (diff <= params_.frequency_tolerance_hz && (!matched || diff < best_diff)) {
            best_gain = entry.second;
            best_diff = diff;
            matched = true;
        }
    }
    return best_gain;
}

ReadingState FrequencyResponseStage::apply(const ReadingState& in, StageContext& ctx) const {
    ReadingState out = in;

    if (!out.spectrum) {
        if (out.dominant_frequency_hz && !params_.frequency_gain.empty()) {
            out.primary *= scalar_gain(*out.dominant_frequency_hz);
        } else {
            out.primary *= params_.default_frequency_gain;
        }
        return out;
    }

    const double temp_c = env::try_field_value(ctx.env, kTemperatureField, ctx.position)
                              .value_or(params_.ref_temp_c);
    const double temp_factor = 1.0 + params_.temp_coeff_per_10c * (temp_c - params_.ref_temp_c) / 10.0;

    for (auto& kv : *out.spectrum) {
        auto it = params_.curve.find(kv.first);
        const double base = (it != params_.curve.end()) ? it->second : 1.0;
        kv.second = std::max(0.0, kv.second * base * temp_factor);
    }

    out.primary = out.spectrum->at(component::kFundamental);
    return out;
}

// ============================================================================
// AxisMisalignmentStage
// ============================================================================

ReadingState AxisMisalignmentStage::apply(const ReadingState& in, StageContext& ctx) const {
    (void)ctx;
    ReadingState out = in;
    if (!params_.enabled || !out.spectrum) {
        return out;
    }

    const double factor = std::max(0.0, std::cos(params_.degrees * kDegToRad));
    for (auto& kv : *out.spectrum) {
        kv.second *= factor;
    }

    out.primary = out.spectrum->at(component::kFundamental);
    return out;
}

} // namespace stages
