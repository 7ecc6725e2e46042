// src/stages/frequency_stages.hpp
#pragma once

#include "config/sensor_config.hpp"
#include "stages/imperfection_stage.hpp"

namespace stages {

/**
 * FrequencyAnalysisStage - Builds the spectrum of a periodic field
 *
 *   fundamental = primary
 *   N-th        = fundamental * harmonic_N_ratio  (* (1 + N(0, stddev) * sqrt(N)) with frequency_noise)
 *   high_frequency_noise = fundamental * corona_hf_noise_factor, only while the trigger field is > 0
 *   emi_noise_floor      = 0, filled in by interference coupling
 *
 * With enable_spectrum_output=false the spectrum is dropped, not zeroed.
 */
class FrequencyAnalysisStage : public ImperfectionStage {
public:
    explicit FrequencyAnalysisStage(const config::FrequencyAnalysisParams& params)
        : params_(params) {}

    const char* name() const override { return "FrequencyAnalysis"; }
    int rank() const override { return rank::kFrequencyAnalysis; }

    ReadingState apply(const ReadingState& in, StageContext& ctx) const override;

private:
    config::FrequencyAnalysisParams params_;
};

/**
 * FrequencyResponseStage - Temperature-corrected gain curve
 *
 * Spectrum: every component is multiplied by
 *   curve[name] * (1 + temp_coeff_per_10c * (T - ref) / 10)
 * (unlisted components use 1.0, T from temperature_celsius or ref when absent)
 * and the primary follows the fundamental.
 *
 * Scalar: the dominant frequency is looked up in the frequency->gain
 * table; the nearest entry within tolerance wins, else the default gain.
 */
class FrequencyResponseStage : public ImperfectionStage {
public:
    explicit FrequencyResponseStage(const config::FrequencyResponseParams& params)
        : params_(params) {}

    const char* name() const override { return "FrequencyResponse"; }
    int rank() const override { return rank::kFrequencyResponse; }

    ReadingState apply(const ReadingState& in, StageContext& ctx) const override;

    /**
     * Gain for a dominant frequency (nearest table entry within tolerance)
     */
    double scalar_gain(double frequency_hz) const;

private:
    config::FrequencyResponseParams params_;
};

/**
 * AxisMisalignmentStage - Scales every spectrum component by max(0, cos(angle))
 */
class AxisMisalignmentStage : public ImperfectionStage {
public:
    explicit AxisMisalignmentStage(const config::AxisMisalignmentParams& params)
        : params_(params) {}

    const char* name() const override { return "AxisMisalignment"; }
    int rank() const override { return rank::kAxisMisalignment; }

    ReadingState apply(const ReadingState& in, StageContext& ctx) const override;

private:
    config::AxisMisalignmentParams params_;
};

} // namespace stages
