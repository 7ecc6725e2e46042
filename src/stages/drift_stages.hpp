// src/stages/drift_stages.hpp
#pragma once

#include "config/sensor_config.hpp"
#include "stages/imperfection_stage.hpp"

namespace stages {

/**
 * DriftState - Calibration error after t operating hours
 *
 * Recomputed from elapsed time on every call; nothing accumulates.
 */
struct DriftState {
    double gain = 1.0;
    double offset = 0.0;

    /**
     *   gain   = gain_error_factor * (1 + gain_drift_percent_per_hour / 100 * t)
     *   offset = offset + offset_drift_per_hour * t
     */
    static DriftState at(const config::CalibrationParams& params, double elapsed_hours);
};

/**
 * CalibrationDriftStage - reading' = reading * gain + offset + nonlinearity * reading^2
 */
class CalibrationDriftStage : public ImperfectionStage {
public:
    explicit CalibrationDriftStage(const config::CalibrationParams& params)
        : params_(params) {}

    const char* name() const override { return "CalibrationDrift"; }
    int rank() const override { return rank::kCalibrationDrift; }

    ReadingState apply(const ReadingState& in, StageContext& ctx) const override;

private:
    config::CalibrationParams params_;
};

/**
 * GeneralDriftStage - reading' = reading + baseline_drift_per_hour * t
 *
 * Runs after calibration drift; both apply when both are configured.
 */
class GeneralDriftStage : public ImperfectionStage {
public:
    explicit GeneralDriftStage(double per_hour_rate)
        : per_hour_rate_(per_hour_rate) {}

    const char* name() const override { return "GeneralDrift"; }
    int rank() const override { return rank::kGeneralDrift; }

    ReadingState apply(const ReadingState& in, StageContext& ctx) const override;

private:
    double per_hour_rate_;
};

} // namespace stages
