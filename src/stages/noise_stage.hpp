// src/stages/noise_stage.hpp
#pragma once

#include "config/sensor_config.hpp"
#include "stages/imperfection_stage.hpp"

namespace stages {

/**
 * NoiseInjectionStage - reading' = reading + N(mean, stddev)
 *
 * Always the last stage. type "none" passes the reading through.
 */
class NoiseInjectionStage : public ImperfectionStage {
public:
    explicit NoiseInjectionStage(const config::NoiseParams& params)
        : params_(params) {}

    const char* name() const override { return "NoiseInjection"; }
    int rank() const override { return rank::kNoiseInjection; }

    ReadingState apply(const ReadingState& in, StageContext& ctx) const override {
        ReadingState out = in;
        if (params_.type == "gaussian") {
            out.primary += ctx.rng.gaussian(params_.mean, params_.stddev);
        }
        return out;
    }

private:
    config::NoiseParams params_;
};

} // namespace stages
