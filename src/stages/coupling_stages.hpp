// src/stages/coupling_stages.hpp
#pragma once

#include "config/sensor_config.hpp"
#include "stages/imperfection_stage.hpp"
#include <map>
#include <vector>

namespace stages {

/**
 * InterferenceCouplingStage - Pickup from nearby emitters in the sensing band
 *
 * Per source within radius_m:
 *   coupling = strength * exp(-|f_src - f_sensor| / emi_frequency_coupling_factor) / (d^2 + 1)
 *
 *   primary         += total * field_impact * N(1, random_stddev)   (floored at 0)
 *   emi_noise_floor  = total * spectrum_impact                      (0 with no sources)
 *
 * f_sensor is the reading's dominant frequency, or the base frequency.
 */
class InterferenceCouplingStage : public ImperfectionStage {
public:
    InterferenceCouplingStage(const config::InterferenceParams& params, double base_frequency_hz)
        : params_(params), base_frequency_hz_(base_frequency_hz) {}

    const char* name() const override { return "InterferenceCoupling"; }
    int rank() const override { return rank::kInterferenceCoupling; }

    ReadingState apply(const ReadingState& in, StageContext& ctx) const override;

    /**
     * Summed coupling of a source list at a position
     */
    double total_coupling(const std::vector<env::InterferenceSource>& sources,
                          const utils::Vec3& position, double sensor_frequency_hz) const;

private:
    config::InterferenceParams params_;
    double base_frequency_hz_;
};

/**
 * CrossSensitivityStage - Response of a chemical sensor to non-target species
 *
 *   primary += sum(field(interferent) * factor)
 *
 * Interferents absent from the environment contribute nothing.
 */
class CrossSensitivityStage : public ImperfectionStage {
public:
    explicit CrossSensitivityStage(const std::map<std::string, double>& factors)
        : factors_(factors) {}

    const char* name() const override { return "CrossSensitivity"; }
    int rank() const override { return rank::kCrossSensitivity; }

    ReadingState apply(const ReadingState& in, StageContext& ctx) const override;

private:
    std::map<std::string, double> factors_;
};

} // namespace stages
