// src/stages/imperfection_stage.hpp
#pragma once

#include "env/environment_query.hpp"
#include "utils/noise.hpp"
#include "utils/vec3.hpp"
#include <map>
#include <optional>
#include <string>

namespace stages {

/**
 * Spectrum - Named frequency components of a reading, all >= 0
 */
using Spectrum = std::map<std::string, double>;

namespace component {
constexpr const char* kFundamental = "fundamental";
constexpr const char* kHighFrequencyNoise = "high_frequency_noise";
constexpr const char* kEmiNoiseFloor = "emi_noise_floor";

// Harmonic component name for order 3, 5, 7, 9 ("3rd", "5th", ...)
std::string harmonic(int order);
} // namespace component

/**
 * ReadingState - The reading as it moves through the pipeline
 */
struct ReadingState {
    double primary = 0.0;
    std::optional<Spectrum> spectrum;
    std::optional<utils::Vec3> field_vector;
    std::optional<double> dominant_frequency_hz;
};

/**
 * StageContext - Everything a stage may read besides its own parameters
 *
 * rng belongs to the current sample only.
 */
struct StageContext {
    const env::EnvironmentQuery& env;
    utils::Vec3 position;
    double elapsed_hours = 0.0;
    utils::NoiseGenerator& rng;
    std::string sensor_id;
};

/**
 * Fixed execution ranks (lower = earlier)
 *
 * A modality may leave stages out, but the ones it keeps always run in
 * this order.
 */
namespace rank {
constexpr int kFrequencyAnalysis = 10;
constexpr int kFrequencyResponse = 20;
constexpr int kAxisMisalignment = 30;
constexpr int kDirectionalSensitivity = 40;
constexpr int kInterferenceCoupling = 50;
constexpr int kCrossSensitivity = 55;
constexpr int kCalibrationDrift = 60;
constexpr int kGeneralDrift = 70;
constexpr int kNoiseInjection = 80;
} // namespace rank

/**
 * ImperfectionStage - One physical effect applied to a reading
 *
 * Stages hold only their parameters. apply() is a function of
 * (input state, parameters, context) and never touches shared state.
 */
class ImperfectionStage {
public:
    virtual ~ImperfectionStage() = default;

    /**
     * name() - Stage identifier for logging/debugging
     */
    virtual const char* name() const = 0;

    /**
     * rank() - Position in the fixed stage order (see stages::rank)
     */
    virtual int rank() const = 0;

    virtual ReadingState apply(const ReadingState& in, StageContext& ctx) const = 0;
};

} // namespace stages
