// src/env/environment_query.hpp
#pragma once

#include "utils/vec3.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace env {

/**
 * EnvironmentQueryMiss - A field or position the environment cannot resolve
 *
 * Thrown by environment implementations; sensors recover locally by
 * treating the condition as absent.
 */
class EnvironmentQueryMiss : public std::runtime_error {
public:
    explicit EnvironmentQueryMiss(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * InterferenceSource - A non-target emitter sharing the sensing band
 */
struct InterferenceSource {
    utils::Vec3 position;
    double frequency_hz = 1000.0;
    double strength = 1.0;
};

/**
 * EnvironmentQuery - Read-only view of the digital-twin environment
 *
 * The core never writes to the environment. Implementations must be safe
 * to call concurrently from several sensors of the same timestep.
 *
 * Field names used by the shipped modalities:
 *   ac_field_strength, ac_field_vector, emf_dominant_frequency_hz,
 *   corona_discharge, arcing_intensity, temperature_celsius,
 *   sound_pressure_level_db, acoustic_dominant_frequency_hz,
 *   pm2_5, smoke_density, hotspot_intensity, chemical_leak, <chemical id>
 */
class EnvironmentQuery {
public:
    virtual ~EnvironmentQuery() = default;

    /**
     * Scalar field value at a position
     *
     * @return std::nullopt if the field is unknown at that position
     * @throws EnvironmentQueryMiss if the position cannot be resolved
     */
    virtual std::optional<double> get_field_value(const std::string& field_name,
                                                  const utils::Vec3& position) const = 0;

    /**
     * Vector field value at a position (e.g. the EMF vector)
     *
     * Default: the environment carries no vector fields.
     */
    virtual std::optional<utils::Vec3> get_field_vector(const std::string& field_name,
                                                        const utils::Vec3& position) const {
        (void)field_name; (void)position;
        return std::nullopt;
    }

    /**
     * Interference sources within radius_m of a position
     */
    virtual std::vector<InterferenceSource> get_nearby_sources(const utils::Vec3& position,
                                                               double radius_m) const = 0;
};

/**
 * Queries with EnvironmentQueryMiss folded into "absent"
 *
 * Non-finite scalars are treated as absent too. Misses are logged at DEBUG.
 */
std::optional<double> try_field_value(const EnvironmentQuery& env, const std::string& field_name,
                                      const utils::Vec3& position);

std::optional<utils::Vec3> try_field_vector(const EnvironmentQuery& env, const std::string& field_name,
                                            const utils::Vec3& position);

std::vector<InterferenceSource> try_nearby_sources(const EnvironmentQuery& env,
                                                   const utils::Vec3& position, double radius_m);

} // namespace env
