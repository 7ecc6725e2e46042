// src/env/environment_query.cpp
#include "env/environment_query.hpp"
#include "utils/logging.hpp"
#include <cmath>

namespace env {

std::optional<double> try_field_value(const EnvironmentQuery& env, const std::string& field_name,
                                      const utils::Vec3& position) {
    try {
        std::optional<double> v = env.get_field_value(field_name, position);
        if (v && !std::isfinite(*v)) {
            LOG_DEBUG("[Environment] %s is not finite, treated as absent", field_name.c_str());
            return std::nullopt;
        }
        return v;
    } catch (const EnvironmentQueryMiss& e) {
        LOG_DEBUG("[Environment] %s unavailable: %s", field_name.c_str(), e.what());
        return std::nullopt;
    }
}

std::optional<utils::Vec3> try_field_vector(const EnvironmentQuery& env, const std::string& field_name,
                                            const utils::Vec3& position) {
    try {
        return env.get_field_vector(field_name, position);
    } catch (const EnvironmentQueryMiss& e) {
        LOG_DEBUG("[Environment] %s unavailable: %s", field_name.c_str(), e.what());
        return std::nullopt;
    }
}

std::vector<InterferenceSource> try_nearby_sources(const EnvironmentQuery& env,
                                                   const utils::Vec3& position, double radius_m) {
    try {
        return env.get_nearby_sources(position, radius_m);
    } catch (const EnvironmentQueryMiss& e) {
        LOG_DEBUG("[Environment] interference sources unavailable: %s", e.what());
        return {};
    }
}

} // namespace env
