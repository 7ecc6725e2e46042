// src/env/static_environment.hpp
#pragma once

#include "env/environment_query.hpp"
#include <map>
#include <string>
#include <vector>

namespace env {

/**
 * StaticEnvironment - In-memory environment snapshot
 *
 * Fields are a uniform background value plus spherical regions that
 * override it (the last matching region wins). Vector fields work the
 * same way. Interference sources are a flat list.
 *
 * Usage:
 *   env::StaticEnvironment e;
 *   e.set_uniform("temperature_celsius", 25.0);
 *   e.add_region("corona_discharge", {0, 0, 10}, 2.0, 0.8);
 *   e.add_source({{5, 0, 10}, 1200.0, 40.0});
 *
 * With bounds set, queries outside the box throw EnvironmentQueryMiss.
 */
class StaticEnvironment : public EnvironmentQuery {
public:
    StaticEnvironment() = default;

    /**
     * Load a snapshot from a CSV table
     *
     * Columns: kind,name,x,y,z,radius,value,vx,vy,vz,frequency_hz
     *   kind = uniform | region | vector | vector_region | source | bounds_min | bounds_max
     *
     * @throws std::runtime_error if the file is missing or a row is malformed
     */
    static StaticEnvironment load_csv(const std::string& path);

    void set_uniform(const std::string& field, double value);
    void add_region(const std::string& field, const utils::Vec3& center, double radius, double value);
    void set_uniform_vector(const std::string& field, const utils::Vec3& value);
    void add_vector_region(const std::string& field, const utils::Vec3& center, double radius,
                           const utils::Vec3& value);
    void add_source(const InterferenceSource& source);
    void set_bounds(const utils::Vec3& min_corner, const utils::Vec3& max_corner);

    std::optional<double> get_field_value(const std::string& field_name,
                                          const utils::Vec3& position) const override;

    std::optional<utils::Vec3> get_field_vector(const std::string& field_name,
                                                const utils::Vec3& position) const override;

    std::vector<InterferenceSource> get_nearby_sources(const utils::Vec3& position,
                                                       double radius_m) const override;

    size_t field_count() const { return scalars_.size() + vectors_.size(); }
    size_t source_count() const { return sources_.size(); }

private:
    template <typename T>
    struct Region {
        utils::Vec3 center;
        double radius = 0.0;
        T value{};
    };

    template <typename T>
    struct Field {
        bool has_uniform = false;
        T uniform{};
        std::vector<Region<T>> regions;
    };

    template <typename T>
    static std::optional<T> lookup(const std::map<std::string, Field<T>>& fields,
                                   const std::string& name, const utils::Vec3& position);

    void check_bounds(const utils::Vec3& position) const;

    std::map<std::string, Field<double>> scalars_;
    std::map<std::string, Field<utils::Vec3>> vectors_;
    std::vector<InterferenceSource> sources_;

    bool bounded_ = false;
    utils::Vec3 min_corner_;
    utils::Vec3 max_corner_;
};

} // namespace env
