// src/env/static_environment.cpp
#include "env/static_environment.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace env {

namespace {

utils::Vec3 row_vec(const utils::CsvTable& table, const utils::CsvTable::Row& row,
                    const char* cx, const char* cy, const char* cz) {
    return {table.number(row, cx), table.number(row, cy), table.number(row, cz)};
}

} // namespace

StaticEnvironment StaticEnvironment::load_csv(const std::string& path) {
    utils::CsvTable table;
    if (!table.load(path)) {
        throw std::runtime_error("[StaticEnvironment] Cannot open environment table: " + path);
    }
    for (const char* required : {"kind", "name", "x", "y", "z"}) {
        if (!table.has_column(required)) {
            throw std::runtime_error(std::string("[StaticEnvironment] Missing column '") +
                                     required + "' in " + path);
        }
    }

    LOG_INFO("[StaticEnvironment] Loading environment table: %s (%zu rows)",
             path.c_str(), table.rows().size());

    StaticEnvironment environment;
    for (const auto& row : table.rows()) {
        const std::string& kind = table.text(row, "kind");
        const std::string& name = table.text(row, "name");
        try {
            const utils::Vec3 pos = row_vec(table, row, "x", "y", "z");

            if (kind == "uniform") {
                environment.set_uniform(name, table.number(row, "value"));
            } else if (kind == "region") {
                environment.add_region(name, pos, table.number(row, "radius"),
                                       table.number(row, "value"));
            } else if (kind == "vector") {
                environment.set_uniform_vector(name, row_vec(table, row, "vx", "vy", "vz"));
            } else if (kind == "vector_region") {
                environment.add_vector_region(name, pos, table.number(row, "radius"),
                                              row_vec(table, row, "vx", "vy", "vz"));
            } else if (kind == "source") {
                InterferenceSource src;
                src.position = pos;
                src.frequency_hz = table.number(row, "frequency_hz", 1000.0);
                src.strength = table.number(row, "value", 1.0);
                environment.add_source(src);
            } else if (kind == "bounds_min") {
                environment.min_corner_ = pos;
                environment.bounded_ = true;
            } else if (kind == "bounds_max") {
                environment.max_corner_ = pos;
                environment.bounded_ = true;
            } else {
                LOG_WARN("[StaticEnvironment] %s:%zu unknown kind '%s', row skipped",
                         path.c_str(), row.line, kind.c_str());
            }
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("[StaticEnvironment] " + path + ": " + e.what());
        }
    }

    LOG_INFO("[StaticEnvironment] Loaded %zu fields, %zu interference sources",
             environment.field_count(), environment.source_count());
    return environment;
}

void StaticEnvironment::set_uniform(const std::string& field, double value) {
    auto& f = scalars_[field];
    f.has_uniform = true;
    f.uniform = value;
}

void StaticEnvironment::add_region(const std::string& field, const utils::Vec3& center,
                                   double radius, double value) {
    scalars_[field].regions.push_back({center, radius, value});
}

void StaticEnvironment::set_uniform_vector(const std::string& field, const utils::Vec3& value) {
    auto& f = vectors_[field];
    f.has_uniform = true;
    f.uniform = value;
}

void StaticEnvironment::add_vector_region(const std::string& field, const utils::Vec3& center,
                                          double radius, const utils::Vec3& value) {
    vectors_[field].regions.push_back({center, radius, value});
}

void StaticEnvironment::add_source(const InterferenceSource& source) {
    sources_.push_back(source);
}

void StaticEnvironment::set_bounds(const utils::Vec3& min_corner, const utils::Vec3& max_corner) {
    bounded_ = true;
    min_corner_ = min_corner;
    max_corner_ = max_corner;
}

template <typename T>
std::optional<T> StaticEnvironment::lookup(const std::map<std::string, Field<T>>& fields,
                                           const std::string& name,
                                           const utils::Vec3& position) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        return std::nullopt;
    }

    const Field<T>& f = it->second;
    for (auto r = f.regions.rbegin(); r != f.regions.rend(); ++r) {
        if (position.distance_to(r->center) <= r->radius) {
            return r->value;
        }
    }
    if (f.has_uniform) {
        return f.uniform;
    }
    return std::nullopt;
}

void StaticEnvironment::check_bounds(const utils::Vec3& p) const {
    if (!bounded_) return;

    if (p.x < min_corner_.x || p.y < min_corner_.y || p.z < min_corner_.z ||
        p.x > max_corner_.x || p.y > max_corner_.y || p.z > max_corner_.z) {
        char buf[128];
        std::snprintf(buf, sizeof(buf), "position (%.2f, %.2f, %.2f) outside environment bounds",
                      p.x, p.y, p.z);
        throw EnvironmentQueryMiss(buf);
    }
}

std::optional<double> StaticEnvironment::get_field_value(const std::string& field_name,
                                                         const utils::Vec3& position) const {
    check_bounds(position);
    return lookup(scalars_, field_name, position);
}

std::optional<utils::Vec3> StaticEnvironment::get_field_vector(const std::string& field_name,
                                                               const utils::Vec3& position) const {
    check_bounds(position);
    return lookup(vectors_, field_name, position);
}

std::vector<InterferenceSource> StaticEnvironment::get_nearby_sources(const utils::Vec3& position,
                                                                      double radius_m) const {
    check_bounds(position);

    std::vector<InterferenceSource> nearby;
    for (const auto& src : sources_) {
        if (position.distance_to(src.position) <= radius_m) {
            nearby.push_back(src);
        }
    }
    return nearby;
}

} // namespace env
