// utils/vec3.hpp
#pragma once

#include <cmath>

namespace utils {

/**
 * Vec3 - 3D vector for positions, orientations and field directions
 */
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vec3 operator+(const Vec3& rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }
    Vec3 operator-(const Vec3& rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }
    Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }

    bool operator==(const Vec3& rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }

    double dot(const Vec3& rhs) const { return x * rhs.x + y * rhs.y + z * rhs.z; }
    double norm() const { return std::sqrt(dot(*this)); }

    double distance_to(const Vec3& rhs) const { return (*this - rhs).norm(); }
};

constexpr double kNormEpsilon = 1e-9;  // Below this a vector has no direction

/**
 * Unit vector of v, or false if v is too short to carry a direction
 */
inline bool try_normalize(const Vec3& v, Vec3& out) {
    const double n = v.norm();
    if (n < kNormEpsilon) {
        return false;
    }
    out = v * (1.0 / n);
    return true;
}

} // namespace utils
