#include "rotation.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace spirob {

namespace {
constexpr double kMinAngleDeg = 1e-6;
constexpr double kMinAxisNorm = 1e-9;
}  // namespace

Vec3 rotate_about_axis(const Vec3& v, const Vec3& axis, double angle_rad) {
    double cos_t = std::cos(angle_rad);
    double sin_t = std::sin(angle_rad);
    double k_dot_v = axis.dot(v);
    return v * cos_t + axis.cross(v) * sin_t + axis * (k_dot_v * (1.0 - cos_t));
}

Vec3 AxisAlignment::apply(const Vec3& point) const {
    Vec3 rotated = point;
    if (rotates) {
        rotated = rotate_about_axis(point, axis, angle_deg * std::numbers::pi / 180.0);
    }
    return rotated + translation;
}

AxisAlignment align_x_axis(const Vec3& p0, const Vec3& p1) {
    AxisAlignment result;
    Vec3 d = p1 - p0;
    result.length = d.length();
    if (result.length <= 0.0) {
        return result;
    }

    Vec3 v = d / result.length;
    double dot = std::clamp(v.dot(vec3::unit_x()), -1.0, 1.0);
    double angle_deg = std::acos(dot) * 180.0 / std::numbers::pi;

    if (std::abs(angle_deg) > kMinAngleDeg) {
        // cross(+X, v) = (0, -v.z, v.y)
        Vec3 axis = vec3::unit_x().cross(v);
        double norm = axis.length();
        if (norm > kMinAxisNorm) {
            result.axis = axis / norm;
            result.angle_deg = angle_deg;
            result.rotates = true;
        }
    }

    // Residual translation so the far end lands exactly on p1
    Vec3 end_local(result.length, 0.0, 0.0);
    Vec3 end_rotated = end_local;
    if (result.rotates) {
        end_rotated = rotate_about_axis(end_local, result.axis,
                                        result.angle_deg * std::numbers::pi / 180.0);
    }
    result.translation = p1 - end_rotated;
    return result;
}

}  // namespace spirob
