#include "spiral_math.hpp"
#include <cmath>
#include <numbers>

namespace spirob {

namespace {
constexpr double kDegenerateEpsilon = 1e-12;
}  // namespace

Vec2 polar_to_cartesian(double theta, double r) {
    return {r * std::cos(theta), r * std::sin(theta)};
}

PolarPoint cartesian_to_polar(const Vec2& point) {
    PolarPoint result;
    result.r = std::hypot(point.x, point.y);
    result.theta = std::atan2(point.y, point.x);
    if (result.theta < 0.0) {
        result.theta += 2.0 * std::numbers::pi;
    }
    return result;
}

Vec2 reflect_across_line(const Vec2& point, const Vec2& a, const Vec2& b) {
    Vec2 v = b - a;
    double denom = v.length_squared();
    if (denom < kDegenerateEpsilon) {
        return point;
    }
    double t = (point - a).dot(v) / denom;
    Vec2 projection = a + v * t;
    return projection * 2.0 - point;
}

std::optional<Vec2> segment_intersect(const Vec2& a0, const Vec2& a1,
                                      const Vec2& b0, const Vec2& b1) {
    Vec2 r = a1 - a0;
    Vec2 s = b1 - b0;
    double denom = r.cross(s);
    if (std::abs(denom) < kDegenerateEpsilon) {
        return std::nullopt;
    }

    Vec2 offset = b0 - a0;
    double t = offset.cross(s) / denom;
    double u = offset.cross(r) / denom;
    if (t >= 0.0 && t <= 1.0 && u >= 0.0 && u <= 1.0) {
        return a0 + r * t;
    }
    return std::nullopt;
}

}  // namespace spirob
