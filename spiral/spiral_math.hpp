#ifndef SPIROB_SPIRAL_SPIRAL_MATH_HPP
#define SPIROB_SPIRAL_SPIRAL_MATH_HPP

#include <math/vec2.hpp>
#include <optional>

namespace spirob {

struct PolarPoint {
    double theta = 0.0;  // [0, 2*pi)
    double r = 0.0;
};

Vec2 polar_to_cartesian(double theta, double r);

// Angle is wrapped into [0, 2*pi); there is a branch cut on the +X axis
PolarPoint cartesian_to_polar(const Vec2& point);

// Mirror `point` across the infinite line through a and b. A degenerate
// line (|b - a|^2 < 1e-12) leaves the point unchanged.
Vec2 reflect_across_line(const Vec2& point, const Vec2& a, const Vec2& b);

// Intersection of segments a0-a1 and b0-b1, endpoints included.
// Parallel or collinear segments (|denominator| < 1e-12) and segments
// that do not meet return nullopt; both are ordinary outcomes.
std::optional<Vec2> segment_intersect(const Vec2& a0, const Vec2& a1,
                                      const Vec2& b0, const Vec2& b1);

}  // namespace spirob

#endif // SPIROB_SPIRAL_SPIRAL_MATH_HPP
