#ifndef SPIROB_MATH_ROTATION_HPP
#define SPIROB_MATH_ROTATION_HPP

#include "vec3.hpp"

namespace spirob {

// Rotate v about a unit axis through the origin (Rodrigues' formula)
Vec3 rotate_about_axis(const Vec3& v, const Vec3& axis, double angle_rad);

// Rigid placement that carries the segment (0,0,0)-(length,0,0) onto p0-p1.
//
// The solid is first rotated about `axis` (through the origin) by
// `angle_deg`, then translated by `translation`. When `rotates` is false
// the rotation step is skipped entirely (already aligned, or the cross
// product with +X is undefined).
struct AxisAlignment {
    Vec3 axis = vec3::unit_x();
    double angle_deg = 0.0;
    double length = 0.0;
    Vec3 translation = vec3::zero();
    bool rotates = false;

    // Where a point of the canonical solid ends up
    Vec3 apply(const Vec3& point) const;
};

// Derive the alignment from +X to the direction p1 - p0. Degenerate
// (zero-length) segments yield length == 0 and must be skipped by callers.
AxisAlignment align_x_axis(const Vec3& p0, const Vec3& p1);

}  // namespace spirob

#endif // SPIROB_MATH_ROTATION_HPP
