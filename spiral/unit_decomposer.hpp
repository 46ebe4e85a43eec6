#ifndef SPIROB_SPIRAL_UNIT_DECOMPOSER_HPP
#define SPIROB_SPIRAL_UNIT_DECOMPOSER_HPP

#include "design_params.hpp"
#include <math/vec2.hpp>
#include <array>
#include <cstddef>
#include <vector>

namespace spirob {

// Trapezoid in polar coordinates, vertices in drawing order.
//
// Primary unit:  theta = (t0, t1, t1, t0),   r = (r0, r1, rc1, rc0)
// Mirror unit:   theta = (t0, t1, t1m, t0m), r = (rc0, rc1, r1m, r0m)
// where the mirror's outer vertices are the primary's spiral vertices
// reflected across the central-spiral chord.
struct PolarUnit {
    std::array<double, 4> theta{};
    std::array<double, 4> r{};

    double start_angle() const { return theta[0]; }
    double end_angle() const { return theta[1]; }
};

// Result of walking the spiral in fixed angular steps
struct PolarDecomposition {
    // Samples of both spirals at every step up to the outer sweep
    std::vector<double> theta_samples;
    std::vector<double> r_samples;
    std::vector<double> rc_samples;

    std::vector<PolarUnit> primary;
    std::vector<PolarUnit> mirror;

    // Last angle the central spiral may reach (2*pi*turns - 2*pi, >= 0)
    double sweep_end = 0.0;

    std::size_t unit_count() const { return primary.size(); }
};

// Walk the spiral and emit one primary and one mirror unit per accepted
// step. Throws std::invalid_argument unless a > 0 and b > 0.
PolarDecomposition decompose_polar(const SpiralParams& params);

// Quad of one unfolded unit. Vertex order:
//   [0] outer leading   (p0, on the spiral at theta = 0)
//   [1] outer trailing  (p1, on the spiral at theta = dtheta)
//   [2] inner trailing  (q1, on the central spiral)
//   [3] inner leading   (q0, on the central spiral)
struct FlatUnit {
    std::array<Vec2, 4> vertices{};

    const Vec2& outer_leading() const { return vertices[0]; }
    const Vec2& outer_trailing() const { return vertices[1]; }
    const Vec2& inner_trailing() const { return vertices[2]; }
    const Vec2& inner_leading() const { return vertices[3]; }

    FlatUnit scaled(double factor) const;
    FlatUnit translated(const Vec2& offset) const;

    // Reflection across the x-axis
    FlatUnit mirrored() const;

    double max_x() const;
    double max_y() const;
};

// The step-0 unit rotated so its central-spiral chord q0-q1 is parallel
// to +X. Every later unit is this quad scaled by gamma^k.
FlatUnit compute_base_quad(const SpiralParams& params);

// Units in the unfolded chain; never fewer than one
std::size_t flat_unit_count(const PolarDecomposition& polar);

}  // namespace spirob

#endif // SPIROB_SPIRAL_UNIT_DECOMPOSER_HPP
