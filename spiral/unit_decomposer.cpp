#include "unit_decomposer.hpp"
#include "spiral_math.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace spirob {

namespace {

constexpr double kBoundaryTolerance = 1e-12;

void require_valid_spiral(const SpiralParams& params) {
    if (!(params.a > 0.0)) {
        throw std::invalid_argument("spiral initial radius a must be positive");
    }
    if (!(params.b > 0.0)) {
        throw std::invalid_argument("spiral growth rate b must be positive");
    }
}

}  // namespace

PolarDecomposition decompose_polar(const SpiralParams& params) {
    auto log = spirob::logging::get_logger();
    require_valid_spiral(params);

    PolarDecomposition result;
    const double two_pi = 2.0 * std::numbers::pi;
    const double theta_end = two_pi * params.turns();
    const double dtheta = params.dtheta_rad();
    const double c_factor = params.central_factor();
    result.sweep_end = std::max(0.0, theta_end - two_pi);

    double theta = 0.0;
    while (theta <= theta_end + kBoundaryTolerance) {
        double r = params.radius_at(theta);
        result.theta_samples.push_back(theta);
        result.r_samples.push_back(r);
        result.rc_samples.push_back(c_factor * r);
        theta += dtheta;
    }

    // The central spiral trails the outer one by a full turn, so units
    // stop once a step would carry it past sweep_end.
    for (std::size_t i = 0; i + 1 < result.theta_samples.size(); ++i) {
        double t0 = result.theta_samples[i];
        double t1 = result.theta_samples[i + 1];
        if (t1 > result.sweep_end + kBoundaryTolerance) {
            break;
        }
        double r0 = result.r_samples[i];
        double r1 = result.r_samples[i + 1];
        double rc0 = result.rc_samples[i];
        double rc1 = result.rc_samples[i + 1];

        PolarUnit primary;
        primary.theta = {t0, t1, t1, t0};
        primary.r = {r0, r1, rc1, rc0};
        result.primary.push_back(primary);

        Vec2 p0 = polar_to_cartesian(t0, r0);
        Vec2 p1 = polar_to_cartesian(t1, r1);
        Vec2 q0 = polar_to_cartesian(t0, rc0);
        Vec2 q1 = polar_to_cartesian(t1, rc1);
        PolarPoint p0m = cartesian_to_polar(reflect_across_line(p0, q0, q1));
        PolarPoint p1m = cartesian_to_polar(reflect_across_line(p1, q0, q1));

        PolarUnit mirror;
        mirror.theta = {t0, t1, p1m.theta, p0m.theta};
        mirror.r = {rc0, rc1, p1m.r, p0m.r};
        result.mirror.push_back(mirror);
    }

    log->debug("decompose_polar: {} samples, {} units (sweep end {:.4f} rad)",
               result.theta_samples.size(), result.primary.size(), result.sweep_end);
    return result;
}

FlatUnit FlatUnit::scaled(double factor) const {
    FlatUnit out;
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        out.vertices[i] = vertices[i] * factor;
    }
    return out;
}

FlatUnit FlatUnit::translated(const Vec2& offset) const {
    FlatUnit out;
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        out.vertices[i] = vertices[i] + offset;
    }
    return out;
}

FlatUnit FlatUnit::mirrored() const {
    FlatUnit out;
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        out.vertices[i] = vertices[i].mirrored_y();
    }
    return out;
}

double FlatUnit::max_x() const {
    double m = vertices[0].x;
    for (const auto& v : vertices) {
        m = std::max(m, v.x);
    }
    return m;
}

double FlatUnit::max_y() const {
    double m = vertices[0].y;
    for (const auto& v : vertices) {
        m = std::max(m, v.y);
    }
    return m;
}

FlatUnit compute_base_quad(const SpiralParams& params) {
    require_valid_spiral(params);

    const double dtheta = params.dtheta_rad();
    const double c_factor = params.central_factor();
    const double r0 = params.a;
    const double r1 = params.radius_at(dtheta);

    Vec2 p0 = polar_to_cartesian(0.0, r0);
    Vec2 p1 = polar_to_cartesian(dtheta, r1);
    Vec2 q0 = polar_to_cartesian(0.0, c_factor * r0);
    Vec2 q1 = polar_to_cartesian(dtheta, c_factor * r1);

    // Rotate the chord q0-q1 onto +X
    Vec2 dq = q1 - q0;
    double angle = -std::atan2(dq.y, dq.x);
    double cos_a = std::cos(angle);
    double sin_a = std::sin(angle);
    auto rot = [cos_a, sin_a](const Vec2& pt) {
        return Vec2(pt.x * cos_a - pt.y * sin_a, pt.x * sin_a + pt.y * cos_a);
    };

    FlatUnit base;
    base.vertices = {rot(p0), rot(p1), rot(q1), rot(q0)};
    return base;
}

std::size_t flat_unit_count(const PolarDecomposition& polar) {
    return std::max<std::size_t>(1, polar.unit_count());
}

}  // namespace spirob
