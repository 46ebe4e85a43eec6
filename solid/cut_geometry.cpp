#include "cut_geometry.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace spirob {

namespace {

constexpr double kMinLength = 1e-6;
constexpr double kMinNormal = 1e-9;

double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

double cone1_alpha(double cone1_deg) {
    return -(cone1_deg * 0.5) * std::numbers::pi / 180.0;
}

}  // namespace

std::array<HalfSpace, 2> cone1_half_spaces(double base_x, double thickness, double cone1_deg) {
    double alpha = cone1_alpha(cone1_deg);
    double half_z = thickness * 0.5;
    return {{
        {Vec3(base_x, 0.0, half_z), Vec3(std::sin(alpha), 0.0, std::cos(alpha))},
        {Vec3(base_x, 0.0, -half_z), Vec3(std::sin(alpha), 0.0, -std::cos(alpha))},
    }};
}

double half_space_extent(const RobotDimensions& dims, double thickness) {
    return std::max({dims.robot_length, dims.base_size, thickness}) * 10.0;
}

std::optional<FrustumGeometry> frustum_geometry(const RobotDimensions& dims,
                                                const SolidSettings& settings) {
    if (dims.robot_length <= kMinLength) {
        return std::nullopt;
    }

    FrustumGeometry frustum;
    frustum.p0 = Vec3(0.0, clamp01(settings.tip_hole_pos) * (dims.tip_size * 0.5), 0.0);
    frustum.p1 = Vec3(dims.robot_length, clamp01(settings.base_hole_pos) * (dims.base_size * 0.5), 0.0);
    frustum.alignment = align_x_axis(frustum.p0, frustum.p1);

    double length = frustum.alignment.length;
    if (length <= kMinLength) {
        return std::nullopt;
    }
    frustum.profile = {{
        Vec2(0.0, 0.0),
        Vec2(length, 0.0),
        Vec2(length, settings.base_hole_size * 0.5),
        Vec2(0.0, settings.tip_hole_size * 0.5),
    }};
    return frustum;
}

Profile Cone2Frame::rectangle() const {
    return {
        p0,
        p0 + x_dir * width,
        p0 + x_dir * width + y_dir * height,
        p0 + y_dir * height,
    };
}

std::optional<Cone2Frame> cone2_frame(const RobotDimensions& dims,
                                      const SolidSettings& settings) {
    if (std::abs(settings.cone_angle2) <= kMinLength || dims.robot_length <= kMinLength) {
        return std::nullopt;
    }

    double thickness = settings.thickness();
    double base_x = dims.robot_length;
    double alpha = cone1_alpha(settings.cone_angle1);

    Cone2Frame frame;
    frame.p0 = Vec3(0.0, 0.0, thickness * 0.5 + std::tan(alpha) * base_x);
    frame.p1 = Vec3(dims.robot_length, 0.0, thickness * 0.5);
    Vec3 v1 = frame.p1 - frame.p0;
    Vec3 v2(0.0, dims.base_size, 0.0);

    frame.width = v1.length();
    frame.height = std::max(kMinLength, dims.base_size);
    if (frame.width <= kMinLength) {
        return std::nullopt;
    }

    Vec3 n = v1.cross(v2);
    double n_len = n.length();
    if (n_len <= kMinNormal) {
        return std::nullopt;
    }
    frame.x_dir = v1 / frame.width;
    frame.normal = n / n_len;
    frame.y_dir = frame.normal.cross(frame.x_dir);
    return frame;
}

double polygon_area(const std::array<Vec2, 4>& polygon) {
    double twice = 0.0;
    for (std::size_t i = 0; i < polygon.size(); ++i) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[(i + 1) % polygon.size()];
        twice += a.cross(b);
    }
    return std::abs(twice) * 0.5;
}

}  // namespace spirob
