#include "chain_exporter.hpp"
#include <spiral/spiral_math.hpp>
#include <common/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace spirob {

namespace {

constexpr double kDegToRad = 0.01745;
constexpr double kLineExtent = 1e6;
constexpr double kBaseMass = 0.01;
constexpr double kBaseInertia = 0.0001;
// Three-cable sites sit on a fixed fraction of the robot length, not on
// the hole line used for two-cable sites
constexpr double kThreeCableRadiusFraction = 0.1;
constexpr double kCos120 = -0.5;
constexpr double kSin120 = 0.866;

}  // namespace

CableSites compute_cable_sites(const UnfoldLayout& layout,
                               double tip_fraction,
                               double base_fraction) {
    const RobotDimensions& dims = layout.dimensions();
    const FlatUnit& last = layout.primary().back();

    Vec2 line_p0(0.0, tip_fraction * dims.tip_size * 0.5);
    Vec2 line_p1(dims.robot_length, base_fraction * dims.base_size * 0.5);

    Vec2 dir = line_p1 - line_p0;
    if (std::abs(dir.x) < 1e-9 && std::abs(dir.y) < 1e-9) {
        dir = Vec2(1.0, 0.0);
    }
    dir = dir * (1.0 / dir.length());
    Vec2 line_a = line_p0 - dir * kLineExtent;
    Vec2 line_b = line_p0 + dir * kLineExtent;

    auto left_hit = segment_intersect(line_a, line_b, last.inner_leading(), last.outer_leading());
    auto right_hit = segment_intersect(line_a, line_b, last.inner_trailing(), last.outer_trailing());

    CableSites sites;
    if (left_hit && right_hit) {
        sites.left = *left_hit;
        sites.right = *right_hit;
        return sites;
    }

    spirob::logging::get_logger()->debug("cable line misses the last unit, interpolating");
    sites.intersected = false;
    double x1 = last.inner_leading().x;
    double x2 = last.inner_trailing().x;
    if (std::abs(line_p1.x - line_p0.x) < 1e-9) {
        sites.left = Vec2(x1, line_p0.y);
        sites.right = Vec2(x2, line_p1.y);
    } else {
        double slope = (line_p1.y - line_p0.y) / (line_p1.x - line_p0.x);
        sites.left = Vec2(x1, line_p0.y + slope * (x1 - line_p0.x));
        sites.right = Vec2(x2, line_p0.y + slope * (x2 - line_p0.x));
    }
    return sites;
}

ChainDescription build_chain(const ChainSpec& spec) {
    auto log = spirob::logging::get_logger();

    ChainDescription chain;
    chain.mesh_file = spec.mesh_file;
    chain.mesh_scale = spec.scale;
    chain.base_height = spec.unit_height;
    chain.joint = spec.joint;
    chain.joint_range = spec.joint_limit_deg * kDegToRad;
    chain.stiffness = spec.stiffness;
    chain.damping = spec.damping;

    for (std::size_t i = 0; i < spec.num_units; ++i) {
        double s = std::pow(spec.scale, static_cast<double>(i));

        BodyRecord body;
        body.name = fmt::format("link_{}", i);
        body.offset = spec.unit_height * s;
        body.scale = s;
        body.mass = kBaseMass * s;
        body.inertia = kBaseInertia * s;
        body.joint_name = fmt::format("joint_{}", i);

        if (spec.joint == JointKind::Hinge) {
            if (spec.sites) {
                body.sites.push_back({fmt::format("cable1_unit{}", i),
                                      Vec3(spec.sites->left.x * s, spec.sites->left.y * s, 0.0)});
                body.sites.push_back({fmt::format("cable2_unit{}", i),
                                      Vec3(spec.sites->right.x * s, spec.sites->right.y * s, 0.0)});
            }
        } else {
            double radius = spec.robot_length * kThreeCableRadiusFraction * s;
            double x = spec.unit_height * s * 0.5;
            body.sites.push_back({fmt::format("cable1_unit{}", i), Vec3(x, radius, 0.0)});
            body.sites.push_back({fmt::format("cable2_unit{}", i),
                                  Vec3(x, kCos120 * radius, kSin120 * radius)});
            body.sites.push_back({fmt::format("cable3_unit{}", i),
                                  Vec3(x, kCos120 * radius, -kSin120 * radius)});
        }

        for (std::size_t k = 0; k < body.sites.size(); ++k) {
            ActuatorRecord act;
            act.name = fmt::format("cable{}_act{}", k + 1, i);
            act.site = body.sites[k].name;
            chain.actuators.push_back(act);
        }
        chain.bodies.push_back(std::move(body));
    }

    log->debug("build_chain: {} bodies, {} actuators, joint {}",
               chain.bodies.size(), chain.actuators.size(), to_string(chain.joint));
    return chain;
}

ChainSpec chain_spec_for(const DesignParams& params, const UnfoldLayout& layout) {
    const RobotDimensions& dims = layout.dimensions();

    ChainSpec spec;
    spec.unit_height = dims.unit_height;
    spec.scale = dims.gamma;
    spec.num_units = layout.unit_count();
    spec.joint = params.two_cable() ? JointKind::Hinge : JointKind::Ball;
    spec.joint_limit_deg = static_cast<double>(params.spiral.step_deg());
    spec.robot_length = dims.robot_length;
    spec.stiffness = params.sim_stiffness;
    spec.damping = params.sim_damping;
    if (params.two_cable() && !layout.primary().empty()) {
        spec.sites = compute_cable_sites(layout, params.tip_hole_pos / 100.0,
                                         params.base_hole_pos / 100.0);
    }
    return spec;
}

}  // namespace spirob
