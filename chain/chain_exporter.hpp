#ifndef SPIROB_CHAIN_CHAIN_EXPORTER_HPP
#define SPIROB_CHAIN_CHAIN_EXPORTER_HPP

#include <layout/unfold_layout.hpp>
#include <math/vec3.hpp>
#include <optional>
#include <string>
#include <vector>

namespace spirob {

enum class JointKind {
    Hinge,  // two-cable, planar bending
    Ball    // three-cable, spatial bending
};

inline const char* to_string(JointKind kind) {
    return kind == JointKind::Hinge ? "hinge" : "ball";
}

// Cable attachment points on the rightmost unit, in its unscaled frame
struct CableSites {
    Vec2 left;
    Vec2 right;
    bool intersected = true;  // false when the interpolation fallback was used
};

// Where the cable line from the tip hole to the base hole crosses the last
// unit's leading edge (q0-p0) and trailing edge (q1-p1). Falls back to
// evaluating the line at q0.x and q1.x when either edge is missed.
// `tip_fraction` and `base_fraction` are fractions of the half-widths.
CableSites compute_cable_sites(const UnfoldLayout& layout,
                               double tip_fraction,
                               double base_fraction);

// Inputs of the chain, all other values follow from these
struct ChainSpec {
    std::string mesh_file = "baselink.stl";
    double unit_height = 1.0;
    double scale = 1.0;         // gamma
    std::size_t num_units = 1;
    JointKind joint = JointKind::Hinge;
    double joint_limit_deg = 30.0;
    double robot_length = 0.0;
    double stiffness = 0.5;
    double damping = 0.2;
    std::optional<CableSites> sites;  // two-cable only
};

struct SiteRecord {
    std::string name;
    Vec3 pos;
};

struct ActuatorRecord {
    std::string name;
    std::string site;
    double kp = 100.0;
    double kv = 10.0;
};

// One nested link; body i is the child of body i - 1
struct BodyRecord {
    std::string name;
    double offset = 0.0;      // along the chain axis, relative to the parent
    double scale = 1.0;       // gamma^i
    double mass = 0.0;
    double inertia = 0.0;     // diagonal value
    std::string joint_name;
    std::vector<SiteRecord> sites;
};

struct ChainDescription {
    std::string model_name = "spiral_robot";
    std::string mesh_file;
    double mesh_scale = 1.0;
    double base_height = 0.0;
    JointKind joint = JointKind::Hinge;
    double joint_range = 0.0;  // radians, symmetric
    double stiffness = 0.0;
    double damping = 0.0;
    std::vector<BodyRecord> bodies;
    std::vector<ActuatorRecord> actuators;
};

// Build the nested chain: one body, joint and site set per unit
ChainDescription build_chain(const ChainSpec& spec);

// Chain inputs derived from a layout and the design parameters
ChainSpec chain_spec_for(const DesignParams& params, const UnfoldLayout& layout);

}  // namespace spirob

#endif // SPIROB_CHAIN_CHAIN_EXPORTER_HPP
