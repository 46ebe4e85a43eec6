#ifndef SPIROB_SERIALIZATION_LAYOUT_JSON_HPP
#define SPIROB_SERIALIZATION_LAYOUT_JSON_HPP

#include <nlohmann/json.hpp>
#include <spiral/unit_decomposer.hpp>
#include <layout/unfold_layout.hpp>
#include <solid/solid_settings.hpp>
#include <session/design_session.hpp>
#include "params_json.hpp"

namespace spirob {

// PolarUnit serialization
inline void to_json(nlohmann::json& j, const PolarUnit& unit) {
    j = {
        {"theta", unit.theta},
        {"r", unit.r}
    };
}

inline void from_json(const nlohmann::json& j, PolarUnit& unit) {
    unit.theta = j["theta"].get<std::array<double, 4>>();
    unit.r = j["r"].get<std::array<double, 4>>();
}

// FlatUnit serialization: the four vertices in polygon order
inline void to_json(nlohmann::json& j, const FlatUnit& unit) {
    j = unit.vertices;
}

inline void from_json(const nlohmann::json& j, FlatUnit& unit) {
    if (j.size() != 4) {
        throw std::runtime_error("FlatUnit must have exactly 4 vertices");
    }
    unit.vertices = j.get<std::array<Vec2, 4>>();
}

inline void to_json(nlohmann::json& j, const ElasticLayer& elastic) {
    j = {
        {"polygon", elastic.polygon},
        {"mirror", elastic.mirror}
    };
}

inline void to_json(nlohmann::json& j, const ElasticRays& rays) {
    j = {
        {"start", rays.start},
        {"upper_end", rays.upper_end},
        {"lower_end", rays.lower_end},
        {"slope", rays.slope}
    };
}

inline void to_json(nlohmann::json& j, const RobotDimensions& dims) {
    j = {
        {"tip_size", dims.tip_size},
        {"base_size", dims.base_size},
        {"robot_length", dims.robot_length},
        {"taper_angle_deg", dims.taper_angle_deg},
        {"gamma", dims.gamma},
        {"l_vtip", dims.l_vtip},
        {"unit_height", dims.unit_height}
    };
}

inline void to_json(nlohmann::json& j, const ValueRange& range) {
    j = nlohmann::json::array({range.min, range.max});
}

inline void to_json(nlohmann::json& j, const SolidSettings& settings) {
    j = {
        {"cable_mode", to_string(settings.cable_mode)},
        {"extrusion", settings.extrusion},
        {"thickness", settings.thickness()},
        {"cone_angle1", settings.cone_angle1},
        {"cone_angle2", settings.cone_angle2},
        {"tip_hole_pos", settings.tip_hole_pos},
        {"tip_hole_size", settings.tip_hole_size},
        {"base_hole_pos", settings.base_hole_pos},
        {"base_hole_size", settings.base_hole_size}
    };
}

// Polar decomposition: spiral samples plus the units
inline nlohmann::json polar_to_json(const PolarDecomposition& polar) {
    nlohmann::json j;
    j["theta"] = polar.theta_samples;
    j["r"] = polar.r_samples;
    j["rc"] = polar.rc_samples;
    j["sweep_end"] = polar.sweep_end;
    j["unit_count"] = polar.unit_count();
    j["primary"] = polar.primary;
    j["mirror"] = polar.mirror;
    return j;
}

inline nlohmann::json layout_to_json(const UnfoldLayout& layout) {
    nlohmann::json j;
    j["unit_count"] = layout.unit_count();
    j["primary"] = layout.primary();
    j["mirror"] = layout.mirror();
    if (layout.elastic()) {
        j["elastic"] = *layout.elastic();
    } else {
        j["elastic"] = nullptr;
    }
    j["rays"] = layout.rays();
    j["dimensions"] = layout.dimensions();
    return j;
}

// Layout plus the solid settings resolved for it
inline nlohmann::json snapshot_to_json(const DesignSnapshot& snapshot) {
    nlohmann::json j = layout_to_json(snapshot.layout);
    j["extrusion"] = {
        {"value", snapshot.extrusion},
        {"range", snapshot.extrusion_range},
        {"state", to_string(snapshot.extrusion_state)}
    };
    j["cone1_range"] = cone1_range(snapshot.extrusion, snapshot.dimensions().robot_length);
    j["cone2_range"] = cone2_range(snapshot.dimensions().taper_angle_deg);
    j["solid_settings"] = snapshot.settings;
    return j;
}

}  // namespace spirob

#endif // SPIROB_SERIALIZATION_LAYOUT_JSON_HPP
