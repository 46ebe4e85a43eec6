#ifndef SPIROB_SERIALIZATION_PARAMS_JSON_HPP
#define SPIROB_SERIALIZATION_PARAMS_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <spiral/design_params.hpp>
#include "json_serialization.hpp"
#include <string>

namespace spirob {

// Vec2 / Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
}

inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
    v.z = j[2].get<double>();
}

// DesignParams serialization, one flat object. "extrusion": null means
// the thickness is derived from the geometry.
inline void to_json(nlohmann::json& j, const DesignParams& params) {
    j = {
        {"a", params.spiral.a},
        {"b", params.spiral.b},
        {"dtheta_deg", params.spiral.dtheta_deg},
        {"theta_max_pi", params.spiral.theta_max_pi},
        {"p", params.spiral.p},
        {"elastic_enabled", params.elastic_enabled},
        {"elastic_percent", params.elastic_percent},
        {"cone_angle1", params.cone_angle1},
        {"cone_angle2", params.cone_angle2},
        {"tip_hole_pos", params.tip_hole_pos},
        {"tip_hole_size", params.tip_hole_size},
        {"base_hole_pos", params.base_hole_pos},
        {"base_hole_size", params.base_hole_size},
        {"sim_stiffness", params.sim_stiffness},
        {"sim_damping", params.sim_damping},
        {"two_cable", params.two_cable()}
    };
    if (params.extrusion) {
        j["extrusion"] = *params.extrusion;
    } else {
        j["extrusion"] = nullptr;
    }
}

inline void from_json(const nlohmann::json& j, DesignParams& params) {
    const DesignParams defaults;
    params.spiral.a = j.value("a", defaults.spiral.a);
    params.spiral.b = j.value("b", defaults.spiral.b);
    params.spiral.dtheta_deg = j.value("dtheta_deg", defaults.spiral.dtheta_deg);
    params.spiral.theta_max_pi = j.value("theta_max_pi", defaults.spiral.theta_max_pi);
    params.spiral.p = j.value("p", defaults.spiral.p);
    params.elastic_enabled = j.value("elastic_enabled", defaults.elastic_enabled);
    params.elastic_percent = j.value("elastic_percent", defaults.elastic_percent);
    params.cone_angle1 = j.value("cone_angle1", defaults.cone_angle1);
    params.cone_angle2 = j.value("cone_angle2", defaults.cone_angle2);
    params.tip_hole_pos = j.value("tip_hole_pos", defaults.tip_hole_pos);
    params.tip_hole_size = j.value("tip_hole_size", defaults.tip_hole_size);
    params.base_hole_pos = j.value("base_hole_pos", defaults.base_hole_pos);
    params.base_hole_size = j.value("base_hole_size", defaults.base_hole_size);
    params.sim_stiffness = j.value("sim_stiffness", defaults.sim_stiffness);
    params.sim_damping = j.value("sim_damping", defaults.sim_damping);
    params.cable_mode = j.value("two_cable", true) ? CableMode::TwoCable : CableMode::ThreeCable;

    params.extrusion.reset();
    if (j.contains("extrusion") && !j["extrusion"].is_null()) {
        params.extrusion = j["extrusion"].get<double>();
    }
}

namespace json {

// Parameters from a file holding either a bare object or a "params" envelope.
// An empty path yields the defaults.
inline DesignParams load_params(const std::string& path) {
    if (path.empty()) {
        return DesignParams{};
    }
    nlohmann::json j = read_json_file(path);
    if (j.contains("step") && j.contains("data")) {
        SerializedData envelope = j.get<SerializedData>();
        require_step(envelope, "params");
        return envelope.data.get<DesignParams>();
    }
    return j.get<DesignParams>();
}

}  // namespace json

}  // namespace spirob

#endif // SPIROB_SERIALIZATION_PARAMS_JSON_HPP
