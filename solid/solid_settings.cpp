#include "solid_settings.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <numbers>

namespace spirob {

namespace {
constexpr double kMinLength = 1e-6;
}  // namespace

ValueRange extrusion_range(double base_size) {
    ValueRange range;
    range.min = std::max(0.0, base_size * 0.2);
    range.max = std::max(range.min, base_size);
    return range;
}

double default_extrusion(double base_size) {
    return std::max(0.0, base_size * 0.6);
}

ValueRange cone1_range(double extrusion, double robot_length) {
    ValueRange range;
    if (robot_length > kMinLength) {
        range.max = 2.0 * std::atan((extrusion * 0.5) / robot_length) * 180.0 / std::numbers::pi;
    }
    range.max = std::max(0.0, range.max);
    return range;
}

ValueRange cone2_range(double taper_angle_deg) {
    ValueRange range;
    range.max = std::max(0.0, 4.0 * taper_angle_deg);
    return range;
}

SolidSettings resolve_solid_settings(const DesignParams& params,
                                     const RobotDimensions& dims,
                                     double extrusion) {
    auto log = spirob::logging::get_logger();

    SolidSettings settings;
    settings.cable_mode = params.cable_mode;
    settings.extrusion = extrusion;

    ValueRange cone1 = cone1_range(extrusion, dims.robot_length);
    settings.cone_angle1 = cone1.clamp(params.cone_angle1);
    if (settings.cone_angle1 != params.cone_angle1) {
        log->debug("cone1 angle {:.3f} clamped to {:.3f} (range [{:.3f}, {:.3f}])",
                   params.cone_angle1, settings.cone_angle1, cone1.min, cone1.max);
    }

    ValueRange cone2 = cone2_range(dims.taper_angle_deg);
    settings.cone_angle2 = cone2.clamp(params.cone_angle2);
    if (settings.cone_angle2 != params.cone_angle2) {
        log->debug("cone2 angle {:.3f} clamped to {:.3f} (range [{:.3f}, {:.3f}])",
                   params.cone_angle2, settings.cone_angle2, cone2.min, cone2.max);
    }

    settings.tip_hole_pos = params.tip_hole_pos / 100.0;
    settings.tip_hole_size = params.tip_hole_size;
    settings.base_hole_pos = params.base_hole_pos / 100.0;
    settings.base_hole_size = params.base_hole_size;
    return settings;
}

}  // namespace spirob
