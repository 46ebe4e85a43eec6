#ifndef SPIROB_SOLID_SOLID_SETTINGS_HPP
#define SPIROB_SOLID_SOLID_SETTINGS_HPP

#include <spiral/design_params.hpp>
#include <layout/unfold_layout.hpp>
#include <algorithm>

namespace spirob {

// Closed interval a value is clamped into
struct ValueRange {
    double min = 0.0;
    double max = 0.0;

    double clamp(double value) const {
        return std::clamp(value, min, max);
    }
};

// Extrusion thickness bounds [0.2, 1.0] * base size
ValueRange extrusion_range(double base_size);

// Thickness used until the user picks one: 0.6 * base size
double default_extrusion(double base_size);

// Cone1 cut planes meet at the base beyond 2 * atan((extrusion / 2) / length)
ValueRange cone1_range(double extrusion, double robot_length);

// Cone2 wedge may open up to four times the taper angle
ValueRange cone2_range(double taper_angle_deg);

// Parameters of solid construction after clamping to the current geometry
struct SolidSettings {
    CableMode cable_mode = CableMode::TwoCable;
    double extrusion = 1.0;
    double cone_angle1 = 0.0;    // degrees, within cone1_range
    double cone_angle2 = 0.0;    // degrees, within cone2_range
    double tip_hole_pos = 0.5;   // fraction of the tip half-width
    double tip_hole_size = 1.4;  // mm
    double base_hole_pos = 0.9;  // fraction of the base half-width
    double base_hole_size = 3.0; // mm

    // Thickness actually extruded
    double thickness() const {
        return std::max(0.1, extrusion);
    }

    bool two_cable() const {
        return cable_mode == CableMode::TwoCable;
    }
};

// Clamp the requested cone angles into their ranges for `extrusion` and
// the layout's dimensions; hole positions are converted from percent.
SolidSettings resolve_solid_settings(const DesignParams& params,
                                     const RobotDimensions& dims,
                                     double extrusion);

}  // namespace spirob

#endif // SPIROB_SOLID_SOLID_SETTINGS_HPP
