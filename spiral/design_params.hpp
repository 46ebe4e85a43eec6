#ifndef SPIROB_SPIRAL_DESIGN_PARAMS_HPP
#define SPIROB_SPIRAL_DESIGN_PARAMS_HPP

#include <common/validation.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>
#include <string>

namespace spirob {

// Shape of the logarithmic spiral r = a * e^(b * theta) and its decomposition
struct SpiralParams {
    double a = 4.95;            // Initial radius (mm)
    double b = 0.1764;          // Growth rate
    int dtheta_deg = 30;        // Angular step between units (degrees)
    double theta_max_pi = 6.0;  // Sweep of the outer spiral, in multiples of pi
    double p = 0.5;             // Central-spiral blend factor [0, 0.5]

    static constexpr int kMinStepDeg = 1;
    static constexpr int kMaxStepDeg = 60;

    // Full turns swept by the outer spiral
    double turns() const {
        return std::max(0.1, theta_max_pi / 2.0);
    }

    int step_deg() const {
        return std::clamp(dtheta_deg, kMinStepDeg, kMaxStepDeg);
    }

    double dtheta_rad() const {
        return static_cast<double>(step_deg()) * std::numbers::pi / 180.0;
    }

    // Per-step growth ratio gamma = e^(b * dtheta)
    double gamma() const {
        return std::exp(b * dtheta_rad());
    }

    // Radius ratio of the central spiral to the outer spiral
    double central_factor() const {
        double eb = std::exp(2.0 * std::numbers::pi * b);
        return (1.0 - p) + p * eb;
    }

    double radius_at(double theta) const {
        return a * std::exp(b * theta);
    }

    ValidationResult validate() const {
        ValidationResult result;
        if (!(a > 0.0)) {
            result.add_error("spiral initial radius a must be positive");
        }
        if (!(b > 0.0)) {
            result.add_error("spiral growth rate b must be positive");
        } else if (b > 0.35) {
            result.add_warning("spiral growth rate b above 0.35 is outside the tested range");
        }
        if (dtheta_deg < kMinStepDeg || dtheta_deg > kMaxStepDeg) {
            result.add_warning("angular step clamped to [1, 60] degrees");
        }
        if (p < 0.0 || p > 0.5) {
            result.add_warning("central-spiral blend p outside [0, 0.5]");
        }
        if (theta_max_pi < 0.1) {
            result.add_warning("sweep below 0.1 pi is raised to 0.1 turns");
        }
        return result;
    }
};

enum class CableMode {
    TwoCable,    // Planar limb, extruded units, hinge joints
    ThreeCable   // Axisymmetric limb, revolved units, ball joints
};

inline const char* to_string(CableMode mode) {
    return mode == CableMode::TwoCable ? "two_cable" : "three_cable";
}

// Complete parameter surface consumed by the pipeline
struct DesignParams {
    SpiralParams spiral;

    // Elastic layer along the neutral axis
    bool elastic_enabled = true;
    double elastic_percent = 5.0;

    // Total extrusion thickness (mm); empty means "derive from geometry"
    std::optional<double> extrusion;

    // Cable-routing cuts (degrees)
    double cone_angle1 = 5.0;
    double cone_angle2 = 15.0;

    // Cable holes: positions in percent of the half-width, sizes in mm
    double tip_hole_pos = 50.0;
    double tip_hole_size = 1.4;
    double base_hole_pos = 90.0;
    double base_hole_size = 3.0;

    // Joint properties for the simulation chain
    double sim_stiffness = 0.5;
    double sim_damping = 0.2;

    CableMode cable_mode = CableMode::TwoCable;

    bool two_cable() const {
        return cable_mode == CableMode::TwoCable;
    }

    ValidationResult validate() const {
        ValidationResult result = spiral.validate();
        if (elastic_percent < 0.0 || elastic_percent > 100.0) {
            result.add_warning("elastic_percent outside [0, 100]");
        }
        if (extrusion && !(*extrusion > 0.0)) {
            result.add_error("extrusion thickness must be positive");
        }
        if (tip_hole_size < 0.0 || base_hole_size < 0.0) {
            result.add_error("hole sizes must not be negative");
        }
        if (cone_angle1 < 0.0 || cone_angle2 < 0.0) {
            result.add_warning("negative cone angles are treated as zero");
        }
        return result;
    }
};

}  // namespace spirob

#endif // SPIROB_SPIRAL_DESIGN_PARAMS_HPP
