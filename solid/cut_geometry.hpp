#ifndef SPIROB_SOLID_CUT_GEOMETRY_HPP
#define SPIROB_SOLID_CUT_GEOMETRY_HPP

#include "solid_kernel.hpp"
#include "solid_settings.hpp"
#include <layout/unfold_layout.hpp>
#include <math/rotation.hpp>
#include <array>
#include <optional>

namespace spirob {

// Half-space {x : (x - origin) . normal > 0}, the side that gets removed
struct HalfSpace {
    Vec3 origin;
    Vec3 normal;
};

// The two cone1 planes, tilted by half the cone1 angle from the top and
// bottom faces and anchored at x = base_x.
std::array<HalfSpace, 2> cone1_half_spaces(double base_x, double thickness, double cone1_deg);

// Edge of the cube used to remove a half-space
double half_space_extent(const RobotDimensions& dims, double thickness);

// Tapered hole from the tip to the base, modelled along +X and then aligned
struct FrustumGeometry {
    Vec3 p0;                       // hole centre at the tip
    Vec3 p1;                       // hole centre at the base
    std::array<Vec2, 4> profile{}; // revolved about +X
    AxisAlignment alignment;
};

// Absent for a zero-length robot or coincident hole centres
std::optional<FrustumGeometry> frustum_geometry(const RobotDimensions& dims,
                                                const SolidSettings& settings);

// Plane and rectangle of the cone2 wedge before rotation and mirroring
struct Cone2Frame {
    Vec3 p0;       // on the cone1 plane above the tip
    Vec3 p1;       // top face at the base
    Vec3 x_dir;
    Vec3 y_dir;
    Vec3 normal;
    double width = 0.0;   // |p1 - p0|
    double height = 0.0;  // base size

    Profile rectangle() const;
};

// Absent when cone2 is zero or the plane is degenerate
std::optional<Cone2Frame> cone2_frame(const RobotDimensions& dims,
                                      const SolidSettings& settings);

// Unsigned area of a quadrilateral (shoelace)
double polygon_area(const std::array<Vec2, 4>& polygon);

}  // namespace spirob

#endif // SPIROB_SOLID_CUT_GEOMETRY_HPP
