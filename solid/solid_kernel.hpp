#ifndef SPIROB_SOLID_SOLID_KERNEL_HPP
#define SPIROB_SOLID_SOLID_KERNEL_HPP

#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace spirob {

// Raised when a kernel operation cannot produce a valid shape or file
class SolidKernelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Kernel-owned shape. Each kernel stores its own subclass.
class SolidShape {
public:
    virtual ~SolidShape() = default;
};

// Shared, immutable handle; a null handle means "no solid"
using Solid = std::shared_ptr<const SolidShape>;

// Closed planar polygon, vertices in order, last edge implied
using Profile = std::vector<Vec3>;

struct BoundingBox {
    Vec3 min;
    Vec3 max;
};

// Lift a sketch-plane polygon into a profile at z = 0
template <std::size_t N>
Profile to_profile(const std::array<Vec2, N>& polygon) {
    Profile profile;
    profile.reserve(N);
    for (const auto& v : polygon) {
        profile.push_back(v.to_vec3());
    }
    return profile;
}

// Capability interface to a BREP modelling kernel.
//
// Every call is synchronous. Angles are in degrees. Operations return
// new handles and never modify their inputs.
class SolidKernel {
public:
    virtual ~SolidKernel() = default;

    // False for the null kernel; callers skip all solid work then
    virtual bool available() const = 0;
    virtual std::string name() const = 0;

    // Prism of `profile` along `direction`. With `symmetric` the prism
    // spans `distance` on both sides of the profile plane.
    virtual Solid extrude(const Profile& profile, const Vec3& direction,
                          double distance, bool symmetric) = 0;

    virtual Solid revolve(const Profile& profile, const Vec3& axis_origin,
                          const Vec3& axis_dir, double angle_deg) = 0;

    virtual Solid unite(const Solid& a, const Solid& b) = 0;
    virtual Solid cut(const Solid& a, const Solid& b) = 0;

    virtual Solid translate(const Solid& solid, const Vec3& offset) = 0;
    virtual Solid rotate(const Solid& solid, const Vec3& origin,
                         const Vec3& axis_dir, double angle_deg) = 0;

    // Reflection across the plane through `origin` with normal `normal`
    virtual Solid mirror(const Solid& solid, const Vec3& origin, const Vec3& normal) = 0;

    virtual BoundingBox bounding_box(const Solid& solid) = 0;

    // One STEP file holding every part as a separate body
    virtual void export_step(const std::vector<Solid>& parts, const std::string& path) = 0;

    // Triangulated mesh of a single solid
    virtual void export_stl(const Solid& solid, const std::string& path) = 0;
};

// Kernel chosen at build time: OpenCASCADE when compiled in, else the null kernel
std::unique_ptr<SolidKernel> make_solid_kernel();

// True when make_solid_kernel() returns a working kernel
bool solid_kernel_available();

}  // namespace spirob

#endif // SPIROB_SOLID_SOLID_KERNEL_HPP
