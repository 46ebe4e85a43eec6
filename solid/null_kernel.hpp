#ifndef SPIROB_SOLID_NULL_KERNEL_HPP
#define SPIROB_SOLID_NULL_KERNEL_HPP

#include "solid_kernel.hpp"

namespace spirob {

// Stand-in used when no modelling kernel is compiled in. Reports itself
// unavailable; any operation reaching it raises SolidKernelError.
class NullSolidKernel : public SolidKernel {
public:
    bool available() const override { return false; }
    std::string name() const override { return "none"; }

    Solid extrude(const Profile& profile, const Vec3& direction,
                  double distance, bool symmetric) override;
    Solid revolve(const Profile& profile, const Vec3& axis_origin,
                  const Vec3& axis_dir, double angle_deg) override;
    Solid unite(const Solid& a, const Solid& b) override;
    Solid cut(const Solid& a, const Solid& b) override;
    Solid translate(const Solid& solid, const Vec3& offset) override;
    Solid rotate(const Solid& solid, const Vec3& origin,
                 const Vec3& axis_dir, double angle_deg) override;
    Solid mirror(const Solid& solid, const Vec3& origin, const Vec3& normal) override;
    BoundingBox bounding_box(const Solid& solid) override;
    void export_step(const std::vector<Solid>& parts, const std::string& path) override;
    void export_stl(const Solid& solid, const std::string& path) override;
};

}  // namespace spirob

#endif // SPIROB_SOLID_NULL_KERNEL_HPP
