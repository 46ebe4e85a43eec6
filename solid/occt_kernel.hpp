#ifndef SPIROB_SOLID_OCCT_KERNEL_HPP
#define SPIROB_SOLID_OCCT_KERNEL_HPP

#include "solid_kernel.hpp"
#include <TopoDS_Shape.hxx>
#include <utility>

namespace spirob {

// Shape held by the OpenCASCADE kernel
class OcctShape : public SolidShape {
public:
    explicit OcctShape(TopoDS_Shape shape) : shape_(std::move(shape)) {}
    const TopoDS_Shape& shape() const { return shape_; }

private:
    TopoDS_Shape shape_;
};

// SolidKernel backed by OpenCASCADE Technology
class OcctSolidKernel : public SolidKernel {
public:
    bool available() const override { return true; }
    std::string name() const override { return "OpenCASCADE"; }

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

    // STL tessellation tolerances
    double linear_deflection = 0.01;
    double angular_deflection = 0.5;
};

}  // namespace spirob

#endif // SPIROB_SOLID_OCCT_KERNEL_HPP
