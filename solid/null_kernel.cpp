#include "null_kernel.hpp"

namespace spirob {

namespace {

[[noreturn]] void unavailable(const char* operation) {
    throw SolidKernelError(std::string("solid kernel unavailable: ") + operation);
}

}  // namespace

Solid NullSolidKernel::extrude(const Profile&, const Vec3&, double, bool) {
    unavailable("extrude");
}

Solid NullSolidKernel::revolve(const Profile&, const Vec3&, const Vec3&, double) {
    unavailable("revolve");
}

Solid NullSolidKernel::unite(const Solid&, const Solid&) {
    unavailable("union");
}

Solid NullSolidKernel::cut(const Solid&, const Solid&) {
    unavailable("cut");
}

Solid NullSolidKernel::translate(const Solid&, const Vec3&) {
    unavailable("translate");
}

Solid NullSolidKernel::rotate(const Solid&, const Vec3&, const Vec3&, double) {
    unavailable("rotate");
}

Solid NullSolidKernel::mirror(const Solid&, const Vec3&, const Vec3&) {
    unavailable("mirror");
}

BoundingBox NullSolidKernel::bounding_box(const Solid&) {
    unavailable("bounding box");
}

void NullSolidKernel::export_step(const std::vector<Solid>&, const std::string&) {
    unavailable("STEP export");
}

void NullSolidKernel::export_stl(const Solid&, const std::string&) {
    unavailable("STL export");
}

}  // namespace spirob
