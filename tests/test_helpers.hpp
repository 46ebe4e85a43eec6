#ifndef SPIROB_TEST_HELPERS_HPP
#define SPIROB_TEST_HELPERS_HPP

#include <solid/solid_kernel.hpp>
#include <spiral/design_params.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace spirob {
namespace test {

// Shape handle produced by RecordingKernel
struct RecordedShape : SolidShape {
    std::size_t id = 0;
    std::string op;
};

// One kernel call with the arguments worth checking
struct KernelCall {
    std::string op;
    Vec3 vec;              // direction, offset or axis
    Vec3 origin;
    double value = 0.0;    // distance or angle
    bool symmetric = false;
    std::size_t count = 0; // profile vertices or STEP parts
    std::string path;
};

// Fake kernel that hands out opaque handles and logs every call
class RecordingKernel : public SolidKernel {
public:
    std::vector<KernelCall> calls;
    BoundingBox box{Vec3(0.0, -1.0, -1.0), Vec3(100.0, 1.0, 1.0)};

    bool available() const override { return true; }
    std::string name() const override { return "recording"; }

    Solid extrude(const Profile& profile, const Vec3& direction,
                  double distance, bool symmetric) override {
        KernelCall call{"extrude"};
        call.vec = direction;
        call.value = distance;
        call.symmetric = symmetric;
        call.count = profile.size();
        return record(call);
    }

    Solid revolve(const Profile& profile, const Vec3& axis_origin,
                  const Vec3& axis_dir, double angle_deg) override {
        KernelCall call{"revolve"};
        call.origin = axis_origin;
        call.vec = axis_dir;
        call.value = angle_deg;
        call.count = profile.size();
        return record(call);
    }

    Solid unite(const Solid&, const Solid&) override {
        return record(KernelCall{"unite"});
    }

    Solid cut(const Solid&, const Solid&) override {
        return record(KernelCall{"cut"});
    }

    Solid translate(const Solid&, const Vec3& offset) override {
        KernelCall call{"translate"};
        call.vec = offset;
        return record(call);
    }

    Solid rotate(const Solid&, const Vec3& origin,
                 const Vec3& axis_dir, double angle_deg) override {
        KernelCall call{"rotate"};
        call.origin = origin;
        call.vec = axis_dir;
        call.value = angle_deg;
        return record(call);
    }

    Solid mirror(const Solid&, const Vec3& origin, const Vec3& normal) override {
        KernelCall call{"mirror"};
        call.origin = origin;
        call.vec = normal;
        return record(call);
    }

    BoundingBox bounding_box(const Solid&) override {
        calls.push_back(KernelCall{"bounding_box"});
        return box;
    }

    void export_step(const std::vector<Solid>& parts, const std::string& path) override {
        KernelCall call{"export_step"};
        call.count = parts.size();
        call.path = path;
        calls.push_back(call);
    }

    void export_stl(const Solid&, const std::string& path) override {
        KernelCall call{"export_stl"};
        call.path = path;
        calls.push_back(call);
    }

    std::size_t count(const std::string& op) const {
        std::size_t n = 0;
        for (const auto& call : calls) {
            if (call.op == op) {
                ++n;
            }
        }
        return n;
    }

    std::vector<KernelCall> of(const std::string& op) const {
        std::vector<KernelCall> out;
        for (const auto& call : calls) {
            if (call.op == op) {
                out.push_back(call);
            }
        }
        return out;
    }

private:
    Solid record(const KernelCall& call) {
        calls.push_back(call);
        auto shape = std::make_shared<RecordedShape>();
        shape->id = calls.size();
        shape->op = call.op;
        return shape;
    }
};

// Parameters of the reference design (a = 4.95, b = 0.1764, 30 deg, 3 turns)
inline DesignParams reference_params() {
    return DesignParams{};
}

// Smaller design for tests that do not need the full chain
inline DesignParams small_params() {
    DesignParams params;
    params.spiral.theta_max_pi = 3.0;  // 1.5 turns, half a turn of units
    params.spiral.dtheta_deg = 45;
    return params;
}

}  // namespace test
}  // namespace spirob

#endif // SPIROB_TEST_HELPERS_HPP
