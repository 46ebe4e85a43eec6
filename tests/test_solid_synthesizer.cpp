#include <gtest/gtest.h>
#include <solid/solid_synthesizer.hpp>
#include <solid/null_kernel.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <numbers>

using namespace spirob;
using namespace spirob::test;

namespace {

struct Fixture {
    DesignParams params;
    UnfoldLayout layout;
    SolidSettings settings;
};

Fixture make_fixture(DesignParams params) {
    Fixture f;
    f.params = params;
    f.layout = UnfoldLayout::build(params, decompose_polar(params.spiral));
    const RobotDimensions& dims = f.layout.dimensions();
    f.settings = resolve_solid_settings(params, dims, default_extrusion(dims.base_size));
    return f;
}

}  // namespace

// ============================================
// Kernel unavailable
// ============================================

TEST(SolidSynthesizerTest, NullKernelBuildsNothing) {
    Fixture f = make_fixture(small_params());
    NullSolidKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);

    EXPECT_FALSE(synthesizer.build().has_value());
    EXPECT_EQ(synthesizer.build_unit_mesh(), nullptr);
}

TEST(SolidSynthesizerTest, NullKernelOperationsThrow) {
    NullSolidKernel kernel;
    EXPECT_FALSE(kernel.available());
    Profile triangle = {Vec3(0, 0, 0), Vec3(1, 0, 0), Vec3(0, 1, 0)};
    EXPECT_THROW(kernel.extrude(triangle, vec3::unit_z(), 1.0, true), SolidKernelError);
    EXPECT_THROW(kernel.export_stl(nullptr, "out.stl"), SolidKernelError);
}

// ============================================
// Two-cable assembly
// ============================================

TEST(SolidSynthesizerTest, TwoCableOperationSequence) {
    Fixture f = make_fixture(small_params());
    ASSERT_EQ(f.layout.unit_count(), 4u);
    ASSERT_TRUE(f.layout.elastic().has_value());

    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);
    auto assembly = synthesizer.build();

    ASSERT_TRUE(assembly.has_value());
    EXPECT_TRUE(assembly->has_elastic());

    // 8 unit prisms, 2 elastic prisms, 2 half-space boxes, 1 cone2 wedge
    EXPECT_EQ(kernel.count("extrude"), 13u);
    EXPECT_EQ(kernel.count("revolve"), 1u);
    // cone1 twice, holes, cone2; on main and elastic
    EXPECT_EQ(kernel.count("cut"), 8u);
    EXPECT_EQ(kernel.count("mirror"), 2u);
    EXPECT_EQ(kernel.count("bounding_box"), 1u);

    auto prisms = kernel.of("extrude");
    for (std::size_t i = 0; i < 10; ++i) {
        EXPECT_TRUE(prisms[i].symmetric);
        EXPECT_EQ(prisms[i].vec, vec3::unit_z());
        EXPECT_NEAR(prisms[i].value, f.settings.thickness() * 0.5, 1e-12);
        EXPECT_EQ(prisms[i].count, 4u);
    }

    // Wedge is one-sided, extruded along the cone2 plane normal
    EXPECT_FALSE(prisms.back().symmetric);
    EXPECT_NEAR(prisms.back().value, f.layout.dimensions().base_size * 0.5, 1e-12);

    auto mirrors = kernel.of("mirror");
    EXPECT_EQ(mirrors[0].vec, vec3::unit_z());
    EXPECT_EQ(mirrors[1].vec, vec3::unit_y());
}

TEST(SolidSynthesizerTest, TwoCableHolesAtZeroAndHalfTurn) {
    Fixture f = make_fixture(small_params());
    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);

    Solid holes = synthesizer.make_holes({0.0, 180.0});
    ASSERT_NE(holes, nullptr);

    auto revolves = kernel.of("revolve");
    ASSERT_EQ(revolves.size(), 1u);
    EXPECT_EQ(revolves[0].vec, vec3::unit_x());
    EXPECT_DOUBLE_EQ(revolves[0].value, 360.0);

    auto rotations = kernel.of("rotate");
    ASSERT_EQ(rotations.size(), 2u);  // alignment, then the 180 degree copy
    EXPECT_DOUBLE_EQ(rotations[1].value, 180.0);
    EXPECT_EQ(rotations[1].vec, vec3::unit_x());
    EXPECT_EQ(kernel.count("unite"), 1u);
}

TEST(SolidSynthesizerTest, Cone1UsesClampedAngleAndActualExtent) {
    DesignParams params = small_params();
    params.cone_angle1 = 50.0;
    Fixture f = make_fixture(params);

    double max_cone1 = cone1_range(f.settings.extrusion, f.layout.dimensions().robot_length).max;
    ASSERT_LT(max_cone1, 50.0);
    ASSERT_DOUBLE_EQ(f.settings.cone_angle1, max_cone1);

    RecordingKernel kernel;
    kernel.box.max.x = 123.0;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);
    Solid cut = synthesizer.apply_cone1_cut(std::make_shared<RecordedShape>(), 123.0);
    ASSERT_NE(cut, nullptr);

    auto rotations = kernel.of("rotate");
    ASSERT_EQ(rotations.size(), 2u);
    EXPECT_NEAR(rotations[0].value, -max_cone1 / 2.0, 1e-9);
    EXPECT_EQ(rotations[0].vec, vec3::unit_y());

    double h = half_space_extent(f.layout.dimensions(), f.settings.thickness()) * 0.5;
    double alpha = -(max_cone1 / 2.0) * std::numbers::pi / 180.0;
    auto moves = kernel.of("translate");
    ASSERT_EQ(moves.size(), 2u);
    EXPECT_NEAR(moves[0].vec.x, 123.0 + std::sin(alpha) * h, 1e-9);
    EXPECT_NEAR(moves[0].vec.z, f.settings.thickness() * 0.5 + std::cos(alpha) * h, 1e-9);
    EXPECT_NEAR(moves[1].vec.z, -f.settings.thickness() * 0.5 - std::cos(alpha) * h, 1e-9);
    EXPECT_EQ(kernel.count("cut"), 2u);
}

TEST(SolidSynthesizerTest, ZeroCone1SkipsTheCut) {
    DesignParams params = small_params();
    params.cone_angle1 = 0.0;
    Fixture f = make_fixture(params);

    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);
    Solid input = std::make_shared<RecordedShape>();
    EXPECT_EQ(synthesizer.apply_cone1_cut(input, 10.0), input);
    EXPECT_TRUE(kernel.calls.empty());
}

TEST(SolidSynthesizerTest, ZeroCone2HasNoWedge) {
    DesignParams params = small_params();
    params.cone_angle2 = 0.0;
    Fixture f = make_fixture(params);

    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);
    EXPECT_EQ(synthesizer.make_cone2_tool(), nullptr);
    EXPECT_EQ(kernel.count("extrude"), 0u);
}

TEST(SolidSynthesizerTest, ElasticDisabledHasNoElasticSolid) {
    DesignParams params = small_params();
    params.elastic_enabled = false;
    Fixture f = make_fixture(params);

    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);
    auto assembly = synthesizer.build();

    ASSERT_TRUE(assembly.has_value());
    EXPECT_FALSE(assembly->has_elastic());
    EXPECT_EQ(kernel.count("extrude"), 8u + 2u + 1u);
    EXPECT_EQ(kernel.count("cut"), 4u);
}

TEST(SolidSynthesizerTest, MissedElasticRaysHaveNoElasticSolid) {
    DesignParams params = reference_params();
    params.elastic_percent = 100.0;
    Fixture f = make_fixture(params);
    ASSERT_FALSE(f.layout.elastic().has_value());

    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);
    auto assembly = synthesizer.build();

    ASSERT_TRUE(assembly.has_value());
    EXPECT_FALSE(assembly->has_elastic());
    // 24 units and their mirrors, two half-space boxes, one wedge
    EXPECT_EQ(kernel.count("extrude"), 48u + 2u + 1u);
    EXPECT_EQ(kernel.count("cut"), 4u);
}

// ============================================
// Three-cable assembly
// ============================================

TEST(SolidSynthesizerTest, ThreeCableRevolvesPrimaryUnits) {
    DesignParams params = small_params();
    params.cable_mode = CableMode::ThreeCable;
    Fixture f = make_fixture(params);

    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);
    auto assembly = synthesizer.build();

    ASSERT_TRUE(assembly.has_value());
    EXPECT_TRUE(assembly->has_elastic());
    EXPECT_EQ(kernel.count("extrude"), 0u);
    EXPECT_EQ(kernel.count("mirror"), 0u);
    // 4 units, elastic polygon, frustum
    EXPECT_EQ(kernel.count("revolve"), 6u);
    EXPECT_EQ(kernel.count("cut"), 2u);

    auto rotations = kernel.of("rotate");
    ASSERT_EQ(rotations.size(), 3u);
    EXPECT_DOUBLE_EQ(rotations[1].value, 120.0);
    EXPECT_DOUBLE_EQ(rotations[2].value, 240.0);
}

TEST(SolidSynthesizerTest, ThreeCableHasNoCone2Tool) {
    DesignParams params = small_params();
    params.cable_mode = CableMode::ThreeCable;
    Fixture f = make_fixture(params);

    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);
    EXPECT_EQ(synthesizer.make_cone2_tool(), nullptr);
}

// ============================================
// Unit mesh and export
// ============================================

TEST(SolidSynthesizerTest, UnitMeshIsMovedToTheBase) {
    Fixture f = make_fixture(small_params());
    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);

    Solid mesh = synthesizer.build_unit_mesh();
    ASSERT_NE(mesh, nullptr);

    // Rightmost unit and its mirror, two half-space boxes, cone2 wedge
    EXPECT_EQ(kernel.count("extrude"), 5u);

    ASSERT_GE(kernel.calls.size(), 2u);
    const KernelCall& move = kernel.calls[kernel.calls.size() - 2];
    const KernelCall& turn = kernel.calls.back();
    EXPECT_EQ(move.op, "translate");
    EXPECT_NEAR(move.vec.x, -f.layout.dimensions().robot_length, 1e-12);
    EXPECT_EQ(turn.op, "rotate");
    EXPECT_EQ(turn.vec, vec3::unit_y());
    EXPECT_DOUBLE_EQ(turn.value, 90.0);
}

TEST(SolidSynthesizerTest, ThreeCableUnitMeshIsRevolved) {
    DesignParams params = small_params();
    params.cable_mode = CableMode::ThreeCable;
    Fixture f = make_fixture(params);

    RecordingKernel kernel;
    SolidSynthesizer synthesizer(kernel, f.layout, f.settings);
    ASSERT_NE(synthesizer.build_unit_mesh(), nullptr);
    EXPECT_EQ(kernel.count("revolve"), 1u);
    EXPECT_EQ(kernel.count("cut"), 0u);
}

TEST(SolidSynthesizerTest, ExportKeepsPartsSeparateInStep) {
    RecordingKernel kernel;
    SolidAssembly assembly;
    assembly.main = std::make_shared<RecordedShape>();
    assembly.elastic = std::make_shared<RecordedShape>();

    export_assembly(kernel, assembly, "robot.step", "robot.stl");

    auto steps = kernel.of("export_step");
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].count, 2u);
    EXPECT_EQ(steps[0].path, "robot.step");
    EXPECT_EQ(kernel.count("unite"), 1u);
    ASSERT_EQ(kernel.count("export_stl"), 1u);
    EXPECT_EQ(kernel.of("export_stl")[0].path, "robot.stl");
}

TEST(SolidSynthesizerTest, ExportWithoutElastic) {
    RecordingKernel kernel;
    SolidAssembly assembly;
    assembly.main = std::make_shared<RecordedShape>();

    export_assembly(kernel, assembly, "a.step", "a.stl");
    EXPECT_EQ(kernel.of("export_step")[0].count, 1u);
    EXPECT_EQ(kernel.count("unite"), 0u);
}

// Writes a real STEP file, then fails on the STL
class FailingStlKernel : public RecordingKernel {
public:
    void export_step(const std::vector<Solid>& parts, const std::string& path) override {
        RecordingKernel::export_step(parts, path);
        std::ofstream(path) << "ISO-10303-21;\n";
    }

    void export_stl(const Solid&, const std::string&) override {
        throw SolidKernelError("mesh write failed");
    }
};

TEST(SolidSynthesizerTest, FailedStlRemovesStep) {
    FailingStlKernel kernel;
    SolidAssembly assembly;
    assembly.main = std::make_shared<RecordedShape>();
    auto step = std::filesystem::temp_directory_path() / "spirob_failed_export.step";
    auto stl = std::filesystem::temp_directory_path() / "spirob_failed_export.stl";

    EXPECT_THROW(export_assembly(kernel, assembly, step.string(), stl.string()), SolidKernelError);
    EXPECT_EQ(kernel.count("export_step"), 1u);
    EXPECT_FALSE(std::filesystem::exists(step));
}

TEST(SolidSynthesizerTest, ExportRequiresMainSolid) {
    RecordingKernel kernel;
    EXPECT_THROW(export_assembly(kernel, SolidAssembly{}, "a.step", "a.stl"), SolidKernelError);
    EXPECT_TRUE(kernel.calls.empty());
}
