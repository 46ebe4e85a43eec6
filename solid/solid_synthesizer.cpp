#include "solid_synthesizer.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <exception>
#include <filesystem>
#include <numbers>

namespace spirob {

namespace {

constexpr double kMinLength = 1e-6;
constexpr double kMinArea = 1e-12;

const std::vector<double> kTwoCableHoleAngles = {0.0, 180.0};
const std::vector<double> kThreeCableHoleAngles = {0.0, 120.0, 240.0};

double degrees(double rad) {
    return rad * 180.0 / std::numbers::pi;
}

}  // namespace

SolidSynthesizer::SolidSynthesizer(SolidKernel& kernel,
                                   const UnfoldLayout& layout,
                                   const SolidSettings& settings)
    : kernel_(kernel)
    , layout_(layout)
    , settings_(settings) {}

std::optional<SolidAssembly> SolidSynthesizer::build() {
    auto log = spirob::logging::get_logger();

    if (!kernel_.available()) {
        log->debug("SolidSynthesizer: kernel '{}' unavailable, skipping", kernel_.name());
        return std::nullopt;
    }
    if (layout_.primary().empty()) {
        log->debug("SolidSynthesizer: layout has no units");
        return std::nullopt;
    }

    log->debug("SolidSynthesizer: {} mode, {} units, thickness {:.3f}",
               to_string(settings_.cable_mode), layout_.unit_count(), settings_.thickness());

    SolidAssembly assembly = settings_.two_cable() ? build_two_cable() : build_three_cable();
    if (!assembly.main) {
        log->debug("SolidSynthesizer: every unit was degenerate");
        return std::nullopt;
    }
    return assembly;
}

SolidAssembly SolidSynthesizer::build_two_cable() {
    auto log = spirob::logging::get_logger();
    SolidAssembly assembly;

    // Phase 1: extrude units and their mirrors
    for (const auto& unit : layout_.primary()) {
        assembly.main = unite_optional(assembly.main, extrude_polygon(unit.vertices));
    }
    for (const auto& unit : layout_.mirror()) {
        assembly.main = unite_optional(assembly.main, extrude_polygon(unit.vertices));
    }
    if (layout_.elastic()) {
        assembly.elastic = unite_optional(assembly.elastic, extrude_polygon(layout_.elastic()->polygon));
        assembly.elastic = unite_optional(assembly.elastic, extrude_polygon(layout_.elastic()->mirror));
    }
    if (!assembly.main) {
        return assembly;
    }

    // Phase 2: cone1, anchored at the solid's actual extent
    double base_x = kernel_.bounding_box(assembly.main).max.x;
    assembly.main = apply_cone1_cut(assembly.main, base_x);
    if (assembly.elastic) {
        assembly.elastic = apply_cone1_cut(assembly.elastic, base_x);
    }

    // Phase 3: cable holes
    Solid holes = make_holes(kTwoCableHoleAngles);
    if (holes) {
        assembly.main = kernel_.cut(assembly.main, holes);
        if (assembly.elastic) {
            assembly.elastic = kernel_.cut(assembly.elastic, holes);
        }
    }

    // Phase 4: cone2 wedge
    Solid cone2 = make_cone2_tool();
    if (cone2) {
        assembly.main = kernel_.cut(assembly.main, cone2);
        if (assembly.elastic) {
            assembly.elastic = kernel_.cut(assembly.elastic, cone2);
        }
    }

    log->debug("SolidSynthesizer: two-cable assembly done (elastic: {})", assembly.has_elastic());
    return assembly;
}

SolidAssembly SolidSynthesizer::build_three_cable() {
    auto log = spirob::logging::get_logger();
    SolidAssembly assembly;

    for (const auto& unit : layout_.primary()) {
        assembly.main = unite_optional(assembly.main, revolve_polygon(unit.vertices));
    }
    if (layout_.elastic()) {
        assembly.elastic = revolve_polygon(layout_.elastic()->polygon);
    }
    if (!assembly.main) {
        return assembly;
    }

    Solid holes = make_holes(kThreeCableHoleAngles);
    if (holes) {
        assembly.main = kernel_.cut(assembly.main, holes);
        if (assembly.elastic) {
            assembly.elastic = kernel_.cut(assembly.elastic, holes);
        }
    }

    log->debug("SolidSynthesizer: three-cable assembly done (elastic: {})", assembly.has_elastic());
    return assembly;
}

Solid SolidSynthesizer::build_unit_mesh() {
    auto log = spirob::logging::get_logger();

    if (!kernel_.available() || layout_.primary().empty()) {
        return nullptr;
    }

    Solid solid;
    if (settings_.two_cable()) {
        solid = unite_optional(solid, extrude_polygon(layout_.primary().back().vertices));
        if (!layout_.mirror().empty()) {
            solid = unite_optional(solid, extrude_polygon(layout_.mirror().back().vertices));
        }
        if (!solid) {
            return nullptr;
        }
        solid = apply_cone1_cut(solid, kernel_.bounding_box(solid).max.x);
        Solid cone2 = make_cone2_tool();
        if (cone2) {
            solid = kernel_.cut(solid, cone2);
        }
    } else {
        solid = revolve_polygon(layout_.primary().back().vertices);
        if (!solid) {
            return nullptr;
        }
    }

    double length = layout_.dimensions().robot_length;
    solid = kernel_.translate(solid, Vec3(-length, 0.0, 0.0));
    solid = kernel_.rotate(solid, vec3::zero(), vec3::unit_y(), 90.0);
    log->debug("SolidSynthesizer: unit mesh built from unit {}", layout_.unit_count() - 1);
    return solid;
}

Solid SolidSynthesizer::make_frustum() {
    auto log = spirob::logging::get_logger();

    auto geometry = frustum_geometry(layout_.dimensions(), settings_);
    if (!geometry) {
        log->debug("SolidSynthesizer: frustum skipped (degenerate axis)");
        return nullptr;
    }

    Solid frustum = kernel_.revolve(to_profile(geometry->profile), vec3::zero(), vec3::unit_x(), 360.0);
    const AxisAlignment& align = geometry->alignment;
    if (align.rotates) {
        frustum = kernel_.rotate(frustum, vec3::zero(), align.axis, align.angle_deg);
    }
    return kernel_.translate(frustum, align.translation);
}

Solid SolidSynthesizer::make_holes(const std::vector<double>& angles_deg) {
    Solid frustum = make_frustum();
    if (!frustum) {
        return nullptr;
    }

    Solid holes;
    for (double angle : angles_deg) {
        Solid instance = angle == 0.0
            ? frustum
            : kernel_.rotate(frustum, vec3::zero(), vec3::unit_x(), angle);
        holes = unite_optional(holes, instance);
    }
    return holes;
}

Solid SolidSynthesizer::make_cone2_tool() {
    auto log = spirob::logging::get_logger();

    if (!settings_.two_cable()) {
        return nullptr;
    }
    const RobotDimensions& dims = layout_.dimensions();
    auto frame = cone2_frame(dims, settings_);
    if (!frame) {
        log->debug("SolidSynthesizer: cone2 skipped (angle {:.3f})", settings_.cone_angle2);
        return nullptr;
    }

    Solid wedge = kernel_.extrude(frame->rectangle(), frame->normal, dims.base_size * 0.5, false);
    wedge = kernel_.rotate(wedge, frame->p0, frame->p1 - frame->p0, -settings_.cone_angle2);

    Solid pair_xy = kernel_.unite(wedge, kernel_.mirror(wedge, vec3::zero(), vec3::unit_z()));
    return kernel_.unite(pair_xy, kernel_.mirror(pair_xy, vec3::zero(), vec3::unit_y()));
}

Solid SolidSynthesizer::apply_cone1_cut(const Solid& solid, double base_x) {
    auto log = spirob::logging::get_logger();

    const RobotDimensions& dims = layout_.dimensions();
    if (settings_.cone_angle1 <= kMinLength || dims.robot_length <= kMinLength) {
        log->debug("SolidSynthesizer: cone1 skipped (angle {:.3f})", settings_.cone_angle1);
        return solid;
    }

    double thickness = settings_.thickness();
    double extent = half_space_extent(dims, thickness);
    Solid result = solid;
    for (const auto& half_space : cone1_half_spaces(base_x, thickness, settings_.cone_angle1)) {
        result = cut_half_space(result, half_space, extent);
    }
    return result;
}

Solid SolidSynthesizer::extrude_polygon(const std::array<Vec2, 4>& polygon) {
    if (polygon_area(polygon) < kMinArea) {
        spirob::logging::get_logger()->debug("SolidSynthesizer: skipping degenerate polygon");
        return nullptr;
    }
    return kernel_.extrude(to_profile(polygon), vec3::unit_z(), settings_.thickness() * 0.5, true);
}

Solid SolidSynthesizer::revolve_polygon(const std::array<Vec2, 4>& polygon) {
    if (polygon_area(polygon) < kMinArea) {
        spirob::logging::get_logger()->debug("SolidSynthesizer: skipping degenerate polygon");
        return nullptr;
    }
    return kernel_.revolve(to_profile(polygon), vec3::zero(), vec3::unit_x(), 360.0);
}

Solid SolidSynthesizer::cut_half_space(const Solid& solid, const HalfSpace& half_space, double extent) {
    double h = extent * 0.5;
    Profile square = {
        Vec3(-h, -h, 0.0),
        Vec3(h, -h, 0.0),
        Vec3(h, h, 0.0),
        Vec3(-h, h, 0.0),
    };
    Solid box = kernel_.extrude(square, vec3::unit_z(), h, true);

    double angle = degrees(std::atan2(half_space.normal.x, half_space.normal.z));
    box = kernel_.rotate(box, vec3::zero(), vec3::unit_y(), angle);
    box = kernel_.translate(box, half_space.origin + half_space.normal * h);
    return kernel_.cut(solid, box);
}

Solid SolidSynthesizer::unite_optional(const Solid& acc, const Solid& next) {
    if (!next) {
        return acc;
    }
    if (!acc) {
        return next;
    }
    return kernel_.unite(acc, next);
}

void export_assembly(SolidKernel& kernel,
                     const SolidAssembly& assembly,
                     const std::string& step_path,
                     const std::string& stl_path) {
    if (!assembly.main) {
        throw SolidKernelError("assembly has no main solid");
    }

    std::vector<Solid> parts = {assembly.main};
    if (assembly.elastic) {
        parts.push_back(assembly.elastic);
    }
    Solid merged = assembly.elastic ? kernel.unite(assembly.main, assembly.elastic) : assembly.main;

    kernel.export_step(parts, step_path);
    try {
        kernel.export_stl(merged, stl_path);
    } catch (const std::exception&) {
        // Both files or neither
        std::error_code ec;
        std::filesystem::remove(step_path, ec);
        throw;
    }
}

}  // namespace spirob
