#ifndef SPIROB_SOLID_SOLID_SYNTHESIZER_HPP
#define SPIROB_SOLID_SOLID_SYNTHESIZER_HPP

#include "solid_kernel.hpp"
#include "solid_settings.hpp"
#include "cut_geometry.hpp"
#include <layout/unfold_layout.hpp>
#include <optional>
#include <string>
#include <vector>

namespace spirob {

// Solids of one design. The elastic layer stays a separate body so the
// STEP export keeps the parts apart; the STL export merges them.
struct SolidAssembly {
    Solid main;
    Solid elastic;  // null when there is no elastic layer

    bool has_elastic() const { return static_cast<bool>(elastic); }
};

// Turns an unfolded layout into kernel solids.
//
// Two-cable mode extrudes every unit and its mirror symmetrically about
// z = 0, then removes the cone1 half-spaces, the two frustum holes and
// the cone2 wedge, in that order. Three-cable mode revolves the primary
// units about +X and removes three frustum holes. Features whose
// geometry is degenerate are skipped with a debug line.
class SolidSynthesizer {
public:
    SolidSynthesizer(SolidKernel& kernel,
                     const UnfoldLayout& layout,
                     const SolidSettings& settings);

    // Absent when the kernel is unavailable or the layout has no units
    std::optional<SolidAssembly> build();

    // Rightmost unit only, moved so the base sits at the origin and the
    // chain axis points along +Z. Null when the kernel is unavailable.
    Solid build_unit_mesh();

    // Frustum placed on its tip-to-base axis, null when degenerate
    Solid make_frustum();

    // Union of the frustum instances rotated about +X by `angles_deg`
    Solid make_holes(const std::vector<double>& angles_deg);

    // Four-fold cone2 cutting tool, null in three-cable mode or when degenerate
    Solid make_cone2_tool();

    // Remove both cone1 half-spaces; returns `solid` unchanged when skipped
    Solid apply_cone1_cut(const Solid& solid, double base_x);

private:
    Solid extrude_polygon(const std::array<Vec2, 4>& polygon);
    Solid revolve_polygon(const std::array<Vec2, 4>& polygon);
    Solid cut_half_space(const Solid& solid, const HalfSpace& half_space, double extent);
    Solid unite_optional(const Solid& acc, const Solid& next);

    SolidAssembly build_two_cable();
    SolidAssembly build_three_cable();

    SolidKernel& kernel_;
    const UnfoldLayout& layout_;
    SolidSettings settings_;
};

// Write `<step_path>` with main and elastic as separate bodies and
// `<stl_path>` with their union.
void export_assembly(SolidKernel& kernel,
                     const SolidAssembly& assembly,
                     const std::string& step_path,
                     const std::string& stl_path);

}  // namespace spirob

#endif // SPIROB_SOLID_SOLID_SYNTHESIZER_HPP
