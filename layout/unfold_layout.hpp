#ifndef SPIROB_LAYOUT_UNFOLD_LAYOUT_HPP
#define SPIROB_LAYOUT_UNFOLD_LAYOUT_HPP

#include <spiral/design_params.hpp>
#include <spiral/unit_decomposer.hpp>
#include <math/vec2.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace spirob {

// Unit after placement on the baseline, plus the offset for the next one
struct PlacedUnit {
    FlatUnit unit;
    double next_x = 0.0;
};

// Scale `base` by `scale` and translate it so its inner leading vertex
// sits at (current_x, 0). The y offset is taken from that vertex alone,
// so the inner leading vertex has y == 0 exactly and no error carries
// over between units.
PlacedUnit place_at_baseline(const FlatUnit& base, double scale, double current_x);

// Rays from the virtual tip that bound the elastic layer
struct ElasticRays {
    Vec2 start;
    Vec2 upper_end;
    Vec2 lower_end;
    double slope = 0.0;
};

// Quadrilateral of the elastic layer and its reflection across the x-axis.
// Vertex order: first unit's inner leading vertex, hit on the first unit's
// leading edge, hit on the last unit's trailing edge, last unit's inner
// trailing vertex.
struct ElasticLayer {
    std::array<Vec2, 4> polygon{};
    std::array<Vec2, 4> mirror{};
};

// Sizes derived from the unfolded chain
struct RobotDimensions {
    double tip_size = 0.0;         // 2 * max y of the first unit
    double base_size = 0.0;        // 2 * max y of the last unit
    double robot_length = 0.0;     // max x of the last unit
    double taper_angle_deg = 0.0;
    double gamma = 1.0;            // Per-step scale factor
    double l_vtip = 0.0;           // Distance from the chain start back to the virtual tip
    double unit_height = 0.0;      // Inner edge length of the last unit
};

// Full taper angle of the limb in radians, a function of b alone
double taper_angle(const SpiralParams& params);

// Distance from the physical spiral start back to the virtual tip
double virtual_tip_distance(const SpiralParams& params);

// Unfolded flat layout of a decomposed spiral
class UnfoldLayout {
public:
    static UnfoldLayout build(const SpiralParams& spiral,
                              std::size_t unit_count,
                              bool elastic_enabled,
                              double elastic_percent);

    // Convenience: decomposition count and elastic settings from DesignParams
    static UnfoldLayout build(const DesignParams& params, const PolarDecomposition& polar);

    const std::vector<FlatUnit>& primary() const { return primary_; }
    const std::vector<FlatUnit>& mirror() const { return mirror_; }
    const std::optional<ElasticLayer>& elastic() const { return elastic_; }
    const ElasticRays& rays() const { return rays_; }
    const RobotDimensions& dimensions() const { return dimensions_; }
    std::size_t unit_count() const { return primary_.size(); }

    // Export all polygons as planar OBJ faces (returns string content)
    std::string to_obj() const;

private:
    std::vector<FlatUnit> primary_;
    std::vector<FlatUnit> mirror_;
    std::optional<ElasticLayer> elastic_;
    ElasticRays rays_;
    RobotDimensions dimensions_;
};

}  // namespace spirob

#endif // SPIROB_LAYOUT_UNFOLD_LAYOUT_HPP
