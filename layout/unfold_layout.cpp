#include "unfold_layout.hpp"
#include <spiral/spiral_math.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numbers>
#include <sstream>

namespace spirob {

namespace {

constexpr double kBaselineTolerance = 1e-6;
constexpr double kMinUnitHeight = 1e-6;

double unit_height_of(const FlatUnit& unit) {
    // Inner edge: the vertices lying on the baseline, in polygon order
    std::vector<Vec2> on_baseline;
    for (const auto& v : unit.vertices) {
        if (std::abs(v.y) < kBaselineTolerance) {
            on_baseline.push_back(v);
        }
    }
    double height = 0.0;
    if (on_baseline.size() >= 2) {
        height = std::abs(on_baseline[1].x - on_baseline[0].x);
    } else {
        height = std::abs(unit.inner_trailing().x - unit.inner_leading().x);
    }
    return std::max(kMinUnitHeight, height);
}

}  // namespace

PlacedUnit place_at_baseline(const FlatUnit& base, double scale, double current_x) {
    FlatUnit scaled = base.scaled(scale);
    Vec2 offset(current_x - scaled.inner_leading().x, -scaled.inner_leading().y);

    PlacedUnit placed;
    placed.unit = scaled.translated(offset);
    placed.next_x = offset.x + scaled.inner_trailing().x;
    return placed;
}

double taper_angle(const SpiralParams& params) {
    double b = params.b;
    double eb = std::exp(2.0 * std::numbers::pi * b);
    return 2.0 * std::atan((b * (eb - 1.0)) / (std::sqrt(b * b + 1.0) * (eb + 1.0)));
}

double virtual_tip_distance(const SpiralParams& params) {
    double b = params.b;
    return params.central_factor() * params.a * std::sqrt(b * b + 1.0) / b;
}

UnfoldLayout UnfoldLayout::build(const SpiralParams& spiral,
                                 std::size_t unit_count,
                                 bool elastic_enabled,
                                 double elastic_percent) {
    auto log = spirob::logging::get_logger();
    UnfoldLayout layout;

    const FlatUnit base = compute_base_quad(spiral);
    const double gamma = spiral.gamma();
    unit_count = std::max<std::size_t>(1, unit_count);

    // Phase 1: place scaled copies of the base quad along the baseline
    double current_x = 0.0;
    for (std::size_t k = 0; k < unit_count; ++k) {
        double scale = std::pow(gamma, static_cast<double>(k));
        PlacedUnit placed = place_at_baseline(base, scale, current_x);
        layout.primary_.push_back(placed.unit);
        layout.mirror_.push_back(placed.unit.mirrored());
        current_x = placed.next_x;
    }
    log->debug("UnfoldLayout: placed {} units, chain end x = {:.4f}", unit_count, current_x);

    // Phase 2: derived dimensions
    const FlatUnit& first = layout.primary_.front();
    const FlatUnit& last = layout.primary_.back();
    RobotDimensions& dims = layout.dimensions_;
    dims.tip_size = 2.0 * first.max_y();
    dims.base_size = 2.0 * last.max_y();
    dims.robot_length = last.max_x();
    dims.taper_angle_deg = taper_angle(spiral) * 180.0 / std::numbers::pi;
    dims.gamma = gamma;
    dims.l_vtip = virtual_tip_distance(spiral);
    dims.unit_height = unit_height_of(last);

    // Phase 3: rays from the virtual tip
    double elastic_angle = (elastic_percent / 100.0) * (taper_angle(spiral) * 0.5);
    double slope = elastic_angle != 0.0 ? std::tan(elastic_angle) : 0.0;
    double max_poly_x = 0.0;
    for (const auto& unit : layout.primary_) {
        max_poly_x = std::max(max_poly_x, unit.max_x());
    }
    double ray_len = std::max(10.0, max_poly_x + dims.l_vtip + 10.0);
    layout.rays_.start = Vec2(-dims.l_vtip, 0.0);
    layout.rays_.upper_end = Vec2(-dims.l_vtip + ray_len, slope * ray_len);
    layout.rays_.lower_end = Vec2(-dims.l_vtip + ray_len, -slope * ray_len);
    layout.rays_.slope = slope;

    // Phase 4: elastic polygon between the first leading and last trailing edges
    if (!elastic_enabled) {
        log->debug("UnfoldLayout: elastic layer disabled");
        return layout;
    }

    const FlatUnit& first_mirror = layout.mirror_.front();
    const FlatUnit& last_mirror = layout.mirror_.back();
    auto upper_left = segment_intersect(layout.rays_.start, layout.rays_.upper_end,
                                        first.outer_leading(), first.inner_leading());
    auto upper_right = segment_intersect(layout.rays_.start, layout.rays_.upper_end,
                                         last.outer_trailing(), last.inner_trailing());
    auto lower_left = segment_intersect(layout.rays_.start, layout.rays_.lower_end,
                                        first_mirror.outer_leading(), first_mirror.inner_leading());
    auto lower_right = segment_intersect(layout.rays_.start, layout.rays_.lower_end,
                                         last_mirror.outer_trailing(), last_mirror.inner_trailing());

    if (upper_left && upper_right && lower_left && lower_right) {
        ElasticLayer elastic;
        elastic.polygon = {first.inner_leading(), *upper_left, *upper_right, last.inner_trailing()};
        elastic.mirror = {first_mirror.inner_leading(), *lower_left, *lower_right,
                          last_mirror.inner_trailing()};
        layout.elastic_ = elastic;
    } else {
        log->warn("UnfoldLayout: elastic rays miss the end edges, no elastic layer");
    }

    return layout;
}

UnfoldLayout UnfoldLayout::build(const DesignParams& params, const PolarDecomposition& polar) {
    return build(params.spiral, flat_unit_count(polar),
                 params.elastic_enabled, params.elastic_percent);
}

std::string UnfoldLayout::to_obj() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6);

    ss << "# spirob unfolded layout\n";
    ss << "# Units: " << primary_.size() << "\n";
    ss << "# Elastic layer: " << (elastic_ ? "yes" : "no") << "\n\n";

    std::size_t next_index = 1;
    auto write_polygon = [&ss, &next_index](const std::string& name,
                                            const std::array<Vec2, 4>& vertices) {
        ss << "o " << name << "\n";
        for (const auto& v : vertices) {
            ss << "v " << v.x << " " << v.y << " 0.000000\n";
        }
        ss << "f";
        for (std::size_t i = 0; i < vertices.size(); ++i) {
            ss << " " << next_index + i;
        }
        ss << "\n";
        next_index += vertices.size();
    };

    for (std::size_t i = 0; i < primary_.size(); ++i) {
        write_polygon("unit_" + std::to_string(i), primary_[i].vertices);
    }
    for (std::size_t i = 0; i < mirror_.size(); ++i) {
        write_polygon("unit_mirror_" + std::to_string(i), mirror_[i].vertices);
    }
    if (elastic_) {
        write_polygon("elastic", elastic_->polygon);
        write_polygon("elastic_mirror", elastic_->mirror);
    }

    return ss.str();
}

}  // namespace spirob
