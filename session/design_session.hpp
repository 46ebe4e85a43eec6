#ifndef SPIROB_SESSION_DESIGN_SESSION_HPP
#define SPIROB_SESSION_DESIGN_SESSION_HPP

#include <spiral/design_params.hpp>
#include <spiral/unit_decomposer.hpp>
#include <layout/unfold_layout.hpp>
#include <solid/solid_kernel.hpp>
#include <solid/solid_settings.hpp>
#include <solid/solid_synthesizer.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace spirob {

// How the extrusion thickness of the current design was chosen
enum class ExtrusionState {
    Uninitialized,   // nothing computed yet
    DefaultApplied,  // 0.6 * base size of the latest geometry
    UserOverridden   // explicit value, clamped into the current range
};

const char* to_string(ExtrusionState state);

// Complete, immutable result of one recomputation
struct DesignSnapshot {
    std::uint64_t generation = 0;
    DesignParams params;
    PolarDecomposition polar;
    UnfoldLayout layout;
    double extrusion = 0.0;
    ValueRange extrusion_range;
    ExtrusionState extrusion_state = ExtrusionState::Uninitialized;
    SolidSettings settings;

    const RobotDimensions& dimensions() const { return layout.dimensions(); }
};

// Owns the current design and its derived geometry.
//
// recompute() calls run one at a time; each builds a whole new snapshot
// and swaps it in, so readers of snapshot() never see a mix of old and
// new results. Solids are built lazily for the current snapshot and
// cached until the next swap.
class DesignSession {
public:
    DesignSession();
    explicit DesignSession(std::unique_ptr<SolidKernel> kernel);

    // Recompute everything for `params`. A numeric params.extrusion is
    // taken as a user override. Throws std::invalid_argument if the
    // parameters do not validate.
    std::shared_ptr<const DesignSnapshot> recompute(const DesignParams& params);

    // Current snapshot; null before the first recompute()
    std::shared_ptr<const DesignSnapshot> snapshot() const;

    // Override the thickness and recompute the current design
    std::shared_ptr<const DesignSnapshot> set_extrusion(double thickness);

    // Back to the automatic default, then recompute the current design
    std::shared_ptr<const DesignSnapshot> reset_extrusion();

    ExtrusionState extrusion_state() const;

    SolidKernel& kernel() { return *kernel_; }
    bool solids_available() const { return kernel_->available(); }

    // Solids of the current snapshot, built on first use
    std::optional<SolidAssembly> solids();

    // `<prefix>.step` and `<prefix>.stl`; false (nothing written) without a kernel
    bool export_cad(const std::string& prefix);

    // `<dir>/baselink.stl` and `<dir>/robot.xml`; false (nothing written)
    // without a kernel
    bool export_chain(const std::string& dir);

private:
    // Builds and swaps in a snapshot for `params` under `state`; the session's
    // extrusion state changes only when this returns
    std::shared_ptr<const DesignSnapshot> recompute_locked(const DesignParams& params,
                                                           ExtrusionState state,
                                                           double user_extrusion);

    std::unique_ptr<SolidKernel> kernel_;

    // Serializes recomputation and guards the extrusion state
    mutable std::mutex recompute_mutex_;
    ExtrusionState extrusion_state_ = ExtrusionState::Uninitialized;
    double user_extrusion_ = 0.0;
    std::uint64_t next_generation_ = 1;

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const DesignSnapshot> current_;

    // Serializes kernel work and guards the cache
    std::mutex solids_mutex_;
    std::optional<SolidAssembly> cached_solids_;
    std::uint64_t cached_generation_ = 0;
};

}  // namespace spirob

#endif // SPIROB_SESSION_DESIGN_SESSION_HPP
