#include "design_session.hpp"
#include <chain/chain_exporter.hpp>
#include <chain/mjcf_writer.hpp>
#include <common/logging.hpp>
#include <filesystem>
#include <stdexcept>

namespace spirob {

const char* to_string(ExtrusionState state) {
    switch (state) {
        case ExtrusionState::Uninitialized: return "uninitialized";
        case ExtrusionState::DefaultApplied: return "default";
        case ExtrusionState::UserOverridden: return "user";
    }
    return "unknown";
}

DesignSession::DesignSession()
    : DesignSession(make_solid_kernel()) {}

DesignSession::DesignSession(std::unique_ptr<SolidKernel> kernel)
    : kernel_(std::move(kernel)) {
    if (!kernel_) {
        throw std::invalid_argument("DesignSession requires a solid kernel");
    }
}

std::shared_ptr<const DesignSnapshot> DesignSession::recompute(const DesignParams& params) {
    std::lock_guard<std::mutex> lock(recompute_mutex_);
    if (params.extrusion) {
        return recompute_locked(params, ExtrusionState::UserOverridden, *params.extrusion);
    }
    return recompute_locked(params, extrusion_state_, user_extrusion_);
}

std::shared_ptr<const DesignSnapshot> DesignSession::recompute_locked(const DesignParams& params,
                                                                      ExtrusionState state,
                                                                      double user_extrusion) {
    auto log = spirob::logging::get_logger();

    ValidationResult validation = params.validate();
    for (const auto& warning : validation.warnings) {
        log->warn("{}", warning);
    }
    if (!validation.valid) {
        throw std::invalid_argument(validation.errors.front());
    }

    auto next = std::make_shared<DesignSnapshot>();
    next->params = params;
    next->polar = decompose_polar(params.spiral);
    next->layout = UnfoldLayout::build(params, next->polar);

    const RobotDimensions& dims = next->layout.dimensions();
    next->extrusion_range = extrusion_range(dims.base_size);
    if (state == ExtrusionState::UserOverridden) {
        next->extrusion = next->extrusion_range.clamp(user_extrusion);
        if (next->extrusion != user_extrusion) {
            log->debug("extrusion {:.3f} clamped to {:.3f}", user_extrusion, next->extrusion);
        }
    } else {
        next->extrusion = default_extrusion(dims.base_size);
        state = ExtrusionState::DefaultApplied;
    }
    next->extrusion_state = state;
    next->settings = resolve_solid_settings(params, dims, next->extrusion);
    next->generation = next_generation_++;

    log->debug("recompute #{}: {} units, base {:.3f}, length {:.3f}, extrusion {:.3f} ({})",
               next->generation, next->layout.unit_count(), dims.base_size,
               dims.robot_length, next->extrusion, to_string(next->extrusion_state));

    // Extrusion state and snapshot change together, only for a complete snapshot
    extrusion_state_ = state;
    user_extrusion_ = user_extrusion;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        current_ = next;
    }
    return next;
}

std::shared_ptr<const DesignSnapshot> DesignSession::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_;
}

std::shared_ptr<const DesignSnapshot> DesignSession::set_extrusion(double thickness) {
    std::lock_guard<std::mutex> lock(recompute_mutex_);
    if (!(thickness > 0.0)) {
        throw std::invalid_argument("extrusion thickness must be positive");
    }

    auto current = snapshot();
    if (!current) {
        extrusion_state_ = ExtrusionState::UserOverridden;
        user_extrusion_ = thickness;
        return nullptr;
    }
    DesignParams params = current->params;
    params.extrusion = thickness;
    return recompute_locked(params, ExtrusionState::UserOverridden, thickness);
}

std::shared_ptr<const DesignSnapshot> DesignSession::reset_extrusion() {
    std::lock_guard<std::mutex> lock(recompute_mutex_);

    auto current = snapshot();
    if (!current) {
        extrusion_state_ = ExtrusionState::Uninitialized;
        return nullptr;
    }
    DesignParams params = current->params;
    params.extrusion.reset();
    return recompute_locked(params, ExtrusionState::Uninitialized, user_extrusion_);
}

ExtrusionState DesignSession::extrusion_state() const {
    std::lock_guard<std::mutex> lock(recompute_mutex_);
    return extrusion_state_;
}

std::optional<SolidAssembly> DesignSession::solids() {
    auto current = snapshot();
    if (!current || !kernel_->available()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(solids_mutex_);
    if (cached_solids_ && cached_generation_ == current->generation) {
        return cached_solids_;
    }

    SolidSynthesizer synthesizer(*kernel_, current->layout, current->settings);
    cached_solids_ = synthesizer.build();
    cached_generation_ = current->generation;
    return cached_solids_;
}

bool DesignSession::export_cad(const std::string& prefix) {
    auto log = spirob::logging::get_logger();

    if (!kernel_->available()) {
        log->warn("No solid kernel available, CAD export skipped");
        return false;
    }
    auto assembly = solids();
    if (!assembly) {
        log->warn("No solids could be built, CAD export skipped");
        return false;
    }

    std::string step_path = prefix + ".step";
    std::string stl_path = prefix + ".stl";
    {
        std::lock_guard<std::mutex> lock(solids_mutex_);
        export_assembly(*kernel_, *assembly, step_path, stl_path);
    }
    log->info("Exported {} and {}", step_path, stl_path);
    return true;
}

bool DesignSession::export_chain(const std::string& dir) {
    auto log = spirob::logging::get_logger();

    auto current = snapshot();
    if (!current) {
        throw std::runtime_error("No design computed");
    }
    if (!kernel_->available()) {
        log->warn("No solid kernel available, chain export skipped");
        return false;
    }

    ChainSpec spec = chain_spec_for(current->params, current->layout);
    std::string mesh_path = (std::filesystem::path(dir) / spec.mesh_file).string();
    std::string xml_path = (std::filesystem::path(dir) / "robot.xml").string();
    {
        std::lock_guard<std::mutex> lock(solids_mutex_);
        SolidSynthesizer synthesizer(*kernel_, current->layout, current->settings);
        Solid unit_mesh = synthesizer.build_unit_mesh();
        if (!unit_mesh) {
            log->warn("Unit mesh could not be built, chain export skipped");
            return false;
        }
        std::filesystem::create_directories(dir);
        kernel_->export_stl(unit_mesh, mesh_path);
    }
    write_mjcf(build_chain(spec), xml_path);
    log->info("Exported {} and {}", mesh_path, xml_path);
    return true;
}

}  // namespace spirob
