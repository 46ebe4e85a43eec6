#include "cli_common.hpp"
#include <session/design_session.hpp>
#include <serialization/params_json.hpp>
#include <common/logging.hpp>

namespace spirob::cli {

int command_cad(int argc, char** argv) {
    return run_command(argc, argv, [](const CommandContext& ctx) {
        auto log = spirob::logging::get_logger();
        if (!require_output(ctx, "spirob cad [params.json] -o <prefix>")) {
            return 1;
        }

        DesignParams params = json::load_params(ctx.input_path);
        DesignSession session;
        if (!session.solids_available()) {
            log->warn("CAD export not available, rebuild with OpenCASCADE");
            std::cerr << "Skipped: no solid kernel\n";
            return 0;
        }

        auto snapshot = session.recompute(params);
        log->info("Building solids for {} units ({}), thickness {:.3f}",
                  snapshot->layout.unit_count(), to_string(params.cable_mode),
                  snapshot->settings.thickness());

        if (!session.export_cad(ctx.output_path)) {
            std::cerr << "Skipped: no solids built\n";
            return 0;
        }
        std::cerr << "Wrote " << ctx.output_path << ".step and "
                  << ctx.output_path << ".stl\n";
        return 0;
    });
}

}  // namespace spirob::cli
