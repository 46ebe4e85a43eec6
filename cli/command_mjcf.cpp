#include "cli_common.hpp"
#include <session/design_session.hpp>
#include <serialization/params_json.hpp>
#include <common/logging.hpp>

namespace spirob::cli {

int command_mjcf(int argc, char** argv) {
    return run_command(argc, argv, [](const CommandContext& ctx) {
        auto log = spirob::logging::get_logger();
        if (!require_output(ctx, "spirob mjcf [params.json] -o <dir>")) {
            return 1;
        }

        DesignParams params = json::load_params(ctx.input_path);
        DesignSession session;
        if (!session.solids_available()) {
            log->warn("Chain export needs the unit mesh, rebuild with OpenCASCADE");
            std::cerr << "Skipped: no solid kernel\n";
            return 0;
        }

        auto snapshot = session.recompute(params);
        log->info("Exporting chain of {} units", snapshot->layout.unit_count());

        if (!session.export_chain(ctx.output_path)) {
            std::cerr << "Skipped: unit mesh could not be built\n";
            return 0;
        }
        std::cerr << "Wrote " << ctx.output_path << "/robot.xml ("
                  << snapshot->layout.unit_count() << " links)\n";
        return 0;
    });
}

}  // namespace spirob::cli
