#include "cli_common.hpp"
#include <session/design_session.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/params_json.hpp>
#include <serialization/layout_json.hpp>
#include <common/logging.hpp>

namespace spirob::cli {

int command_layout(int argc, char** argv) {
    return run_command(argc, argv, [](const CommandContext& ctx) {
        auto log = spirob::logging::get_logger();
        std::string output_path = resolve_output_path(ctx, ".layout.json");

        DesignParams params = json::load_params(ctx.input_path);

        log->debug("Building unfolded layout");
        DesignSession session;
        auto snapshot = session.recompute(params);
        const RobotDimensions& dims = snapshot->dimensions();

        json::SerializedData output = json::make_envelope("layout", ctx.input_path, params);
        output.stats = {
            {"unit_count", snapshot->layout.unit_count()},
            {"elastic", snapshot->layout.elastic().has_value()},
            {"tip_size", dims.tip_size},
            {"base_size", dims.base_size},
            {"robot_length", dims.robot_length}
        };
        output.data = snapshot_to_json(*snapshot);
        json::write_serialized(output_path, output);

        log->info("Wrote layout to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << snapshot->layout.unit_count() << " units, length "
                  << dims.robot_length << ")\n";
        return 0;
    });
}

}  // namespace spirob::cli
