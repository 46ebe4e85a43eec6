#include "cli_common.hpp"
#include <spiral/unit_decomposer.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/params_json.hpp>
#include <serialization/layout_json.hpp>
#include <common/logging.hpp>

namespace spirob::cli {

int command_units(int argc, char** argv) {
    return run_command(argc, argv, [](const CommandContext& ctx) {
        auto log = spirob::logging::get_logger();
        std::string output_path = resolve_output_path(ctx, ".units.json");

        DesignParams params = json::load_params(ctx.input_path);
        log->info("Decomposing spiral a={} b={} step={} deg", params.spiral.a,
                  params.spiral.b, params.spiral.step_deg());

        PolarDecomposition polar = decompose_polar(params.spiral);

        json::SerializedData output = json::make_envelope("units", ctx.input_path, params);
        output.stats = {
            {"unit_count", polar.unit_count()},
            {"samples", polar.theta_samples.size()},
            {"sweep_end", polar.sweep_end}
        };
        output.data = polar_to_json(polar);
        json::write_serialized(output_path, output);

        log->info("Wrote units to {}", output_path);
        std::cerr << "Wrote " << output_path << " (" << polar.unit_count() << " units)\n";
        return 0;
    });
}

}  // namespace spirob::cli
