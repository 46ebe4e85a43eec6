#include "cli_common.hpp"
#include <serialization/json_serialization.hpp>
#include <serialization/params_json.hpp>
#include <common/logging.hpp>

namespace spirob::cli {

int command_params(int argc, char** argv) {
    return run_command(argc, argv, [](const CommandContext& ctx) {
        auto log = spirob::logging::get_logger();
        if (!require_output(ctx, "spirob params [params.json] -o <params.json>")) {
            return 1;
        }

        // Defaults, or an existing file normalized with every key present
        DesignParams params = json::load_params(ctx.input_path);
        ValidationResult validation = params.validate();
        for (const auto& warning : validation.warnings) {
            log->warn("{}", warning);
        }
        for (const auto& error : validation.errors) {
            log->error("{}", error);
        }

        json::SerializedData output = json::make_envelope("params", ctx.input_path, nullptr);
        output.stats = {
            {"valid", validation.valid},
            {"warnings", validation.warnings.size()}
        };
        output.data = params;
        json::write_serialized(ctx.output_path, output);

        log->info("Wrote parameters to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << "\n";
        return validation.valid ? 0 : 1;
    });
}

}  // namespace spirob::cli
