#include "cli_common.hpp"
#include <spiral/unit_decomposer.hpp>
#include <layout/unfold_layout.hpp>
#include <serialization/params_json.hpp>
#include <common/logging.hpp>

namespace spirob::cli {

int command_obj(int argc, char** argv) {
    return run_command(argc, argv, [](const CommandContext& ctx) {
        auto log = spirob::logging::get_logger();
        std::string output_path = resolve_output_path(ctx, ".obj");

        DesignParams params = json::load_params(ctx.input_path);
        UnfoldLayout layout = UnfoldLayout::build(params, decompose_polar(params.spiral));

        std::string obj = layout.to_obj();
        write_file(output_path, obj);

        log->info("Wrote OBJ to {}", output_path);
        std::cerr << "Wrote " << output_path << " (" << layout.unit_count()
                  << " units, " << obj.size() << " bytes)\n";
        return 0;
    });
}

}  // namespace spirob::cli
