#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <solid/solid_kernel.hpp>
#include <common/logging.hpp>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [params.json] [options]\n";
    std::cerr << "\n";
    std::cerr << "Computes the geometry of a spiral soft-robot limb.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  params   Write the parameter file (defaults when no input)\n";
    std::cerr << "  units    Polar decomposition of the spiral (JSON)\n";
    std::cerr << "  layout   Unfolded units, elastic layer and dimensions (JSON)\n";
    std::cerr << "  obj      Unfolded polygons as Wavefront OBJ\n";
    std::cerr << "  cad      STEP and STL of the limb (-o <prefix>)\n";
    std::cerr << "  mjcf     MuJoCo chain and unit mesh (-o <dir>)\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>  Output file, prefix or directory\n";
    std::cerr << "  -v, --verbose        Debug logging\n";
    std::cerr << "  -h, --help           Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Solid kernel: "
              << (spirob::solid_kernel_available() ? "OpenCASCADE" : "none (cad/mjcf disabled)")
              << "\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  SPIROB_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    if (command == "params") return spirob::cli::command_params(argc, argv);
    if (command == "units") return spirob::cli::command_units(argc, argv);
    if (command == "layout") return spirob::cli::command_layout(argc, argv);
    if (command == "obj") return spirob::cli::command_obj(argc, argv);
    if (command == "cad") return spirob::cli::command_cad(argc, argv);
    if (command == "mjcf") return spirob::cli::command_mjcf(argc, argv);

    spirob::logging::get_logger()->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
