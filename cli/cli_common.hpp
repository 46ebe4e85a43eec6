#ifndef SPIROB_CLI_COMMON_HPP
#define SPIROB_CLI_COMMON_HPP

#include <common/logging.hpp>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace spirob::cli {

// Arguments shared by every subcommand: `spirob <command> [params.json] [-o out] [-v]`
struct CommandContext {
    std::string input_path;   // empty means default parameters
    std::string output_path;  // file, prefix or directory depending on the command
    bool verbose = false;
};

// Parse argv from `start_idx` on; -h is left to the caller
inline CommandContext parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    for (int i = start_idx; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                throw std::runtime_error("-o/--output requires an argument");
            }
            ctx.output_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            continue;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::runtime_error("Unknown option: " + arg);
        } else if (ctx.input_path.empty()) {
            ctx.input_path = arg;
        } else {
            throw std::runtime_error("Unexpected positional argument: " + arg);
        }
    }

    if (ctx.verbose) {
        spirob::logging::enable_verbose();
    }
    return ctx;
}

// `-o` when given, else the params file with its extension swapped for
// `suffix` (params.json -> params.layout.json). Without either there is
// nothing to name the output after.
inline std::string resolve_output_path(const CommandContext& ctx, const std::string& suffix) {
    if (!ctx.output_path.empty()) {
        return ctx.output_path;
    }
    if (ctx.input_path.empty()) {
        throw std::runtime_error("-o <output> is required when no params file is given");
    }
    std::filesystem::path stem(ctx.input_path);
    stem.replace_extension();
    return stem.string() + suffix;
}

// False (after printing `usage`) when the command has no -o
inline bool require_output(const CommandContext& ctx, const char* usage) {
    if (ctx.output_path.empty()) {
        std::cerr << "Usage: " << usage << "\n";
        return false;
    }
    return true;
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Parse the shared arguments and run `body`; any exception is logged as
// "Error: ..." and turns into exit code 1
template <typename Body>
int run_command(int argc, char** argv, Body&& body) {
    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);
        return body(ctx);
    } catch (const std::exception& e) {
        spirob::logging::get_logger()->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int command_params(int argc, char** argv);
int command_units(int argc, char** argv);
int command_layout(int argc, char** argv);
int command_obj(int argc, char** argv);
int command_cad(int argc, char** argv);
int command_mjcf(int argc, char** argv);

}  // namespace spirob::cli

#endif // SPIROB_CLI_COMMON_HPP
