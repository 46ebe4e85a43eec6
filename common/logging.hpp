#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace spirob {
namespace logging {

// Accepted values of SPIROB_LOG_LEVEL
inline std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    static constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 6> kLevels = {{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off", spdlog::level::off},
    }};
    for (const auto& [key, level] : kLevels) {
        if (key == name) {
            return level;
        }
    }
    return std::nullopt;
}

// Process-wide "spirob" logger on stderr. Geometry stages log at debug,
// results at info, a missing solid kernel or elastic layer at warn.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("spirob");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);

        if (const char* env = std::getenv("SPIROB_LOG_LEVEL")) {
            if (auto level = parse_level(env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring SPIROB_LOG_LEVEL={}", env);
            }
        }
        return log;
    }();
    return logger;
}

// -v on the command line; never lowers a level already set to trace
inline void enable_verbose() {
    auto log = get_logger();
    if (log->level() > spdlog::level::debug) {
        log->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace spirob
