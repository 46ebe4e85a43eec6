#ifndef SPIROB_SERIALIZATION_JSON_SERIALIZATION_HPP
#define SPIROB_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace spirob::json {

constexpr const char* SERIALIZATION_VERSION = "1.0.0";

// Envelope of every JSON artefact: the command that wrote it ("params",
// "units", "layout"), the parameter file it was computed from, the
// resolved parameters and a few summary numbers.
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;
    std::string timestamp;
    std::string source_file;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;
};

inline void to_json(nlohmann::json& j, const SerializedData& env) {
    j = {{"version", env.version}, {"step", env.step}};
    if (!env.timestamp.empty()) j["timestamp"] = env.timestamp;
    if (!env.source_file.empty()) j["source_file"] = env.source_file;
    if (!env.config.is_null()) j["config"] = env.config;
    if (!env.stats.is_null()) j["stats"] = env.stats;
    j["data"] = env.data;
}

inline void from_json(const nlohmann::json& j, SerializedData& env) {
    if (!j.is_object() || !j.contains("data")) {
        throw std::runtime_error("Serialized file has no data section");
    }
    env.version = j.value("version", "unknown");
    env.step = j.value("step", "unknown");
    env.timestamp = j.value("timestamp", "");
    env.source_file = j.value("source_file", "");
    env.config = j.value("config", nlohmann::json());
    env.stats = j.value("stats", nlohmann::json());
    env.data = j.at("data");
}

// UTC, ISO 8601
inline std::string get_timestamp() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Envelope stamped with the current time; callers fill stats and data
inline SerializedData make_envelope(const std::string& step,
                                    const std::string& source_file,
                                    nlohmann::json config) {
    SerializedData env;
    env.step = step;
    env.timestamp = get_timestamp();
    env.source_file = source_file;
    env.config = std::move(config);
    return env;
}

inline void require_step(const SerializedData& env, const std::string& step) {
    if (env.step != step) {
        throw std::runtime_error("Expected " + step + " file, got step: " + env.step);
    }
}

// Pretty-printed; missing parent directories are created
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

inline void write_serialized(const std::string& path, const SerializedData& env) {
    write_json_file(path, env);
}

}  // namespace spirob::json

#endif // SPIROB_SERIALIZATION_JSON_SERIALIZATION_HPP
