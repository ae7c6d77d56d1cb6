#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace folio::config {

constexpr static uintmax_t DEFAULT_MAX_BODY_SIZE_BYTES = 50 * 1024 * 1024; // 50MB
constexpr static auto* DEFAULT_API_KEY = "default-dev-key-change-in-production";
constexpr static auto* DEFAULT_CONFIG_PATH = "/etc/folio/config.yaml";

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    uintmax_t max_body_size_bytes = DEFAULT_MAX_BODY_SIZE_BYTES;
};

struct AuthConfig {
    std::string api_key = DEFAULT_API_KEY;
};

struct CorsConfig {
    std::vector<std::string> allowed_origins = {"*"};
};

enum class PageSize { A3, A4, A5, Letter, Legal };

struct RenderConfig {
    unsigned int max_concurrent_renders = 0; // 0 = hardware concurrency
    PageSize page_size = PageSize::A4;
    bool landscape = false;
    double margin_cm = 2.54;
    unsigned int dpi = 96;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum folio  = spdlog::level::info;   // Startup, shutdown, config
    spdlog::level::level_enum http   = spdlog::level::info;   // Transport errors, routing
    spdlog::level::level_enum auth   = spdlog::level::info;   // Rejected API keys
    spdlog::level::level_enum render = spdlog::level::info;   // Render start/finish and failures
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    AuthConfig auth;
    CorsConfig cors;
    RenderConfig render;
    LoggingConfig logging;

    [[nodiscard]] bool usesDefaultApiKey() const { return auth.api_key == DEFAULT_API_KEY; }

    // Resolved worker count for the render pool, never below 2.
    [[nodiscard]] unsigned int renderWorkers() const;

    // Throws std::runtime_error describing the first invalid setting.
    void validate() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
std::optional<std::string> systemEnv(const std::string& name);

// Parses a YAML config file on top of the defaults.
Config loadConfig(const std::filesystem::path& path);

// Defaults, then the YAML file named by FOLIO_CONFIG (or the default path if present),
// then environment overrides. The result is validated.
Config loadConfigFromEnvironment(const EnvLookup& env = systemEnv);

void applyEnvironmentOverrides(Config& cfg, const EnvLookup& env);

std::vector<std::string> splitOrigins(const std::string& csv);

// Effective configuration as YAML with the API key redacted.
std::string toYaml(const Config& cfg);

} // namespace folio::config
