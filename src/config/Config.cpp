#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <yaml-cpp/yaml.h>

namespace folio::config {

unsigned int Config::renderWorkers() const {
    const unsigned int n = render.max_concurrent_renders != 0
        ? render.max_concurrent_renders
        : std::thread::hardware_concurrency();
    return std::max(n, 2u);
}

void Config::validate() const {
    if (server.host.empty()) throw std::runtime_error("server.host must not be empty");
    if (server.port == 0) throw std::runtime_error("server.port must be between 1 and 65535");
    if (server.max_body_size_bytes == 0) throw std::runtime_error("server.max_body_size must be positive");
    if (auth.api_key.empty()) throw std::runtime_error("auth.api_key must not be empty");
    if (render.dpi == 0) throw std::runtime_error("render.dpi must be positive");
    if (render.margin_cm < 0) throw std::runtime_error("render.margin_cm must not be negative");
}

std::optional<std::string> systemEnv(const std::string& name) {
    if (const char* v = std::getenv(name.c_str())) return std::string(v);
    return std::nullopt;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file " + path.string() + ": " + e.what());
    }

    const auto section = [&]<typename T>(const char* key, T& out) {
        const auto node = root[key];
        if (!node) return;
        if (!YAML::convert<T>::decode(node, out))
            throw std::runtime_error("Invalid config file " + path.string() + ": '" + key + "' must be a mapping");
    };

    try {
        section("server", cfg.server);
        section("auth", cfg.auth);
        section("cors", cfg.cors);
        section("render", cfg.render);
        section("logging", cfg.logging);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    } catch (const std::logic_error& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }

    return cfg;
}

Config loadConfigFromEnvironment(const EnvLookup& env) {
    Config cfg;

    if (const auto explicitPath = env("FOLIO_CONFIG")) {
        cfg = loadConfig(*explicitPath);
    } else if (std::error_code ec; std::filesystem::exists(DEFAULT_CONFIG_PATH, ec)) {
        cfg = loadConfig(DEFAULT_CONFIG_PATH);
    }

    applyEnvironmentOverrides(cfg, env);
    cfg.validate();
    return cfg;
}

void applyEnvironmentOverrides(Config& cfg, const EnvLookup& env) {
    if (const auto key = env("FOLIO_API_KEY")) cfg.auth.api_key = *key;
    else if (const auto legacy = env("WEASYPRINT_API_KEY")) cfg.auth.api_key = *legacy;

    if (const auto origins = env("ALLOWED_ORIGINS")) cfg.cors.allowed_origins = splitOrigins(*origins);

    if (const auto host = env("HOST")) cfg.server.host = *host;

    if (const auto port = env("PORT")) {
        unsigned long value = 0;
        try {
            std::size_t pos = 0;
            value = std::stoul(*port, &pos);
            if (pos != port->size()) throw std::invalid_argument("trailing characters");
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid PORT value: " + *port);
        }
        if (value == 0 || value > 65535) throw std::runtime_error("PORT out of range: " + *port);
        cfg.server.port = static_cast<uint16_t>(value);
    }

    if (const auto level = env("FOLIO_LOG_LEVEL")) {
        try {
            cfg.logging.levels.console_log_level = parseLogLevel(*level);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(e.what());
        }
    }
}

// Plain comma split, no trimming: "a, b" yields "a" and " b".
std::vector<std::string> splitOrigins(const std::string& csv) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (true) {
        const auto comma = csv.find(',', start);
        out.emplace_back(csv.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

std::string toYaml(const Config& cfg) {
    YAML::Node root;
    root["server"] = cfg.server;
    root["auth"] = cfg.auth;
    root["cors"] = cfg.cors;
    root["render"] = cfg.render;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

} // namespace folio::config
