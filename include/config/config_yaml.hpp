#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace folio::config;

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["max_body_size"] = bytesToMbOrGbStr(rhs.max_body_size_bytes);
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>(rhs.host);
        if (const auto port = node["port"]) {
            const auto v = port.as<unsigned long>();
            if (v == 0 || v > 65535) throw std::invalid_argument("server.port out of range: " + port.as<std::string>());
            rhs.port = static_cast<uint16_t>(v);
        }
        if (node["max_body_size"]) rhs.max_body_size_bytes = parseMbOrGbToByte(node["max_body_size"].as<std::string>());
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static Node encode(const AuthConfig&) {
        Node node;
        node["api_key"] = "<redacted>";
        return node;
    }

    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.api_key = node["api_key"].as<std::string>(rhs.api_key);
        return true;
    }
};

template<>
struct convert<CorsConfig> {
    static Node encode(const CorsConfig& rhs) {
        Node node;
        node["allowed_origins"] = rhs.allowed_origins;
        return node;
    }

    static bool decode(const Node& node, CorsConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto origins = node["allowed_origins"]) {
            if (origins.IsSequence()) rhs.allowed_origins = origins.as<std::vector<std::string>>();
            else rhs.allowed_origins = splitOrigins(origins.as<std::string>());
        }
        return true;
    }
};

template<>
struct convert<RenderConfig> {
    static Node encode(const RenderConfig& rhs) {
        Node node;
        node["max_concurrent_renders"] = rhs.max_concurrent_renders;
        node["page_size"] = pageSizeToString(rhs.page_size);
        node["landscape"] = rhs.landscape;
        node["margin_cm"] = rhs.margin_cm;
        node["dpi"] = rhs.dpi;
        return node;
    }

    static bool decode(const Node& node, RenderConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_concurrent_renders = node["max_concurrent_renders"].as<unsigned int>(rhs.max_concurrent_renders);
        if (node["page_size"]) rhs.page_size = parsePageSize(node["page_size"].as<std::string>());
        rhs.landscape = node["landscape"].as<bool>(rhs.landscape);
        rhs.margin_cm = node["margin_cm"].as<double>(rhs.margin_cm);
        rhs.dpi = node["dpi"].as<unsigned int>(rhs.dpi);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["folio"]  = logLevelToString(rhs.folio);
        node["http"]   = logLevelToString(rhs.http);
        node["auth"]   = logLevelToString(rhs.auth);
        node["render"] = logLevelToString(rhs.render);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.folio = parseLogLevel(node["folio"].as<std::string>(logLevelToString(rhs.folio)));
        rhs.http = parseLogLevel(node["http"].as<std::string>(logLevelToString(rhs.http)));
        rhs.auth = parseLogLevel(node["auth"].as<std::string>(logLevelToString(rhs.auth)));
        rhs.render = parseLogLevel(node["render"].as<std::string>(logLevelToString(rhs.render)));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = logLevelToString(rhs.console_log_level);
        node["file_log_level"]    = logLevelToString(rhs.file_log_level);
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parseLogLevel(
            node["console_log_level"].as<std::string>(logLevelToString(rhs.console_log_level)));
        rhs.file_log_level = parseLogLevel(
            node["file_log_level"].as<std::string>(logLevelToString(rhs.file_log_level)));
        if (const auto sub = node["subsystem_levels"]; sub && !convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels))
            return false;
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        if (const auto levels = node["levels"]; levels && !convert<LogLevelsConfig>::decode(levels, rhs.levels))
            return false;
        return true;
    }
};

}
