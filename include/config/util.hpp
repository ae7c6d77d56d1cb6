#pragma once

#include "config/Config.hpp"

#include <string>
#include <stdexcept>

namespace folio::config {

inline uintmax_t parseMbOrGbToByte(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    if (str.size() > 2 && (str.substr(str.size() - 2) == "GB" || str.substr(str.size() - 2) == "gb")) {
        const auto gb = std::stoull(str.substr(0, str.size() - 2));
        return gb * 1024 * 1024 * 1024;
    }

    if (str.size() > 1 && (str.back() == 'G' || str.back() == 'g')) {
        const auto gb = std::stoull(str.substr(0, str.size() - 1));
        return gb * 1024 * 1024 * 1024;
    }

    if (str.size() > 2 && (str.substr(str.size() - 2) == "MB" || str.substr(str.size() - 2) == "mb")) {
        const auto mb = std::stoull(str.substr(0, str.size() - 2));
        return mb * 1024 * 1024;
    }

    if (str.size() > 1 && (str.back() == 'M' || str.back() == 'm')) {
        const auto mb = std::stoull(str.substr(0, str.size() - 1));
        return mb * 1024 * 1024;
    }

    // Assume MB if no suffix
    const auto mb = std::stoull(str);
    return mb * 1024 * 1024;
}

inline std::string bytesToMbOrGbStr(const uintmax_t bytes) {
    if (bytes % (1024 * 1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024 * 1024)) + "GB";
    return std::to_string(bytes / (1024 * 1024)) + "MB";
}

inline PageSize parsePageSize(const std::string& str) {
    if (str == "A3") return PageSize::A3;
    if (str == "A4") return PageSize::A4;
    if (str == "A5") return PageSize::A5;
    if (str == "Letter" || str == "letter") return PageSize::Letter;
    if (str == "Legal" || str == "legal") return PageSize::Legal;
    throw std::invalid_argument("Invalid page size: " + str);
}

inline std::string pageSizeToString(const PageSize p) {
    switch (p) {
        case PageSize::A3: return "A3";
        case PageSize::A4: return "A4";
        case PageSize::A5: return "A5";
        case PageSize::Letter: return "Letter";
        case PageSize::Legal: return "Legal";
    }
    return "unknown";
}

// spdlog maps unknown names to "off"; reject those instead of silencing a channel.
inline spdlog::level::level_enum parseLogLevel(const std::string& str) {
    const auto lvl = spdlog::level::from_str(str);
    if (lvl == spdlog::level::off && str != "off") throw std::invalid_argument("Invalid log level: " + str);
    return lvl;
}

inline std::string logLevelToString(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}
