#pragma once

#include <string>
#include <cctype>
#include <cstddef>
#include <string_view>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace raidlink::examples::cli {

// -------------------------------------------------------------
// Server base URL validator
// -------------------------------------------------------------
// Bare "host:port" is accepted (http:// is assumed)
inline auto base_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty()) {
            return "URL must not be empty";
        }
        const auto sep = value.find("://");
        if (sep == std::string::npos) {
            return {};
        }
        const std::string scheme = value.substr(0, sep);
        if (scheme == "http" || scheme == "https" || scheme == "ws" || scheme == "wss") {
            return {};
        }
        return "URL must start with http://, https://, ws:// or wss://";
    },
    "Server URL validator"
);


// -------------------------------------------------------------
// Device UUID validator (8-4-4-4-12 hex)
// -------------------------------------------------------------
inline auto device_uuid_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.size() != 36) {
            return "Device UUID must look like 123e4567-e89b-12d3-a456-426614174000";
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            const char c = value[i];
            const bool dash_slot = (i == 8 || i == 13 || i == 18 || i == 23);
            if (dash_slot ? (c != '-') : !std::isxdigit(static_cast<unsigned char>(c))) {
                return "Device UUID must look like 123e4567-e89b-12d3-a456-426614174000";
            }
        }
        return {};
    },
    "Device UUID validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level ignored;
        if (lcr::log::parse_level(value, ignored)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal, off";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Liveness policy validator
// -------------------------------------------------------------
inline auto liveness_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "passive" || value == "active") {
            return {};
        }
        return "Liveness must be 'passive' or 'active'";
    },
    "Liveness policy validator"
);

} // namespace raidlink::examples::cli
