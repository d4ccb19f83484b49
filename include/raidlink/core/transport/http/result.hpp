#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "raidlink/core/transport/error.hpp"


namespace raidlink::core::transport::http {

// Outcome of one HTTP GET
struct Result {
    Error error = Error::None;           // None when a response was received
    unsigned status = 0;                 // HTTP status code, 0 without a response
    std::string body;
    std::chrono::milliseconds latency{0};
    std::string detail;                  // library message for the failure, if any

    [[nodiscard]] bool responded() const noexcept { return error == Error::None; }
    [[nodiscard]] bool success() const noexcept { return responded() && status >= 200 && status < 300; }
};

// Splits http(s)://host[:port][/target]. Returns false for anything else.
struct Url {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;
};

[[nodiscard]]
inline bool parse_url(std::string_view url, Url& out) {
    out = Url{};
    std::string_view rest;
    if (url.substr(0, 7) == "http://") {
        rest = url.substr(7);
    } else if (url.substr(0, 8) == "https://") {
        out.secure = true;
        rest = url.substr(8);
    } else {
        return false;
    }
    const auto slash = rest.find('/');
    const std::string_view hostport = rest.substr(0, slash);
    out.target = (slash == std::string_view::npos) ? "/" : std::string(rest.substr(slash));
    const auto colon = hostport.find(':');
    if (colon == std::string_view::npos) {
        out.host = std::string(hostport);
        out.port = out.secure ? "443" : "80";
    } else {
        out.host = std::string(hostport.substr(0, colon));
        out.port = std::string(hostport.substr(colon + 1));
    }
    if (out.host.empty() || out.port.empty() || out.port.size() > 5) {
        return false;
    }
    for (char c : out.port) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

} // namespace raidlink::core::transport::http
