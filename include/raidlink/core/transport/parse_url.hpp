#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "raidlink/core/transport/error.hpp"


namespace raidlink::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure = false;  // true = wss, false = ws
        std::string host;
        std::string port;
        std::string target;   // path + query, used as the upgrade request target
    };

    // Engine.IO v4 handshake path appended to every derived socket URL
    inline constexpr std::string_view SOCKET_IO_PATH = "/socket.io/?EIO=4&transport=websocket";

    // ---------------------------------------------------------------------
    // Minimal ws:// / wss:// URL parser.
    // Accepts the URLs produced by derive_socket_url() and plain endpoint
    // URLs; rejects malformed input without attempting full RFC compliance.
    //
    //   wss://game.example.com/socket.io/?EIO=4&transport=websocket
    //   ws://192.168.1.10:5001/socket.io/?EIO=4&transport=websocket
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(const std::string& url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.compare(0, ws.size(), ws) == 0) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.compare(0, wss.size(), wss) == 0) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // host[:port] ends at the first '/' or '?'
        const std::size_t end = url.find_first_of("/?", pos);
        const std::string hostport = (end == std::string::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        const std::size_t colon = hostport.find(':');
        if (colon != std::string::npos) {
            out.host = hostport.substr(0, colon);
            out.port = hostport.substr(colon + 1);
        } else {
            out.host = hostport;
            out.port = out.secure ? "443" : "80";
        }
        if (end == std::string::npos) {
            out.target = "/";
        } else if (url[end] == '?') {
            out.target = "/" + url.substr(end);
        } else {
            out.target = url.substr(end);
        }

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        return Error::None;
    }

    // ---------------------------------------------------------------------
    // Derives the Socket.IO WebSocket endpoint from the configured base URL.
    //
    //   http://host:5000     -> ws://host:5000/socket.io/?EIO=4&transport=websocket
    //   https://host         -> wss://host/socket.io/?EIO=4&transport=websocket
    //
    // ws:// and wss:// base URLs are kept as-is. Trailing slashes on the base
    // are dropped. A base without a scheme or host is rejected.
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error derive_socket_url(std::string_view base_url, std::string& out) {
        out.clear();
        std::string_view rest;
        std::string_view scheme;
        if (base_url.substr(0, 7) == "http://") {
            scheme = "ws://";
            rest = base_url.substr(7);
        } else if (base_url.substr(0, 8) == "https://") {
            scheme = "wss://";
            rest = base_url.substr(8);
        } else if (base_url.substr(0, 5) == "ws://") {
            scheme = "ws://";
            rest = base_url.substr(5);
        } else if (base_url.substr(0, 6) == "wss://") {
            scheme = "wss://";
            rest = base_url.substr(6);
        } else {
            return Error::InvalidUrl;
        }
        while (!rest.empty() && rest.back() == '/') {
            rest.remove_suffix(1);
        }
        if (rest.empty() || rest.front() == '/' || rest.front() == ':' ||
            rest.find_first_of(" \t\r\n") != std::string_view::npos) {
            return Error::InvalidUrl;
        }
        out.reserve(scheme.size() + rest.size() + SOCKET_IO_PATH.size());
        out.append(scheme).append(rest).append(SOCKET_IO_PATH);

        ParsedUrl check;
        if (parse_url(out, check) != Error::None) {
            out.clear();
            return Error::InvalidUrl;
        }
        return Error::None;
    }

    // ---------------------------------------------------------------------
    // Adds "http://" to scheme-less input ("10.0.0.5:5000" -> "http://10.0.0.5:5000").
    // Used by the diagnostics front door, where operators type bare addresses.
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline std::string normalize_base_url(std::string_view input) {
        while (!input.empty() && (input.front() == ' ' || input.front() == '\t')) input.remove_prefix(1);
        while (!input.empty() && (input.back() == ' ' || input.back() == '\t')) input.remove_suffix(1);
        if (input.find("://") == std::string_view::npos) {
            return "http://" + std::string(input);
        }
        return std::string(input);
    }

} // namespace raidlink::core::transport
