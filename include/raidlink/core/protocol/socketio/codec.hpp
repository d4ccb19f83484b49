#pragma once

#include <string>
#include <string_view>

#include "raidlink/core/protocol/socketio/frame.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

/*
================================================================================
Socket.IO Frame Codec
================================================================================

Decoding classifies a raw text frame by its leading characters. Only the JSON
parts (Open session object, NamespaceAck sid, Event array) go through
simdjson; heartbeat frames are matched exactly.

Decoding never fails: anything that does not match a known shape becomes
frame::Unknown, which callers log and discard.

The codec owns one simdjson parser and is therefore not thread-safe; each
Connection owns its own codec.
================================================================================
*/

namespace raidlink::core::protocol::socketio {

class Codec {
public:
    Codec() = default;

    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;

    // ---------------------------------------------------------------------
    // Decoding
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline Frame decode(std::string_view raw) {
        if (raw == "2") {
            return frame::Ping{};
        }
        if (raw == "3") {
            return frame::Pong{};
        }
        if (raw == "40") {
            return frame::NamespaceAck{};
        }
        if (starts_with_(raw, "0{")) {
            return decode_open_(raw.substr(1));
        }
        if (starts_with_(raw, "40{")) {
            return decode_namespace_ack_(raw.substr(2));
        }
        if (starts_with_(raw, "42[")) {
            return decode_event_(raw);
        }
        return frame::Unknown{std::string(raw)};
    }

    // ---------------------------------------------------------------------
    // Encoding
    // ---------------------------------------------------------------------

    [[nodiscard]] static inline std::string encode_ping() { return "2"; }
    [[nodiscard]] static inline std::string encode_pong() { return "3"; }
    [[nodiscard]] static inline std::string encode_namespace_connect() { return "40"; }

    // 42["name",payload]
    // PRECONDITION: payload_json is a serialized JSON value
    [[nodiscard]]
    static inline std::string encode_event(std::string_view name, std::string_view payload_json) {
        std::string out;
        out.reserve(6 + name.size() + payload_json.size());
        out += "42[";
        lcr::json::append_string(out, name);
        out += ',';
        out += payload_json;
        out += ']';
        return out;
    }

private:
    simdjson::dom::parser parser_;

    [[nodiscard]]
    static inline bool starts_with_(std::string_view s, std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    // Session info is informative only: a malformed object still opens the session
    [[nodiscard]]
    inline Frame decode_open_(std::string_view json) {
        frame::Open open;
        simdjson::dom::element root;
        if (parser_.parse(json.data(), json.size()).get(root) ||
            root.type() != simdjson::dom::element_type::OBJECT) {
            RL_DEBUG("[CODEC] Open frame carries unparsable session info: " << json);
            return open;
        }
        std::string_view sid;
        if (!root["sid"].get(sid)) {
            open.session.sid = std::string(sid);
        }
        std::uint64_t v = 0;
        if (!root["pingInterval"].get(v)) {
            open.session.ping_interval_ms = v;
        }
        if (!root["pingTimeout"].get(v)) {
            open.session.ping_timeout_ms = v;
        }
        return open;
    }

    // The ack stands even if the sid cannot be read
    [[nodiscard]]
    inline Frame decode_namespace_ack_(std::string_view json) {
        frame::NamespaceAck ack;
        simdjson::dom::element root;
        std::string_view sid;
        if (!parser_.parse(json.data(), json.size()).get(root) && !root["sid"].get(sid)) {
            ack.sid = std::string(sid);
        } else {
            RL_DEBUG("[CODEC] Namespace ack without readable sid: " << json);
        }
        return ack;
    }

    // 42[ "name", {payload}, ... ]
    [[nodiscard]]
    inline Frame decode_event_(std::string_view raw) {
        const std::string_view json = raw.substr(2);
        simdjson::dom::element root;
        if (parser_.parse(json.data(), json.size()).get(root)) {
            RL_DEBUG("[CODEC] Event frame is not valid JSON: " << raw);
            return frame::Unknown{std::string(raw)};
        }
        simdjson::dom::array arr;
        if (root.get(arr) || arr.size() < 2) {
            RL_DEBUG("[CODEC] Event frame is not a [name, payload] array: " << raw);
            return frame::Unknown{std::string(raw)};
        }
        std::string_view name;
        if (arr.at(0).get(name) || name.empty()) {
            RL_DEBUG("[CODEC] Event frame has no string name: " << raw);
            return frame::Unknown{std::string(raw)};
        }
        simdjson::dom::element payload;
        if (arr.at(1).get(payload) || payload.type() != simdjson::dom::element_type::OBJECT) {
            RL_DEBUG("[CODEC] Event '" << name << "' payload is not an object: " << raw);
            return frame::Unknown{std::string(raw)};
        }
        return frame::Event{std::string(name), simdjson::minify(payload)};
    }
};

} // namespace raidlink::core::protocol::socketio
