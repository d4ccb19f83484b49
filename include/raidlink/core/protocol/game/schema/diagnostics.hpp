#pragma once

#include <ostream>
#include <string>

#include "raidlink/core/protocol/game/schema/dump.hpp"
#include "lcr/json.hpp"


namespace raidlink::core::protocol::game::schema {

/*
===============================================================================
Admin round-trip diagnostics and device registration
===============================================================================

  in   admin_diagnostic_ping  {"ping_id":"p-1","admin_session_id":"adm-9"}
  out  client_diagnostic_pong {"ping_id":"p-1","client_timestamp":"2025-06-01T10:00:00.123Z",
                               "admin_session_id":"adm-9"}
  out  register_device        {"device_uuid":"3F2A..."}

The pong echoes ping_id and admin_session_id so the admin console can match
it to the ping it sent.
===============================================================================
*/

struct AdminDiagnosticPing {
    std::string ping_id;
    std::string admin_session_id;

    inline void dump(std::ostream& os) const {
        os << "[ADMIN_DIAGNOSTIC_PING] { ping_id=" << ping_id
           << ", admin_session_id=" << admin_session_id << " }";
    }
};

struct ClientDiagnosticPong {
    std::string ping_id;
    std::string client_timestamp;   // ISO-8601 UTC
    std::string admin_session_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(96 + ping_id.size() + admin_session_id.size());
        out += '{';
        lcr::json::append_key(out, "ping_id", true);
        lcr::json::append_string(out, ping_id);
        lcr::json::append_key(out, "client_timestamp", false);
        lcr::json::append_string(out, client_timestamp);
        lcr::json::append_key(out, "admin_session_id", false);
        lcr::json::append_string(out, admin_session_id);
        out += '}';
        return out;
    }

    inline void dump(std::ostream& os) const {
        os << "[CLIENT_DIAGNOSTIC_PONG] " << to_json();
    }
};

struct RegisterDevice {
    std::string device_uuid;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out += '{';
        lcr::json::append_key(out, "device_uuid", true);
        lcr::json::append_string(out, device_uuid);
        out += '}';
        return out;
    }

    inline void dump(std::ostream& os) const {
        os << "[REGISTER_DEVICE] " << to_json();
    }
};

} // namespace raidlink::core::protocol::game::schema
