#pragma once

#include "raidlink/core/protocol/game/parser/adapters.hpp"
#include "raidlink/core/protocol/game/schema/diagnostics.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace raidlink::core::protocol::game::parser {

struct admin_diagnostic_ping {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::AdminDiagnosticPing& out) {
        auto r = adapter::parse_id_required(root, "ping_id", out.ping_id);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'ping_id' missing or invalid in admin_diagnostic_ping -> drop event.");
            return r;
        }
        r = adapter::parse_id_required(root, "admin_session_id", out.admin_session_id);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'admin_session_id' missing or invalid in admin_diagnostic_ping -> drop event.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace raidlink::core::protocol::game::parser
