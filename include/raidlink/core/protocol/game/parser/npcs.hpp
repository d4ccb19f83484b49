#pragma once

#include <string_view>

#include "raidlink/core/protocol/game/parser/adapters.hpp"
#include "raidlink/core/protocol/game/parser/helpers.hpp"
#include "raidlink/core/protocol/game/schema/npcs.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace raidlink::core::protocol::game::parser {

namespace detail {

// Shared by npc_created and npc_updated
[[nodiscard]]
inline Result parse_npc_common(const simdjson::dom::element& root, schema::Npc& out, std::string_view event) {
    // id (required)
    auto r = adapter::parse_id_required(root, "id", out.id);
    if (r != Result::Parsed) {
        RL_DEBUG("[ROUTER] Field 'id' missing or invalid in " << event << " -> drop event.");
        return r;
    }
    r = helper::parse_string_optional(root, "name", out.name);
    if (r != Result::Parsed) {
        RL_DEBUG("[ROUTER] Field 'name' invalid in " << event << " -> drop event.");
        return r;
    }
    r = helper::parse_string_optional(root, "npc_type", out.npc_type);
    if (r != Result::Parsed) {
        RL_DEBUG("[ROUTER] Field 'npc_type' invalid in " << event << " -> drop event.");
        return r;
    }
    r = helper::parse_double_optional(root, "latitude", out.latitude);
    if (r != Result::Parsed) {
        RL_DEBUG("[ROUTER] Field 'latitude' invalid in " << event << " -> drop event.");
        return r;
    }
    r = helper::parse_double_optional(root, "longitude", out.longitude);
    if (r != Result::Parsed) {
        RL_DEBUG("[ROUTER] Field 'longitude' invalid in " << event << " -> drop event.");
        return r;
    }
    return Result::Parsed;
}

} // namespace detail

struct npc_created {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::NpcCreated& out) {
        return detail::parse_npc_common(root, out, "npc_created");
    }
};

struct npc_updated {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::NpcUpdated& out) {
        return detail::parse_npc_common(root, out, "npc_updated");
    }
};

struct npc_deleted {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::NpcDeleted& out) {
        auto r = adapter::parse_id_required(root, "npc_id", out.npc_id);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'npc_id' missing or invalid in npc_deleted -> drop event.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace raidlink::core::protocol::game::parser
