#pragma once

#include "raidlink/core/protocol/game/parser/adapters.hpp"
#include "raidlink/core/protocol/game/parser/helpers.hpp"
#include "raidlink/core/protocol/game/schema/objects.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace raidlink::core::protocol::game::parser {

struct object_collected {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ObjectCollected& out) {
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Payload not an object in object_collected -> drop event.");
            return r;
        }
        // object_id (required)
        r = adapter::parse_id_required(root, "object_id", out.object_id);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'object_id' missing or invalid in object_collected -> drop event.");
            return r;
        }
        // found_by (required)
        r = adapter::parse_text_required(root, "found_by", out.found_by);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'found_by' missing or invalid in object_collected -> drop event.");
            return r;
        }
        // found_at (required)
        r = adapter::parse_text_required(root, "found_at", out.found_at);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'found_at' missing or invalid in object_collected -> drop event.");
            return r;
        }
        return Result::Parsed;
    }
};

struct object_uncollected {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ObjectUncollected& out) {
        auto r = adapter::parse_id_required(root, "object_id", out.object_id);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'object_id' missing or invalid in object_uncollected -> drop event.");
            return r;
        }
        return Result::Parsed;
    }
};

struct all_finds_reset {

    // No fields; any object payload is accepted
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::AllFindsReset&) noexcept {
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Payload not an object in all_finds_reset -> drop event.");
        }
        return r;
    }
};

struct object_created {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ObjectCreated& out) {
        // id (required)
        auto r = adapter::parse_id_required(root, "id", out.id);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'id' missing or invalid in object_created -> drop event.");
            return r;
        }
        // name, type (optional)
        r = helper::parse_string_optional(root, "name", out.name);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'name' invalid in object_created -> drop event.");
            return r;
        }
        r = helper::parse_string_optional(root, "type", out.type);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'type' invalid in object_created -> drop event.");
            return r;
        }
        // latitude, longitude, radius (optional)
        r = helper::parse_double_optional(root, "latitude", out.latitude);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'latitude' invalid in object_created -> drop event.");
            return r;
        }
        r = helper::parse_double_optional(root, "longitude", out.longitude);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'longitude' invalid in object_created -> drop event.");
            return r;
        }
        r = helper::parse_double_optional(root, "radius", out.radius);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'radius' invalid in object_created -> drop event.");
            return r;
        }
        return Result::Parsed;
    }
};

struct object_deleted {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ObjectDeleted& out) {
        auto r = adapter::parse_id_required(root, "object_id", out.object_id);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'object_id' missing or invalid in object_deleted -> drop event.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace raidlink::core::protocol::game::parser
