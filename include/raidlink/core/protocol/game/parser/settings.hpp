#pragma once

#include "raidlink/core/protocol/game/parser/adapters.hpp"
#include "raidlink/core/protocol/game/schema/settings.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace raidlink::core::protocol::game::parser {

struct location_update_interval_changed {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::LocationUpdateIntervalChanged& out) noexcept {
        auto r = adapter::parse_interval_seconds_required(root, "interval_seconds", out.interval_seconds);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'interval_seconds' missing or invalid in location_update_interval_changed -> drop event.");
            return r;
        }
        return Result::Parsed;
    }
};

struct game_mode_changed {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::GameModeChanged& out) {
        auto r = adapter::parse_text_required(root, "game_mode", out.game_mode);
        if (r != Result::Parsed) {
            RL_DEBUG("[ROUTER] Field 'game_mode' missing or invalid in game_mode_changed -> drop event.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace raidlink::core::protocol::game::parser
