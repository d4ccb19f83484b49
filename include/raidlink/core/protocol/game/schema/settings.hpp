#pragma once

#include <ostream>
#include <string>

#include "raidlink/core/protocol/game/schema/dump.hpp"


namespace raidlink::core::protocol::game::schema {

// {"interval_seconds": 5}
struct LocationUpdateIntervalChanged {
    double interval_seconds = 0.0;

    inline void dump(std::ostream& os) const {
        os << "[LOCATION_UPDATE_INTERVAL_CHANGED] { interval_seconds=" << interval_seconds << " }";
    }
};

// {"game_mode": "open"}
struct GameModeChanged {
    std::string game_mode;

    inline void dump(std::ostream& os) const {
        os << "[GAME_MODE_CHANGED] { game_mode=" << game_mode << " }";
    }
};

} // namespace raidlink::core::protocol::game::schema
