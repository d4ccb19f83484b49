#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "raidlink/core/protocol/game/schema/dump.hpp"


namespace raidlink::core::protocol::game::schema {

/*
===============================================================================
Collectible object events
===============================================================================

Example payloads:

  object_collected   {"object_id":"chest-7","found_by":"3F2A...","found_at":"2025-06-01T10:00:00Z"}
  object_uncollected {"object_id":"chest-7"}
  all_finds_reset    {}
  object_created     {"id":"chest-8","name":"Old Chest","type":"chalice",
                      "latitude":37.77,"longitude":-122.41,"radius":5.0}
  object_deleted     {"object_id":"chest-8"}

Identifiers are kept as strings; numeric ids on the wire are converted.
===============================================================================
*/

struct ObjectCollected {
    std::string object_id;
    std::string found_by;           // Device / user id of the finder
    std::string found_at;           // Server timestamp, passed through verbatim

    inline void dump(std::ostream& os) const {
        os << "[OBJECT_COLLECTED] { object_id=" << object_id
           << ", found_by=" << found_by
           << ", found_at=" << found_at << " }";
    }
};

struct ObjectUncollected {
    std::string object_id;

    inline void dump(std::ostream& os) const {
        os << "[OBJECT_UNCOLLECTED] { object_id=" << object_id << " }";
    }
};

struct AllFindsReset {
    inline void dump(std::ostream& os) const {
        os << "[ALL_FINDS_RESET] {}";
    }
};

struct ObjectCreated {
    std::string id;
    std::optional<std::string> name;
    std::optional<std::string> type;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> radius;   // Meters

    inline void dump(std::ostream& os) const {
        os << "[OBJECT_CREATED] { id=" << id;
        if (name)      os << ", name=" << *name;
        if (type)      os << ", type=" << *type;
        if (latitude)  os << ", latitude=" << *latitude;
        if (longitude) os << ", longitude=" << *longitude;
        if (radius)    os << ", radius=" << *radius;
        os << " }";
    }
};

struct ObjectDeleted {
    std::string object_id;

    inline void dump(std::ostream& os) const {
        os << "[OBJECT_DELETED] { object_id=" << object_id << " }";
    }
};

} // namespace raidlink::core::protocol::game::schema
