#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "raidlink/core/protocol/game/schema/dump.hpp"


namespace raidlink::core::protocol::game::schema {

// npc_created / npc_updated share one payload shape:
//   {"id":"npc-1","name":"Captain Bones","npc_type":"skeleton","latitude":..,"longitude":..}
// Only "id" is required; an update carries the fields that changed.
struct Npc {
    std::string id;
    std::optional<std::string> name;
    std::optional<std::string> npc_type;
    std::optional<double> latitude;
    std::optional<double> longitude;

    inline void dump(std::ostream& os) const {
        os << "{ id=" << id;
        if (name)      os << ", name=" << *name;
        if (npc_type)  os << ", npc_type=" << *npc_type;
        if (latitude)  os << ", latitude=" << *latitude;
        if (longitude) os << ", longitude=" << *longitude;
        os << " }";
    }
};

struct NpcCreated : Npc {
    inline void dump(std::ostream& os) const {
        os << "[NPC_CREATED] ";
        Npc::dump(os);
    }
};

struct NpcUpdated : Npc {
    inline void dump(std::ostream& os) const {
        os << "[NPC_UPDATED] ";
        Npc::dump(os);
    }
};

struct NpcDeleted {
    std::string npc_id;

    inline void dump(std::ostream& os) const {
        os << "[NPC_DELETED] { npc_id=" << npc_id << " }";
    }
};

} // namespace raidlink::core::protocol::game::schema
