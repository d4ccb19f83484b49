#pragma once

#include <ostream>


namespace raidlink::core::protocol::game::schema {

// Stream operator<< for every schema type; delegates to dump()
template<class T>
    requires requires(const T& t, std::ostream& os) { t.dump(os); }
inline std::ostream& operator<<(std::ostream& os, const T& msg) {
    msg.dump(os);
    return os;
}

} // namespace raidlink::core::protocol::game::schema
