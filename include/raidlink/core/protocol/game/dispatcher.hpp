#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "raidlink/core/protocol/game/schema/diagnostics.hpp"
#include "raidlink/core/protocol/game/schema/npcs.hpp"
#include "raidlink/core/protocol/game/schema/objects.hpp"
#include "raidlink/core/protocol/game/schema/settings.hpp"


namespace raidlink::core::protocol::game {

using handler_id_t = std::uint64_t;
inline constexpr handler_id_t INVALID_HANDLER_ID = 0;

/*
================================================================================
 HandlerList<EventT>
================================================================================

The handlers registered for one event type, in registration order.

Two flavours of handler:

  - plain:  std::function<void(const EventT&)>; lives until remove()
  - owned:  bound to a std::weak_ptr<Owner>; invoked only while the owner is
            alive, pruned on the first dispatch that finds it expired

A handler never keeps its owner alive, so a consumer that goes away without
unregistering cannot be called back.

dispatch() iterates over a snapshot: handlers may add or remove handlers
(including themselves) from inside a callback. Changes take effect on the
next dispatch.
================================================================================
*/
template<class EventT>
class HandlerList {
public:
    using Callback = std::function<void(const EventT&)>;

    inline void add(handler_id_t id, Callback cb) {
        entries_.push_back(Entry{
            .id       = id,
            .callback = [cb = std::move(cb)](const EventT& ev) { cb(ev); return true; }
        });
    }

    template<class Owner>
    inline void add(handler_id_t id, const std::shared_ptr<Owner>& owner, std::type_identity_t<std::function<void(Owner&, const EventT&)>> cb) {
        std::weak_ptr<Owner> weak = owner;
        entries_.push_back(Entry{
            .id       = id,
            .callback = [weak = std::move(weak), cb = std::move(cb)](const EventT& ev) {
                auto locked = weak.lock();
                if (!locked) {
                    return false;   // owner gone
                }
                cb(*locked, ev);
                return true;
            }
        });
    }

    [[nodiscard]]
    inline bool remove(handler_id_t id) {
        auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; });
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    // Returns the number of handlers that ran
    inline std::size_t dispatch(const EventT& ev) {
        if (entries_.empty()) {
            return 0;
        }
        const std::vector<Entry> snapshot = entries_;
        std::vector<handler_id_t> expired;
        std::size_t delivered = 0;
        for (const Entry& e : snapshot) {
            if (e.callback(ev)) {
                ++delivered;
            } else {
                expired.push_back(e.id);
            }
        }
        for (handler_id_t id : expired) {
            (void)remove(id);
        }
        return delivered;
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return entries_.size(); }
    inline void clear() noexcept { entries_.clear(); }

private:
    struct Entry {
        handler_id_t id;
        std::function<bool(const EventT&)> callback;    // false: owner expired
    };

    std::vector<Entry> entries_;
};


/*
================================================================================
 HandlerTable
================================================================================

Registry of consumer handlers for every inbound application event, keyed by
the event's schema type:

    HandlerTable table;
    auto id = table.add_handler<schema::ObjectCollected>([](const auto& ev) { ... });
    table.remove_handler(id);

    auto view = std::make_shared<MapView>();
    table.add_handler<schema::NpcUpdated>(view, [](MapView& v, const auto& ev) { v.move(ev); });

Handler ids are unique across all event types and never reused.
Mutation is confined to the thread that polls the session.
================================================================================
*/
class HandlerTable {
    using Lists = std::tuple<
        HandlerList<schema::ObjectCollected>,
        HandlerList<schema::ObjectUncollected>,
        HandlerList<schema::AllFindsReset>,
        HandlerList<schema::ObjectCreated>,
        HandlerList<schema::ObjectDeleted>,
        HandlerList<schema::NpcCreated>,
        HandlerList<schema::NpcUpdated>,
        HandlerList<schema::NpcDeleted>,
        HandlerList<schema::LocationUpdateIntervalChanged>,
        HandlerList<schema::GameModeChanged>,
        HandlerList<schema::AdminDiagnosticPing>
    >;

public:
    template<class EventT>
    inline handler_id_t add_handler(std::function<void(const EventT&)> cb) {
        const handler_id_t id = next_id_++;
        list_<EventT>().add(id, std::move(cb));
        return id;
    }

    template<class EventT, class Owner>
    inline handler_id_t add_handler(const std::shared_ptr<Owner>& owner, std::type_identity_t<std::function<void(Owner&, const EventT&)>> cb) {
        if (!owner) {
            return INVALID_HANDLER_ID;
        }
        const handler_id_t id = next_id_++;
        list_<EventT>().add(id, owner, std::move(cb));
        return id;
    }

    // Removes the handler wherever it is registered. False for unknown ids.
    inline bool remove_handler(handler_id_t id) {
        if (id == INVALID_HANDLER_ID) {
            return false;
        }
        return std::apply([id](auto&... lists) { return (lists.remove(id) || ...); }, lists_);
    }

    template<class EventT>
    inline std::size_t dispatch(const EventT& ev) {
        return list_<EventT>().dispatch(ev);
    }

    template<class EventT>
    [[nodiscard]]
    inline std::size_t handler_count() const noexcept {
        return std::get<HandlerList<EventT>>(lists_).size();
    }

    inline void clear() noexcept {
        std::apply([](auto&... lists) { (lists.clear(), ...); }, lists_);
    }

private:
    Lists lists_;
    handler_id_t next_id_ = 1;

    template<class EventT>
    inline HandlerList<EventT>& list_() noexcept {
        return std::get<HandlerList<EventT>>(lists_);
    }
};

} // namespace raidlink::core::protocol::game
