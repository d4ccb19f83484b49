#pragma once

#include <concepts>
#include <string>


namespace raidlink::core::health {

// -----------------------------------------------------------------------------
// HealthCheckConcept
//
// One out-of-band reachability probe of the server, run without blocking:
//
//   start(base_url)  begin a check; false if one is already in flight
//   poll(healthy)    true once the check finished, with the verdict in `healthy`
//   cancel()         abandon the check in flight (no-op when idle)
//
// A check that cannot reach the server, or whose answer is not a healthy
// one, finishes with healthy == false.
// -----------------------------------------------------------------------------
template<class C>
concept HealthCheckConcept =
    requires(C c, const std::string& url, bool& healthy) {
        { c.start(url) } -> std::same_as<bool>;
        { c.poll(healthy) } -> std::same_as<bool>;
        { c.cancel() } -> std::same_as<void>;
    };

} // namespace raidlink::core::health
