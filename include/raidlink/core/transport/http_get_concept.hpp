#pragma once

#include <chrono>
#include <concepts>
#include <string>

#include "raidlink/core/transport/http/result.hpp"


namespace raidlink::core::transport {

// -----------------------------------------------------------------------------
// HttpGetConcept
//
// A one-shot, non-blocking HTTP GET polled from the caller's thread:
//
//   start(url, timeout)  begin the request; false if it cannot be started
//   done()               true once a result is available
//   result()             outcome of the last request (valid when done())
//   cancel()             abandon the request, release its resources
// -----------------------------------------------------------------------------
template<class G>
concept HttpGetConcept =
    requires(G g, const G cg, const std::string& url, std::chrono::milliseconds timeout) {
        { g.start(url, timeout) } -> std::same_as<bool>;
        { cg.done() } -> std::same_as<bool>;
        { cg.result() } -> std::same_as<const http::Result&>;
        { g.cancel() } -> std::same_as<void>;
    };

} // namespace raidlink::core::transport
