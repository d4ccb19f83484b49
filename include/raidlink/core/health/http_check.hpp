#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "raidlink/core/config/timing.hpp"
#include "raidlink/core/health/concept.hpp"
#include "raidlink/core/transport/beast/http_get.hpp"
#include "raidlink/core/transport/http_get_concept.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace raidlink::core::health {

inline constexpr std::string_view HEALTH_PATH = "/health";

// A health answer is a 2xx response whose body is a JSON object. When the
// object carries a "status" member it must read "healthy".
[[nodiscard]]
inline bool is_healthy_response(unsigned status, std::string_view body) {
    if (status < 200 || status >= 300) {
        return false;
    }
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(body.data(), body.size()).get(root)) {
        RL_DEBUG("[HEALTH] Response body is not JSON");
        return false;
    }
    simdjson::dom::object obj;
    if (root.get(obj)) {
        RL_DEBUG("[HEALTH] Response body is not a JSON object");
        return false;
    }
    simdjson::dom::element status_field;
    if (obj["status"].get(status_field)) {
        return true;    // no status member
    }
    std::string_view value;
    if (status_field.get(value)) {
        RL_DEBUG("[HEALTH] 'status' member is not a string");
        return false;
    }
    return value == "healthy";
}

// "<base>/health" with trailing slashes of the base removed
[[nodiscard]]
inline std::string health_url(std::string_view base_url) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.remove_suffix(1);
    }
    std::string url(base_url);
    url += HEALTH_PATH;
    return url;
}


// HealthCheckConcept over an HTTP getter: GET {base}/health
template<transport::HttpGetConcept Getter>
class HttpCheck {
public:
    explicit HttpCheck(std::chrono::milliseconds timeout = config::HEALTH_CHECK_TIMEOUT) noexcept
        : timeout_(timeout)
    {}

    [[nodiscard]]
    inline bool start(const std::string& base_url) {
        if (in_flight_) {
            return false;
        }
        if (!get_.start(health_url(base_url), timeout_)) {
            return false;
        }
        in_flight_ = true;
        return true;
    }

    [[nodiscard]]
    inline bool poll(bool& healthy) {
        if (!in_flight_ || !get_.done()) {
            return false;
        }
        in_flight_ = false;
        const auto& r = get_.result();
        if (!r.responded()) {
            RL_DEBUG("[HEALTH] Server unreachable (" << transport::to_string(r.error) << ": " << r.detail << ")");
            healthy = false;
        } else {
            healthy = is_healthy_response(r.status, r.body);
            RL_DEBUG("[HEALTH] HTTP " << r.status << " in " << r.latency.count() << "ms -> "
                     << (healthy ? "healthy" : "unhealthy"));
        }
        get_.cancel();
        return true;
    }

    inline void cancel() {
        get_.cancel();
        in_flight_ = false;
    }

#ifdef RL_UNIT_TEST
public:
    Getter& getter() noexcept {
        return get_;
    }
#endif // RL_UNIT_TEST

private:
    std::chrono::milliseconds timeout_;
    Getter get_;
    bool in_flight_ = false;
};

using HttpHealthCheck = HttpCheck<transport::beast::HttpGet>;

static_assert(HealthCheckConcept<HttpHealthCheck>);

} // namespace raidlink::core::health
