#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"
#include "raidlink/core/config/client.hpp"
#include "raidlink/core/transport/parse_url.hpp"


namespace raidlink::examples::cli {

struct Params {
    std::string url                  = raidlink::core::config::DEFAULT_BASE_URL;
    std::string device;
    std::string log_level            = "info";
    std::string liveness             = "passive";
    bool        health               = true;
    bool        diagnose             = false;
    std::vector<std::uint16_t> ports;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL       : " << url << "\n"
           << "  Device    : " << (device.empty() ? "<none>" : device) << "\n"
           << "  Log Level : " << log_level << "\n"
           << "  Liveness  : " << liveness << "\n"
           << "  Health    : " << (health ? "on" : "off") << "\n"
           << "  Mode      : " << (diagnose ? "diagnose" : "connect") << "\n";
        if (!ports.empty()) {
            os << "  Ports     : ";
            for (auto p : ports) {
                os << p << " ";
            }
            os << "\n";
        }
    }

    [[nodiscard]]
    inline raidlink::core::config::Client to_client_config() const {
        raidlink::core::config::Client cfg;
        cfg.base_url    = raidlink::core::transport::normalize_base_url(url);
        cfg.device_uuid = device;
        cfg.liveness    = (liveness == "active") ? raidlink::core::protocol::policy::Liveness::Active
                                                 : raidlink::core::protocol::policy::Liveness::Passive;
        return cfg;
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-u,--url", params.url, "Game server base URL (http://host:port)")->check(base_url_validator)->default_val(params.url);
    app.add_option("-d,--device", params.device, "Device UUID sent with register_device after every handshake")->check(device_uuid_validator);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal | off")->check(log_level_validator)->default_val(params.log_level);
    app.add_option("--liveness", params.liveness, "Liveness policy: passive (server pings only) | active (also send client pings)")->check(liveness_validator)->default_val(params.liveness);
    app.add_flag("--health,!--no-health", params.health, "Run the periodic /health supervisor (default: on)");
    app.add_flag("--diagnose", params.diagnose, "Run the network diagnostics report and exit");
    app.add_option("-p,--ports", params.ports, "Ports to scan in --diagnose mode (default: configured port + common ports)")->check(CLI::Range(1, 65535));

    app.footer(
        "Connects to the game server and prints every application event.\n"
        "Connection state changes are reported as they happen.\n"
        "Ctrl+C disconnects and exits."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace raidlink::examples::cli
