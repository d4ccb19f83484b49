#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "raidlink/core.hpp"
using namespace raidlink::core;
namespace schema = raidlink::core::protocol::game::schema;

#include "common/cli/options.hpp"
namespace cli = raidlink::examples::cli;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Diagnostics mode
// -----------------------------------------------------------------------------
static int run_diagnostics(const cli::Params& params) {
    DiagnosticsT report{params.url, params.ports};
    report.start();
    while (running.load() && !report.poll()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!report.done()) {
        report.cancel();
    }
    std::cout << "\n" << report.summary() << std::endl;
    return report.error().empty() ? 0 : 1;
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = cli::configure(argc, argv, "raidlink - Socket.IO game client\n"
        "Connects to the treasure-hunt game server and prints live game events.\n"
    );
    params.dump("=== raidlink Parameters ===", std::cout);

    if (params.diagnose) {
        return run_diagnostics(params);
    }

    // -------------------------------------------------------------
    // Session setup
    // -------------------------------------------------------------
    const auto cfg = params.to_client_config();
    cfg.dump(std::cout);
    SessionT session{cfg};

    session.on_signal([&](transport::connection::Signal sig) {
        RL_INFO("[APP] " << transport::connection::to_string(sig) << " -> status: " << session.display_status());
    });

    session.on<schema::ObjectCollected>([](const schema::ObjectCollected& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::ObjectUncollected>([](const schema::ObjectUncollected& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::AllFindsReset>([](const schema::AllFindsReset& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::ObjectCreated>([](const schema::ObjectCreated& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::ObjectDeleted>([](const schema::ObjectDeleted& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::NpcCreated>([](const schema::NpcCreated& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::NpcUpdated>([](const schema::NpcUpdated& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::NpcDeleted>([](const schema::NpcDeleted& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::LocationUpdateIntervalChanged>([](const schema::LocationUpdateIntervalChanged& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::GameModeChanged>([](const schema::GameModeChanged& ev) { std::cout << " -> " << ev << std::endl; });
    session.on<schema::AdminDiagnosticPing>([](const schema::AdminDiagnosticPing& ev) { std::cout << " -> " << ev << " (answered)" << std::endl; });

    HealthPollerT health;

    session.connect();
    if (params.health) {
        health.start();
    }

    // -------------------------------------------------------------------------
    // Main polling loop (runs until Ctrl+C)
    // -------------------------------------------------------------------------
    while (running.load()) {
        session.poll();   // REQUIRED to make progress
        if (params.health) {
            (void)health.poll(session);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    health.stop();
    session.disconnect();

#if defined(RAIDLINK_ENABLE_TELEMETRY_L1)
    session.telemetry().debug_dump(std::cout);
#endif

    std::cout << "=== Done ===\n";
    return 0;
}
