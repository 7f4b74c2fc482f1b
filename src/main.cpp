#include "config.hpp"
#include "commands.hpp"
#include "engine.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: routekeeper [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Load providers and features from a JSON file\n"
              << "  -s, --select FEATURE Print the provider chosen for FEATURE and exit\n"
              << "  --status             Print system status as JSON and exit\n"
              << "  --features           List configured features and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Without an action flag an interactive prompt is started; type /help\n"
              << "for its commands.\n"
              << "\n"
              << "Environment variables:\n"
              << "  ROUTEKEEPER_CONFIG          Config file used when --config is absent\n"
              << "  ROUTEKEEPER_SWEEP_INTERVAL  Recovery sweep interval in seconds\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string select_feature;
    bool show_status = false;
    bool show_features = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--select") == 0) && i + 1 < argc) {
            select_feature = argv[++i];
        } else if (std::strcmp(argv[i], "--status") == 0) {
            show_status = true;
        } else if (std::strcmp(argv[i], "--features") == 0) {
            show_features = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = routekeeper::Config::load(config_path);
    routekeeper::RoutingEngine engine(config);

    // One-shot modes never start the sweeper
    if (!select_feature.empty()) {
        std::cout << engine.select_provider(select_feature) << "\n";
        return 0;
    }
    if (show_status) {
        std::cout << engine.status_json().dump(2) << "\n";
        return 0;
    }
    if (show_features) {
        std::cout << routekeeper::cmd_features(engine);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // The handler captures nothing, so it stays valid however the engine
    // and its sweeper thread are torn down.
    routekeeper::subscribe<routekeeper::ProviderRecoveredEvent>(engine.event_bus(),
        [](const routekeeper::ProviderRecoveredEvent& ev) {
            std::cout << "[event] " << ev.provider_id << " recovered ("
                      << routekeeper::recovery_reason_to_string(ev.reason) << ")\n";
        });

    engine.init();

    std::cout << "routekeeper provider router\n"
              << "Features: " << engine.features().size()
              << " | Providers: " << engine.catalog().size() << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "routekeeper> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        if (line.empty()) continue;
        if (line == "/quit" || line == "/exit") break;

        if (line[0] != '/') {
            std::cout << "Commands start with '/'. Type /help for a list.\n";
            continue;
        }
        std::cout << routekeeper::handle_command(engine, line) << "\n";
    }

    engine.shutdown();
    const auto& bus = engine.event_bus();
    std::cerr << "[routekeeper] Session ended: "
              << bus.published(routekeeper::ProviderUnhealthyEvent::TAG)
              << " provider(s) marked unhealthy, "
              << bus.published(routekeeper::ProviderRecoveredEvent::TAG) << " recovered, "
              << bus.published(routekeeper::FallbackSelectedEvent::TAG) << " fallback(s)\n";
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
