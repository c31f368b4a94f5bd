// latticectl - inspect a lattice the way a lattice host sees it.
//
// Usage:
//   latticectl [--url=HOST:PORT] [--creds=FILE] [--timeout=MILLIS] [--json] list <hosts|actors|bindings|caps>
//   latticectl [options] watch
//
// Defaults come from the same environment variables the hosts use:
// LATTICE_HOST, LATTICE_CREDS_FILE, LATTICE_RPC_TIMEOUT_MILLIS.

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "lattice/lattice.hpp"
#include "render.hpp"

using namespace lattice;

namespace {

std::atomic<bool> interrupted{false};

void handle_signal(int) {
    interrupted.store(true);
}

void print_usage() {
    std::cerr << "Usage: latticectl [--url=HOST:PORT] [--creds=FILE] [--timeout=MILLIS] [--json] "
                 "<list ENTITY_TYPE | watch>\n"
              << "Entity types: hosts, actors, bindings, capabilities (caps)\n";
}

int list_entities(LatticeClient& client, const std::string& entity_type, bool json) {
    auto type = latticectl::parse_entity_type(entity_type);

    AggregatedSnapshot snapshot;
    switch (type) {
        case latticectl::EntityType::Hosts:
            snapshot = client.probe_all();
            break;
        case latticectl::EntityType::Actors:
            snapshot = client.query_workloads(Scope::all());
            break;
        case latticectl::EntityType::Bindings:
            snapshot = client.query_links();
            break;
        case latticectl::EntityType::Capabilities:
            snapshot = client.query_capabilities();
            break;
    }

    if (json) {
        latticectl::render_json(std::cout, snapshot);
        return 0;
    }
    switch (type) {
        case latticectl::EntityType::Hosts:
            latticectl::render_hosts(std::cout, snapshot);
            break;
        case latticectl::EntityType::Actors:
            latticectl::render_actors(std::cout, snapshot);
            break;
        case latticectl::EntityType::Bindings:
            latticectl::render_bindings(std::cout, snapshot);
            break;
        case latticectl::EntityType::Capabilities:
            latticectl::render_capabilities(std::cout, snapshot);
            break;
    }
    if (!snapshot.responded) {
        std::cerr << "No hosts replied within " << client.config().timeout.count() << "ms\n";
    }
    return 0;
}

int watch_events(LatticeClient& client, bool json) {
    if (!json) {
        std::cout << "Watching lattice events, Ctrl+C to abort..." << std::endl;
    }
    auto watcher = client.watch_events([json](const BusEvent& event) {
        latticectl::render_event(std::cout, event, json);
    });

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    while (!interrupted.load() && watcher->running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    watcher->stop();
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = ClientConfig::from_env();
        bool json = false;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.find("--url=") == 0) {
                config.endpoint = ClientConfig::format_endpoint(arg.substr(6));
            } else if (arg.find("--creds=") == 0) {
                config.creds_file = arg.substr(8);
            } else if (arg.find("--timeout=") == 0) {
                config.timeout = ClientConfig::parse_timeout(arg.substr(10), "--timeout");
            } else if (arg == "--json" || arg == "-j") {
                json = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            print_usage();
            return 1;
        }

        auto client = LatticeClient::connect(config);
        if (positional[0] == "list" && positional.size() == 2) {
            return list_entities(*client, positional[1], json);
        }
        if (positional[0] == "watch" && positional.size() == 1) {
            return watch_events(*client, json);
        }
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Latticectl Error: " << e.what() << std::endl;
        return 1;
    }
}
