// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// dht_discovery_sim - run the network discovery loop against a simulated
// overlay and print the events it publishes

#include "dht/discovery/config.hpp"
#include "dht/discovery/context.hpp"
#include "dht/discovery/state_machine.hpp"
#include "dht/events.hpp"
#include "dht/memory_peer_registry.hpp"
#include "simulated_overlay.hpp"
#include "util/logging.hpp"
#include "util/shutdown_signal.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <csignal>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <optional>
#include <thread>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace {

std::atomic<bool> g_signal_received{false};

void signal_handler(int /*signal*/) {
  // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
  const char *msg = "\nReceived signal\n";
  (void)!write(STDOUT_FILENO, msg, 17);
  g_signal_received = true;
}

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Simulation:\n"
      << "  --conf=<path>        JSON file with network discovery settings\n"
      << "  --peers=<n>          Simulated overlay size (default: 200)\n"
      << "  --seeds=<n>          Peers known at startup (default: 3)\n"
      << "  --duration=<secs>    Stop after this many seconds (default: 30, 0 = until signal)\n"
      << "  --idle=<secs>        Override idle_period\n"
      << "  --failure-idle=<secs>  Override on_failure_idle_period\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, dht, app, all\n"
      << "                       Can be comma-separated: --debug=dht,network\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    std::string conf_path;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    int num_peers = 200;
    int num_seeds = 3;
    std::chrono::seconds duration{30};
    std::optional<std::chrono::seconds> idle_period;
    std::optional<std::chrono::seconds> failure_idle_period;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << dhtnode::GetFullVersionString("dht_discovery_sim") << std::endl;
        std::cout << dhtnode::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--conf=") == 0) {
        conf_path = arg.substr(7);
      } else if (arg.find("--peers=") == 0) {
        auto peers_opt = dhtnode::util::SafeParseInt(arg.substr(8), 1, 100000);
        if (!peers_opt) {
          std::cerr << "Error: Invalid peer count: " << arg.substr(8) << std::endl;
          std::cerr << "Peer count must be a number between 1 and 100000" << std::endl;
          return 1;
        }
        num_peers = *peers_opt;
      } else if (arg.find("--seeds=") == 0) {
        auto seeds_opt = dhtnode::util::SafeParseInt(arg.substr(8), 0, 100000);
        if (!seeds_opt) {
          std::cerr << "Error: Invalid seed count: " << arg.substr(8) << std::endl;
          return 1;
        }
        num_seeds = *seeds_opt;
      } else if (arg.find("--duration=") == 0) {
        auto duration_opt = dhtnode::util::SafeParseSeconds(arg.substr(11));
        if (!duration_opt) {
          std::cerr << "Error: Invalid duration: " << arg.substr(11) << std::endl;
          return 1;
        }
        duration = *duration_opt;
      } else if (arg.find("--idle=") == 0) {
        idle_period = dhtnode::util::SafeParseSeconds(arg.substr(7));
        if (!idle_period) {
          std::cerr << "Error: Invalid idle period: " << arg.substr(7) << std::endl;
          return 1;
        }
      } else if (arg.find("--failure-idle=") == 0) {
        failure_idle_period = dhtnode::util::SafeParseSeconds(arg.substr(15));
        if (!failure_idle_period) {
          std::cerr << "Error: Invalid failure idle period: " << arg.substr(15) << std::endl;
          return 1;
        }
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        auto components = dhtnode::util::SplitList(arg.substr(8));
        debug_components.insert(debug_components.end(), components.begin(), components.end());
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    dhtnode::dht::NetworkDiscoveryConfig config;
    if (!conf_path.empty()) {
      config = dhtnode::dht::NetworkDiscoveryConfig::LoadFromFile(conf_path);
    }
    if (idle_period) {
      config.idle_period = *idle_period;
    }
    if (failure_idle_period) {
      config.on_failure_idle_period = *failure_idle_period;
    }
    config.Validate();

    dhtnode::util::LogManager::Initialize(log_level, false);

    for (const auto &component : debug_components) {
      if (component == "all") {
        dhtnode::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        dhtnode::util::LogManager::SetComponentLevel("network", "trace");
      } else if (!dhtnode::util::LogManager::SetComponentLevel(component, "trace")) {
        LOG_APP_WARN("Unknown log component: {}", component);
      }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Nested scope: everything holding the io_context or logging from
    // callbacks is destroyed before LogManager::Shutdown()
    {
      boost::asio::io_context io_context;

      auto identity = std::make_shared<dhtnode::dht::NodeIdentity>(
          dhtnode::dht::NodeId::Random(), "127.0.0.1:9590");

      dhtnode::sim::OverlayParams overlay_params;
      overlay_params.num_peers = static_cast<size_t>(num_peers);
      auto overlay = std::make_shared<dhtnode::sim::SimulatedOverlay>(
          io_context, identity->node_id, overlay_params);

      auto registry = std::make_shared<dhtnode::dht::MemoryPeerRegistry>();
      std::vector<dhtnode::dht::PeerRecord> seeds(
          overlay->peers().begin(),
          overlay->peers().begin() +
              std::min(static_cast<size_t>(num_seeds), overlay->peers().size()));
      registry->MergePeers(seeds);

      LOG_APP_INFO("Node {} starting with {} seed peer(s)", identity->node_id.ShortString(),
                   registry->Count());

      dhtnode::dht::DiscoveryContext context(io_context, config, identity, registry, overlay);
      auto publisher = dhtnode::dht::DhtEventPublisher::Create(config.event_channel_capacity);
      auto events = publisher->Subscribe();
      auto shutdown = std::make_shared<dhtnode::util::ShutdownSignal>();

      auto discovery = dhtnode::dht::DhtNetworkDiscovery::Create(context, publisher, shutdown);
      if (!discovery->Start()) {
        std::cout << "Network discovery is disabled; nothing to do" << std::endl;
        dhtnode::util::LogManager::Shutdown();
        return 0;
      }

      std::thread io_thread([&io_context]() { io_context.run(); });

      const auto deadline = std::chrono::steady_clock::now() + duration;
      size_t num_events = 0;
      while (discovery->IsRunning()) {
        if (auto event = events.Receive(std::chrono::milliseconds(100))) {
          ++num_events;
          std::cout << "[event] " << (*event)->ToString() << std::endl;
        }
        if (g_signal_received ||
            (duration.count() > 0 && std::chrono::steady_clock::now() >= deadline)) {
          if (shutdown->Trigger()) {
            LOG_APP_INFO("Shutting down network discovery...");
          }
        }
      }

      io_thread.join();

      while (auto event = events.TryReceive()) {
        ++num_events;
        std::cout << "[event] " << (*event)->ToString() << std::endl;
      }

      std::cout << "Known peers: " << registry->Count() << "/" << overlay->peers().size()
                << ", rounds this cycle: " << discovery->RoundCount()
                << ", events: " << num_events << " (lagged " << events.Lagged() << ")"
                << ", dials: " << overlay->dials() << " (" << overlay->failed_dials()
                << " failed)" << std::endl;
    }

    dhtnode::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    dhtnode::util::LogManager::Shutdown();
    return 1;
  }
}
