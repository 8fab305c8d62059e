// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "network/address.hpp"
#include "network/transport_config.hpp"
#include "network/transport_server.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/thread_context.hpp"
#include "version.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int /*signal*/) {
  // Use write() for async-signal-safety (std::cout is NOT safe)
  const char msg[] = "\nReceived signal, shutting down\n";
  ssize_t written = write(STDOUT_FILENO, msg, sizeof(msg) - 1);
  (void)written;
  g_shutdown_requested = true;
}

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --bind=<host:port>        Address to listen on (default: 127.0.0.1:19200)\n"
      << "                            Port 0 picks an ephemeral port\n"
      << "  --config=<file>           JSON transport configuration\n"
      << "  --election-timeout=<ms>   Request round-trip bound (default: 10000)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --logfile=<path>     Log to a rotating file instead of the console\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, rpc, app, all\n"
      << "                       Can be comma-separated: --debug=network,rpc\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    raftwire::network::Address bind_address("127.0.0.1", 19200);
    std::string config_file;
    std::optional<int64_t> election_timeout_ms;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << raftwire::GetFullVersionString() << std::endl;
        std::cout << raftwire::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--bind=") == 0) {
        auto address = raftwire::network::Address::Parse(arg.substr(7));
        if (!address) {
          std::cerr << "Error: Invalid bind address: " << arg.substr(7) << std::endl;
          std::cerr << "Expected host:port or [ipv6]:port" << std::endl;
          return 1;
        }
        bind_address = *address;
      } else if (arg.find("--config=") == 0) {
        config_file = arg.substr(9);
      } else if (arg.find("--election-timeout=") == 0) {
        election_timeout_ms = raftwire::util::SafeParseInt64(arg.substr(19), 1, 3600000);
        if (!election_timeout_ms) {
          std::cerr << "Error: Invalid election timeout: " << arg.substr(19) << std::endl;
          std::cerr << "Timeout must be a number of milliseconds between 1 and 3600000" << std::endl;
          return 1;
        }
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        for (const auto &component : raftwire::util::SplitComponents(arg.substr(8), ',')) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (log_file.empty()) {
      raftwire::util::LogManager::Initialize(log_level);
    } else {
      raftwire::util::LogManager::Initialize(log_level, true, log_file);
    }

    for (const auto &component : debug_components) {
      if (component == "all") {
        raftwire::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        raftwire::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        raftwire::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    raftwire::network::TransportConfig config;
    if (!config_file.empty()) {
      auto loaded = raftwire::network::LoadTransportConfig(config_file);
      if (!loaded) {
        LOG_APP_ERROR("Failed to load configuration from {}", config_file);
        raftwire::util::LogManager::Shutdown();
        return 1;
      }
      config = *loaded;
    }
    if (election_timeout_ms) {
      config.election_timeout = std::chrono::milliseconds(*election_timeout_ms);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = 0;
    // IMPORTANT: nested scope so the server and its context are gone before
    // LogManager::Shutdown(); async callbacks must not log into a dead logger
    {
      raftwire::util::SingleThreadContext context("raftwire-main");
      raftwire::network::RpcTransportServer server(
          config, raftwire::rpc::ServerIdentity{raftwire::GetDefaultPrincipal()});

      auto listening = server.listen(context, bind_address, [](raftwire::network::ConnectionPtr connection) {
        LOG_APP_INFO("Accepted connection {} from {}", connection->id(),
                     connection->remote_address());
        connection->set_request_handler([](const raftwire::network::Bytes &request) {
          return raftwire::util::MakeReadyFuture(request);
        });
      });

      try {
        listening.get();
      } catch (const std::exception &e) {
        LOG_APP_ERROR("Failed to listen on {}: {}", bind_address.to_string(), e.what());
        exit_code = 1;
      }

      if (exit_code == 0) {
        LOG_APP_INFO("{} listening on {} (port {}, election timeout {} ms)",
                     raftwire::GetFullVersionString(), bind_address.to_string(),
                     server.listening_port(), config.election_timeout.count());

        while (!g_shutdown_requested) {
          std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_APP_INFO("Shutting down");
        try {
          server.close().get();
        } catch (const std::exception &e) {
          LOG_APP_ERROR("Error during shutdown: {}", e.what());
          exit_code = 1;
        }
      }

      context.close();
    }

    raftwire::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    raftwire::util::LogManager::Shutdown();
    return 1;
  }
}
