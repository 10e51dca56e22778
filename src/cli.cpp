// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "app/cli_options.hpp"
#include "app/report.hpp"
#include "discovery/discovery_session.hpp"
#include "discovery/known_nodes.hpp"
#include "network/interface_factory.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>

using namespace meshprobe;

void PrintUsage(const char *program_name) {
  std::cout
      << "meshprobe - Discover nearby Meshtastic nodes\n\n"
      << "Usage: " << program_name << " [options] <command>\n\n"
      << "Commands:\n"
      << "  discover                     Send a 0-hop traceroute and list nodes that answer\n"
      << "  list-nodes                   Show nodes in the radio's node database\n"
      << "\n"
      << "Options:\n"
      << "  --address=<addr>             Serial device, host[:port] or BLE address\n"
      << "                               (default: first /dev/ttyUSB* or /dev/ttyACM*)\n"
      << "  --interface-type=<type>      auto, serial, tcp or ble (default: auto)\n"
      << "  --interface=<serial|tcp>     Older spelling of --interface-type\n"
      << "  --device=<path-or-host>      Older spelling of --address\n"
      << "  --duration=<seconds>         Discovery listen window (default: "
      << protocol::DEFAULT_DISCOVERY_DURATION_SEC << ")\n"
      << "  --json                       Print results as JSON\n"
      << "  --debug                      Log every packet sent and received\n"
      << "  --log-file=<path>            Also write the log to a file\n"
      << "  --version                    Show version information\n"
      << "  --help                       Show this help message\n"
      << std::endl;
}

namespace {

int RunDiscover(const app::CliOptions &options, const discovery::DiscoverySession::InterfaceFactory &factory) {
  discovery::DiscoverySession session(factory);
  std::mutex out_mutex;

  if (!options.json) {
    app::PrintDiscoveryBanner(std::cout, options.duration_seconds);
    session.SetListeningCallback([&](uint32_t probe_id, std::chrono::seconds duration) {
      std::lock_guard<std::mutex> lock(out_mutex);
      app::PrintListening(std::cout, probe_id, duration);
    });
    session.SetRecordObserver([&](const discovery::DiscoveryRecord &record) {
      std::lock_guard<std::mutex> lock(out_mutex);
      app::PrintDiscoveredNode(std::cout, record);
    });
  }

  // Ctrl-C ends the listening window early; results so far are still printed
  asio::io_context signal_io;
  asio::signal_set signals(signal_io, SIGINT, SIGTERM);
  signals.async_wait([&session](const asio::error_code &ec, int signal_number) {
    if (ec) {
      return;
    }
    LOG_INFO("Received signal {}, stopping discovery", signal_number);
    session.RequestStop();
  });
  std::thread signal_thread([&signal_io]() { signal_io.run(); });

  auto result = session.Run(std::chrono::seconds(options.duration_seconds));

  asio::error_code ignored;
  signals.cancel(ignored);
  signal_io.stop();
  signal_thread.join();

  std::lock_guard<std::mutex> lock(out_mutex);
  if (options.json) {
    if (result.error) {
      std::cerr << *result.error << std::endl;
    }
    std::cout << app::DiscoveryRecordsToJson(result.records).dump(2) << std::endl;
  } else {
    app::PrintDiscoveryResult(std::cout, std::cerr, result);
  }
  return 0;
}

int RunListNodes(const app::CliOptions &options, const discovery::DiscoverySession::InterfaceFactory &factory) {
  auto result = discovery::FetchKnownNodes(factory);
  if (options.json) {
    if (result.error) {
      std::cerr << *result.error << std::endl;
    }
    std::cout << app::KnownNodesToJson(result.nodes).dump(2) << std::endl;
  } else {
    if (!result.error) {
      std::cout << "Connected to " << result.interface_description << "\n";
    }
    app::PrintKnownNodes(std::cout, std::cerr, result);
  }
  return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);

    app::CliOptions options;
    if (auto error = app::ParseCommandLine(args, options)) {
      std::cerr << "Error: " << *error << "\n";
      PrintUsage(argv[0]);
      return 1;
    }

    if (options.show_help) {
      PrintUsage(argv[0]);
      return 0;
    }
    if (options.show_version) {
      std::cout << GetFullVersionString() << std::endl;
      std::cout << GetCopyrightString() << std::endl;
      return 0;
    }
    if (options.command == app::Command::NONE) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    util::LogManager::Initialize(options.debug ? "debug" : "warn", !options.log_file.empty(), options.log_file);

    // A TCP peer closing mid-write must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    auto factory = [options]() { return network::CreateInterface(options.interface_type, options.address); };

    int rc = 0;
    if (options.command == app::Command::DISCOVER) {
      rc = RunDiscover(options, factory);
    } else {
      rc = RunListNodes(options, factory);
    }

    util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
