#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "devices/ammeter.hpp"
#include "emulator/device_server.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

// Serves the enabled devices of a bench config until SIGINT/SIGTERM.
int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  ammeter_bench::core::BenchConfig config{};
  try {
    config = argc > 1 ? ammeter_bench::core::load_bench_config(argv[1])
                      : ammeter_bench::core::default_bench_config();
  } catch (const ammeter_bench::core::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 3;
  }

  const ammeter_bench::devices::AmmeterOptions ammeter_options{config.emulator.circutor_samples};
  std::vector<std::unique_ptr<ammeter_bench::emulator::DeviceServer>> servers;
  try {
    for (const auto& [kind, device] : config.devices) {
      if (!device.enabled) {
        continue;
      }

      ammeter_bench::emulator::DeviceServerOptions options{};
      options.bind_address = config.emulator.bind_address;
      options.port = device.endpoint.port;
      options.seed = config.emulator.seed == 0 ? 0 : config.emulator.seed + static_cast<std::uint64_t>(kind);

      auto server = std::make_unique<ammeter_bench::emulator::DeviceServer>(
          ammeter_bench::devices::make_ammeter(kind, ammeter_options), options);
      server->start();
      servers.push_back(std::move(server));
    }
  } catch (const std::exception& ex) {
    std::cerr << "[emulator] startup failed: " << ex.what() << '\n';
    for (auto& server : servers) {
      server->stop();
    }
    return 1;
  }

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cerr << "[emulator] shutdown signal received; exiting cleanly\n";
  for (auto& server : servers) {
    std::cerr << "[emulator:" << ammeter_bench::model::to_string(server->kind()) << "] served "
              << server->connections_accepted() << " connections, rejected " << server->commands_rejected()
              << " commands\n";
    server->stop();
  }
  return 0;
}
