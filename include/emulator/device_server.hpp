#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "devices/ammeter.hpp"
#include "devices/random_source.hpp"
#include "net/socket.hpp"

namespace ammeter_bench::emulator {

struct DeviceServerOptions {
  std::string bind_address{"127.0.0.1"};
  std::uint16_t port{0};
  // 0 draws a seed from std::random_device.
  std::uint64_t seed{0};
  std::chrono::milliseconds poll_interval{100};
  std::size_t max_line_bytes{1024};
  int backlog{16};
};

class DeviceServer {
 public:
  DeviceServer(std::unique_ptr<devices::Ammeter> ammeter, DeviceServerOptions options = {});
  ~DeviceServer();

  DeviceServer(const DeviceServer&) = delete;
  DeviceServer& operator=(const DeviceServer&) = delete;
  DeviceServer(DeviceServer&&) = delete;
  DeviceServer& operator=(DeviceServer&&) = delete;

  // Binds and starts the accept loop. Throws std::runtime_error if the port cannot be bound.
  void start();
  void stop() noexcept;

  [[nodiscard]] bool running() const noexcept { return running_.load(); }
  [[nodiscard]] std::uint16_t port() const noexcept { return bound_port_; }
  [[nodiscard]] model::device_kind kind() const noexcept { return ammeter_->kind(); }
  [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }
  [[nodiscard]] std::uint64_t connections_accepted() const noexcept { return connections_accepted_.load(); }
  [[nodiscard]] std::uint64_t commands_rejected() const noexcept { return commands_rejected_.load(); }

  // One request line in, one reply line out (without the trailing newline).
  std::string handle_command(std::string_view line, devices::RandomSource& random);

 private:
  struct ConnectionWorker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void accept_loop();
  void serve_connection(net::Socket connection, std::uint64_t connection_seed);
  std::string reply_to_line(std::string_view line, devices::RandomSource& random);
  void reap_workers(bool join_all);
  std::uint64_t connection_seed(std::uint64_t connection_index) const noexcept;

  std::unique_ptr<devices::Ammeter> ammeter_;
  DeviceServerOptions options_;
  std::uint64_t seed_{0};
  std::string tag_{};

  net::Socket listener_{};
  std::uint16_t bound_port_{0};
  std::atomic<bool> running_{false};
  std::thread accept_thread_{};

  std::mutex workers_mutex_{};
  std::vector<ConnectionWorker> workers_{};

  std::atomic<std::uint64_t> connections_accepted_{0};
  std::atomic<std::uint64_t> commands_rejected_{0};
};

}  // namespace ammeter_bench::emulator
