#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "devices/ammeter.hpp"
#include "model/measurement.hpp"
#include "net/socket.hpp"

namespace ammeter_bench::client {

struct ClientOptions {
  std::chrono::milliseconds timeout{2000};
  std::uint32_t max_retries{3};
  std::chrono::milliseconds backoff{50};
  std::chrono::milliseconds backoff_max{1000};
  std::size_t circutor_samples{10};
  std::size_t max_reply_bytes{1024};
};

class Connection {
 public:
  Connection(model::DeviceEndpoint endpoint, net::Socket socket);

  [[nodiscard]] const model::DeviceEndpoint& endpoint() const noexcept { return endpoint_; }
  [[nodiscard]] int fd() const noexcept { return socket_.fd(); }
  net::LineBuffer& buffer() noexcept { return buffer_; }

  // Set once the reply framing is lost; the stream can no longer be trusted.
  void mark_desynchronised() noexcept { desynchronised_ = true; }
  [[nodiscard]] bool desynchronised() const noexcept { return desynchronised_; }

 private:
  model::DeviceEndpoint endpoint_;
  net::Socket socket_;
  net::LineBuffer buffer_{};
  bool desynchronised_{false};
};

// Throws core::ConnectionError if the endpoint cannot be resolved, refuses, or does not answer within `timeout`.
Connection connect(const model::DeviceEndpoint& endpoint, std::chrono::milliseconds timeout);

// Sends one command line and returns the reply line.
// Throws core::TimeoutError, core::ConnectionError (peer closed or reset) or core::ProtocolError (error reply,
// empty or oversized line). An oversized reply also marks the connection desynchronised.
std::string request(Connection& connection, std::string_view command, std::chrono::milliseconds timeout,
                    std::size_t max_reply_bytes = 1024);

// Throws core::ParseError on non-numeric text or a value outside `range`.
double parse_sample(std::string_view raw_response, model::device_kind kind, const devices::CurrentRange& range);
double parse_sample(std::string_view raw_response, model::device_kind kind, std::size_t circutor_samples = 10);

class MeasurementClient {
 public:
  explicit MeasurementClient(model::DeviceEndpoint endpoint, ClientOptions options = {});

  // Reuses one connection across calls. Timeouts and connection failures are retried with exponential backoff;
  // protocol and parse failures are thrown immediately.
  double measure();

  // measure() with every failure folded into an invalid sample.
  model::Sample sample(std::uint64_t index, std::uint64_t timestamp_ns);

  void disconnect() noexcept { connection_.reset(); }

  [[nodiscard]] const model::DeviceEndpoint& endpoint() const noexcept { return endpoint_; }
  [[nodiscard]] std::uint32_t last_attempts() const noexcept { return last_attempts_; }
  [[nodiscard]] std::uint64_t total_retries() const noexcept { return total_retries_; }

 private:
  double attempt_once();
  void log_failure(const std::exception& ex);
  void log_recovery();

  model::DeviceEndpoint endpoint_;
  ClientOptions options_;
  devices::CurrentRange range_{};
  std::string tag_{};
  std::optional<Connection> connection_{};
  std::uint32_t last_attempts_{0};
  std::uint64_t total_retries_{0};
  bool was_ok_{true};
};

}  // namespace ammeter_bench::client
