#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ammeter_bench::net {

class Socket {
 public:
  Socket() = default;
  explicit Socket(int fd) noexcept : fd_(fd) {}
  ~Socket();

  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;
  Socket(Socket&& other) noexcept;
  Socket& operator=(Socket&& other) noexcept;

  [[nodiscard]] int fd() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
  void reset(int fd = -1) noexcept;

 private:
  int fd_{-1};
};

enum class wait_result : std::uint8_t {
  READY = 0,
  TIMEOUT = 1,
  FAILED = 2,
};

wait_result wait_readable(int fd, std::chrono::milliseconds timeout) noexcept;

// Writes the whole buffer; false on any send failure or peer reset.
bool send_all(int fd, std::string_view data) noexcept;

// Newline framing shared by the emulator and the client.
class LineBuffer {
 public:
  void append(const char* data, std::size_t size);
  std::optional<std::string> next_line();
  [[nodiscard]] std::size_t pending() const noexcept { return buffer_.size(); }
  std::string take_pending();
  void clear() noexcept { buffer_.clear(); }

 private:
  std::string buffer_{};
};

std::string errno_message(int error);

}  // namespace ammeter_bench::net
