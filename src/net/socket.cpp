#include "net/socket.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ammeter_bench::net {

Socket::~Socket() { reset(); }

Socket::Socket(Socket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Socket& Socket::operator=(Socket&& other) noexcept {
  if (this != &other) {
    reset(std::exchange(other.fd_, -1));
  }
  return *this;
}

void Socket::reset(const int fd) noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

wait_result wait_readable(const int fd, const std::chrono::milliseconds timeout) noexcept {
  pollfd descriptor{};
  descriptor.fd = fd;
  descriptor.events = POLLIN;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    const int wait_ms = remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;

    const int rc = ::poll(&descriptor, 1, wait_ms);
    if (rc > 0) {
      return wait_result::READY;
    }
    if (rc == 0) {
      return wait_result::TIMEOUT;
    }
    if (errno != EINTR) {
      return wait_result::FAILED;
    }
  }
}

bool send_all(const int fd, const std::string_view data) noexcept {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t rc = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    sent += static_cast<std::size_t>(rc);
  }
  return true;
}

void LineBuffer::append(const char* data, const std::size_t size) { buffer_.append(data, size); }

std::optional<std::string> LineBuffer::next_line() {
  const auto newline = buffer_.find('\n');
  if (newline == std::string::npos) {
    return std::nullopt;
  }

  std::string line = buffer_.substr(0, newline);
  buffer_.erase(0, newline + 1);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

std::string LineBuffer::take_pending() {
  std::string rest = std::move(buffer_);
  buffer_.clear();
  if (!rest.empty() && rest.back() == '\r') {
    rest.pop_back();
  }
  return rest;
}

std::string errno_message(const int error) { return std::strerror(error); }

}  // namespace ammeter_bench::net
