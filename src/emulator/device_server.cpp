#include "emulator/device_server.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ammeter_bench::emulator {
namespace {

constexpr std::size_t kReadChunkBytes = 512;

std::string format_current(const double current_a) {
  std::array<char, 64> text{};
  std::snprintf(text.data(), text.size(), "%.17g", current_a);
  return text.data();
}

}  // namespace

DeviceServer::DeviceServer(std::unique_ptr<devices::Ammeter> ammeter, DeviceServerOptions options)
    : ammeter_(std::move(ammeter)), options_(std::move(options)) {
  if (ammeter_ == nullptr) {
    throw std::invalid_argument("device server requires an ammeter");
  }
  seed_ = options_.seed != 0 ? options_.seed : devices::entropy_seed();
  tag_ = "[emulator:" + std::string(model::to_string(ammeter_->kind())) + "] ";
}

DeviceServer::~DeviceServer() { stop(); }

void DeviceServer::start() {
  if (running_.load()) {
    return;
  }

  net::Socket listener(::socket(AF_INET, SOCK_STREAM, 0));
  if (!listener.valid()) {
    throw std::runtime_error(tag_ + "socket failed: " + net::errno_message(errno));
  }

  const int reuse = 1;
  ::setsockopt(listener.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port = htons(options_.port);
  if (::inet_pton(AF_INET, options_.bind_address.c_str(), &address.sin_addr) != 1) {
    throw std::runtime_error(tag_ + "invalid bind address: " + options_.bind_address);
  }

  if (::bind(listener.fd(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
    throw std::runtime_error(tag_ + "bind " + options_.bind_address + ':' + std::to_string(options_.port) +
                             " failed: " + net::errno_message(errno));
  }
  if (::listen(listener.fd(), options_.backlog) != 0) {
    throw std::runtime_error(tag_ + "listen failed: " + net::errno_message(errno));
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(listener.fd(), reinterpret_cast<sockaddr*>(&bound), &bound_len) != 0) {
    throw std::runtime_error(tag_ + "getsockname failed: " + net::errno_message(errno));
  }
  bound_port_ = ntohs(bound.sin_port);

  listener_ = std::move(listener);
  running_.store(true);
  accept_thread_ = std::thread([this]() { accept_loop(); });

  std::cerr << tag_ << "listening on " << options_.bind_address << ':' << bound_port_ << " seed=" << seed_ << '\n';
}

void DeviceServer::stop() noexcept {
  if (!running_.exchange(false)) {
    return;
  }

  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  reap_workers(true);
  listener_.reset();

  std::cerr << tag_ << "stopped after " << connections_accepted_.load() << " connection(s)\n";
}

std::string DeviceServer::handle_command(const std::string_view line, devices::RandomSource& random) {
  if (line.empty()) {
    ++commands_rejected_;
    return "ERROR empty command";
  }

  if (!ammeter_->accepts(line)) {
    ++commands_rejected_;
    std::cerr << tag_ << "rejected command: " << line << '\n';
    return "ERROR unknown command: " + std::string(line);
  }

  try {
    return format_current(ammeter_->measure(random));
  } catch (const std::exception& ex) {
    std::cerr << tag_ << "measurement failed: " << ex.what() << '\n';
    return "ERROR measurement failed";
  }
}

void DeviceServer::accept_loop() {
  while (running_.load()) {
    reap_workers(false);

    const auto ready = net::wait_readable(listener_.fd(), options_.poll_interval);
    if (ready == net::wait_result::TIMEOUT) {
      continue;
    }
    if (ready == net::wait_result::FAILED) {
      std::cerr << tag_ << "accept poll failed: " << net::errno_message(errno) << '\n';
      break;
    }

    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    net::Socket connection(::accept(listener_.fd(), reinterpret_cast<sockaddr*>(&peer), &peer_len));
    if (!connection.valid()) {
      if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
        std::cerr << tag_ << "accept failed: " << net::errno_message(errno) << '\n';
      }
      continue;
    }

    const std::uint64_t index = connections_accepted_.fetch_add(1);
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread worker([this, connection = std::move(connection), seed = connection_seed(index), done]() mutable {
      serve_connection(std::move(connection), seed);
      done->store(true);
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(ConnectionWorker{std::move(worker), std::move(done)});
  }
}

void DeviceServer::serve_connection(net::Socket connection, const std::uint64_t connection_seed) {
  devices::SeededRandomSource random(connection_seed);
  net::LineBuffer buffer;
  std::array<char, kReadChunkBytes> chunk{};
  // Set after an oversized line was rejected; its remaining bytes are dropped up to the next newline.
  bool discarding = false;

  while (running_.load()) {
    const auto ready = net::wait_readable(connection.fd(), options_.poll_interval);
    if (ready == net::wait_result::TIMEOUT) {
      continue;
    }
    if (ready == net::wait_result::FAILED) {
      return;
    }

    const ssize_t received = ::recv(connection.fd(), chunk.data(), chunk.size(), 0);
    if (received < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }

    if (received == 0) {
      // Peer half-closed: answer an unterminated trailing command before leaving.
      if (!discarding && buffer.pending() > 0) {
        const std::string reply = reply_to_line(buffer.take_pending(), random) + '\n';
        (void)net::send_all(connection.fd(), reply);
      }
      return;
    }

    buffer.append(chunk.data(), static_cast<std::size_t>(received));
    while (auto line = buffer.next_line()) {
      if (discarding) {
        discarding = false;
        continue;
      }
      const std::string reply = reply_to_line(*line, random) + '\n';
      if (!net::send_all(connection.fd(), reply)) {
        return;
      }
    }

    if (buffer.pending() > options_.max_line_bytes) {
      buffer.clear();
      if (!discarding) {
        discarding = true;
        ++commands_rejected_;
        if (!net::send_all(connection.fd(), "ERROR command too long\n")) {
          return;
        }
      }
    }
  }
}

std::string DeviceServer::reply_to_line(const std::string_view line, devices::RandomSource& random) {
  if (line.size() > options_.max_line_bytes) {
    ++commands_rejected_;
    return "ERROR command too long";
  }
  return handle_command(line, random);
}

void DeviceServer::reap_workers(const bool join_all) {
  std::vector<ConnectionWorker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
      if (join_all || it->done->load()) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

std::uint64_t DeviceServer::connection_seed(const std::uint64_t connection_index) const noexcept {
  // splitmix64 step keeps per-connection streams independent yet reproducible from seed_.
  std::uint64_t z = seed_ + ((connection_index + 1) * 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30U)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27U)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31U);
}

}  // namespace ammeter_bench::emulator
