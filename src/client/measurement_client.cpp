#include "client/measurement_client.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "core/errors.hpp"

namespace ammeter_bench::client {
namespace {

constexpr std::string_view kErrorPrefix = "ERROR";

std::string describe(const model::DeviceEndpoint& endpoint) {
  return std::string(model::to_string(endpoint.kind)) + '@' + endpoint.host + ':' + std::to_string(endpoint.port);
}

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    if (info != nullptr) {
      ::freeaddrinfo(info);
    }
  }
};

bool set_blocking(const int fd, const bool blocking) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int updated = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, updated) == 0;
}

// Non-blocking connect bounded by `timeout`; returns an errno-style code, 0 on success.
int connect_with_timeout(const int fd, const sockaddr* address, const socklen_t length,
                         const std::chrono::milliseconds timeout) {
  if (!set_blocking(fd, false)) {
    return errno;
  }

  if (::connect(fd, address, length) != 0) {
    if (errno != EINPROGRESS) {
      return errno;
    }

    pollfd descriptor{};
    descriptor.fd = fd;
    descriptor.events = POLLOUT;
    int rc = 0;
    do {
      rc = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
      return ETIMEDOUT;
    }
    if (rc < 0) {
      return errno;
    }

    int socket_error = 0;
    socklen_t error_length = sizeof(socket_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &error_length) != 0) {
      return errno;
    }
    if (socket_error != 0) {
      return socket_error;
    }
  }

  return set_blocking(fd, true) ? 0 : errno;
}

bool is_numeric_token(const std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](const char c) {
    return (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E' || c == 'n' ||
           c == 'a' || c == 'i' || c == 'f' || c == 'N' || c == 'I' || c == 'F' || c == 'A';
  });
}

}  // namespace

Connection::Connection(model::DeviceEndpoint endpoint, net::Socket socket)
    : endpoint_(std::move(endpoint)), socket_(std::move(socket)) {}

Connection connect(const model::DeviceEndpoint& endpoint, const std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* raw = nullptr;
  const std::string service = std::to_string(endpoint.port);
  const int lookup = ::getaddrinfo(endpoint.host.c_str(), service.c_str(), &hints, &raw);
  std::unique_ptr<addrinfo, AddrInfoDeleter> results(raw);
  if (lookup != 0) {
    throw core::ConnectionError("resolve " + describe(endpoint) + " failed: " + ::gai_strerror(lookup));
  }

  int last_error = ECONNREFUSED;
  for (const addrinfo* candidate = results.get(); candidate != nullptr; candidate = candidate->ai_next) {
    net::Socket socket(::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol));
    if (!socket.valid()) {
      last_error = errno;
      continue;
    }

    last_error = connect_with_timeout(socket.fd(), candidate->ai_addr, candidate->ai_addrlen, timeout);
    if (last_error == 0) {
      return Connection(endpoint, std::move(socket));
    }
  }

  throw core::ConnectionError("connect " + describe(endpoint) + " failed: " + net::errno_message(last_error));
}

std::string request(Connection& connection, const std::string_view command, const std::chrono::milliseconds timeout,
                    const std::size_t max_reply_bytes) {
  std::string line(command);
  line.push_back('\n');
  if (!net::send_all(connection.fd(), line)) {
    throw core::ConnectionError("send to " + describe(connection.endpoint()) + " failed: " +
                                net::errno_message(errno));
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, 512> chunk{};
  while (true) {
    if (auto reply = connection.buffer().next_line()) {
      if (reply->size() > max_reply_bytes) {
        connection.mark_desynchronised();
        throw core::ProtocolError("oversized reply from " + describe(connection.endpoint()));
      }
      if (reply->empty()) {
        throw core::ProtocolError("empty reply from " + describe(connection.endpoint()));
      }
      if (std::string_view(*reply).substr(0, kErrorPrefix.size()) == kErrorPrefix) {
        throw core::ProtocolError(describe(connection.endpoint()) + " replied: " + *reply);
      }
      return *reply;
    }

    if (connection.buffer().pending() > max_reply_bytes) {
      connection.buffer().clear();
      connection.mark_desynchronised();
      throw core::ProtocolError("oversized reply from " + describe(connection.endpoint()));
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw core::TimeoutError("no reply from " + describe(connection.endpoint()) + " within " +
                               std::to_string(timeout.count()) + "ms");
    }

    const auto ready = net::wait_readable(connection.fd(), remaining);
    if (ready == net::wait_result::TIMEOUT) {
      continue;
    }
    if (ready == net::wait_result::FAILED) {
      throw core::ConnectionError("poll on " + describe(connection.endpoint()) + " failed: " +
                                  net::errno_message(errno));
    }

    const ssize_t received = ::recv(connection.fd(), chunk.data(), chunk.size(), 0);
    if (received < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw core::ConnectionError("recv from " + describe(connection.endpoint()) + " failed: " +
                                  net::errno_message(errno));
    }
    if (received == 0) {
      throw core::ConnectionError(describe(connection.endpoint()) + " closed the connection");
    }
    connection.buffer().append(chunk.data(), static_cast<std::size_t>(received));
  }
}

double parse_sample(const std::string_view raw_response, const model::device_kind kind,
                    const devices::CurrentRange& range) {
  const std::string text(raw_response);
  if (text.empty() || !is_numeric_token(text)) {
    throw core::ParseError(std::string(model::to_string(kind)) + " reply is not numeric: '" + text + "'");
  }

  const char* begin = text.c_str();
  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || errno == ERANGE) {
    throw core::ParseError(std::string(model::to_string(kind)) + " reply is not numeric: '" + text + "'");
  }

  if (!range.contains(parsed)) {
    throw core::ParseError(std::string(model::to_string(kind)) + " reply " + text + " outside plausible range [" +
                           std::to_string(range.min_a) + ", " + std::to_string(range.max_a) + "]");
  }
  return parsed;
}

double parse_sample(const std::string_view raw_response, const model::device_kind kind,
                    const std::size_t circutor_samples) {
  const auto ammeter = devices::make_ammeter(kind, devices::AmmeterOptions{circutor_samples});
  return parse_sample(raw_response, kind, ammeter->plausible_range());
}

MeasurementClient::MeasurementClient(model::DeviceEndpoint endpoint, ClientOptions options)
    : endpoint_(std::move(endpoint)), options_(options) {
  range_ = devices::make_ammeter(endpoint_.kind, devices::AmmeterOptions{options_.circutor_samples})
               ->plausible_range();
  tag_ = "[client:" + describe(endpoint_) + "] ";
}

double MeasurementClient::attempt_once() {
  if (!connection_.has_value()) {
    connection_.emplace(connect(endpoint_, options_.timeout));
  }
  const std::string reply = request(*connection_, endpoint_.command, options_.timeout, options_.max_reply_bytes);
  return parse_sample(reply, endpoint_.kind, range_);
}

double MeasurementClient::measure() {
  auto backoff = options_.backoff;
  last_attempts_ = 0;

  for (std::uint32_t attempt = 0;; ++attempt) {
    ++last_attempts_;
    try {
      const double value = attempt_once();
      log_recovery();
      return value;
    } catch (const core::ProtocolError& ex) {
      if (connection_.has_value() && connection_->desynchronised()) {
        connection_.reset();
      }
      log_failure(ex);
      throw;
    } catch (const core::ParseError& ex) {
      log_failure(ex);
      throw;
    } catch (const core::TimeoutError& ex) {
      // A late reply would desynchronise the stream; start over on a fresh connection.
      connection_.reset();
      log_failure(ex);
      if (attempt >= options_.max_retries) {
        throw;
      }
    } catch (const core::ConnectionError& ex) {
      connection_.reset();
      log_failure(ex);
      if (attempt >= options_.max_retries) {
        throw;
      }
    }

    ++total_retries_;
    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, options_.backoff_max);
  }
}

model::Sample MeasurementClient::sample(const std::uint64_t index, const std::uint64_t timestamp_ns) {
  model::Sample sample{};
  sample.kind = endpoint_.kind;
  sample.index = index;
  sample.timestamp_ns = timestamp_ns;

  try {
    sample.value = measure();
    sample.valid = true;
  } catch (const core::ConnectionError&) {
    sample.error = model::sample_error::CONNECTION;
  } catch (const core::TimeoutError&) {
    sample.error = model::sample_error::TIMEOUT;
  } catch (const core::ProtocolError&) {
    sample.error = model::sample_error::PROTOCOL;
  } catch (const core::ParseError&) {
    sample.error = model::sample_error::PARSE;
  }
  return sample;
}

void MeasurementClient::log_failure(const std::exception& ex) {
  if (was_ok_) {
    std::cerr << tag_ << "request failed: " << ex.what() << '\n';
    was_ok_ = false;
  }
}

void MeasurementClient::log_recovery() {
  if (!was_ok_) {
    std::cerr << tag_ << "request recovered\n";
    was_ok_ = true;
  }
}

}  // namespace ammeter_bench::client
