#pragma once

#include <stdexcept>
#include <string>

namespace ammeter_bench::core {

class BenchError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Endpoint unreachable or connection dropped. Transient.
class ConnectionError : public BenchError {
 public:
  using BenchError::BenchError;
};

// No reply within the request window. Transient.
class TimeoutError : public BenchError {
 public:
  using BenchError::BenchError;
};

// Reply does not follow the device grammar (error reply, empty or oversized line).
class ProtocolError : public BenchError {
 public:
  using BenchError::BenchError;
};

// Reply is not a number or is outside the device's plausible range.
class ParseError : public BenchError {
 public:
  using BenchError::BenchError;
};

class ConfigError : public BenchError {
 public:
  using BenchError::BenchError;
};

class ArchiveError : public BenchError {
 public:
  using BenchError::BenchError;
};

class NotFoundError : public BenchError {
 public:
  explicit NotFoundError(const std::string& run_id) : BenchError("run not found: " + run_id), run_id_(run_id) {}

  const std::string& run_id() const noexcept { return run_id_; }

 private:
  std::string run_id_;
};

}  // namespace ammeter_bench::core
