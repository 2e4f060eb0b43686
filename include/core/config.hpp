#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "client/measurement_client.hpp"
#include "model/measurement.hpp"

namespace ammeter_bench::core {

struct DeviceSettings {
  bool enabled{true};
  model::DeviceEndpoint endpoint{};
};

struct EmulatorSettings {
  bool enabled{true};
  std::string bind_address{"127.0.0.1"};
  std::uint64_t seed{0};
  std::size_t circutor_samples{10};
};

struct ArchiveSettings {
  // Directory path, redis://host[:port] or unix:///path/to/redis.sock
  std::string address{"results"};
  std::string key_prefix{"ammeter:bench"};
  std::string password{};
  int db{0};
};

// Sampling fields as written in the file; any of them may be absent until resolved.
struct SamplingSpec {
  std::optional<std::uint64_t> num_samples{};
  std::optional<double> duration_seconds{};
  std::optional<double> frequency_hz{};
  std::uint32_t max_consecutive_failures{3};
};

struct BenchConfig {
  model::SamplingConfig sampling{10, 10.0, 1.0, 3};
  client::ClientOptions client{};
  std::map<model::device_kind, DeviceSettings> devices{};
  EmulatorSettings emulator{};
  ArchiveSettings archive{};

  [[nodiscard]] std::vector<model::DeviceEndpoint> enabled_endpoints() const;
};

BenchConfig default_bench_config();

// Derives the missing field when exactly two of count/duration/frequency are given and checks consistency when
// all three are. A zero duration counts as absent. Throws ConfigError.
model::SamplingConfig resolve_sampling(const SamplingSpec& spec);

// Throws ConfigError on unreadable files, malformed values or an unresolvable sampling section.
BenchConfig load_bench_config(const std::string& path);

}  // namespace ammeter_bench::core
