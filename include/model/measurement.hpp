#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ammeter_bench::model {

enum class device_kind : std::uint8_t {
  GREENLEE = 0,
  ENTES = 1,
  CIRCUTOR = 2,
};

enum class sample_error : std::uint8_t {
  CONNECTION = 0,
  TIMEOUT = 1,
  PROTOCOL = 2,
  PARSE = 3,
};

enum class run_status : std::uint8_t {
  RUNNING = 0,
  COMPLETED = 1,
  DEGRADED = 2,
  ABORTED = 3,
  INTERRUPTED = 4,
};

struct DeviceEndpoint {
  device_kind kind{device_kind::GREENLEE};
  std::string host{"127.0.0.1"};
  std::uint16_t port{0};
  std::string command{};

  bool operator==(const DeviceEndpoint&) const = default;
};

struct Sample {
  device_kind kind{device_kind::GREENLEE};
  std::uint64_t index{0};
  std::uint64_t timestamp_ns{0};
  double value{0.0};
  bool valid{false};
  std::optional<sample_error> error{};

  bool operator==(const Sample&) const = default;
};

// duration_seconds == 0 means the run is bounded by num_samples only.
struct SamplingConfig {
  std::uint64_t num_samples{1};
  double duration_seconds{0.0};
  double frequency_hz{1.0};
  std::uint32_t max_consecutive_failures{3};

  bool operator==(const SamplingConfig&) const = default;
};

struct StatsSnapshot {
  std::uint64_t count{0};
  double mean{0.0};
  double median{0.0};
  double stdev{0.0};
  double min{0.0};
  double max{0.0};

  bool operator==(const StatsSnapshot&) const = default;
};

struct TestRun {
  std::string run_id{};
  device_kind kind{device_kind::GREENLEE};
  SamplingConfig config{};
  std::vector<Sample> samples{};
  run_status status{run_status::RUNNING};
  std::optional<StatsSnapshot> stats{};
  std::uint64_t created_at_ns{0};
  std::uint64_t elapsed_ns{0};

  bool operator==(const TestRun&) const = default;

  [[nodiscard]] std::uint64_t valid_count() const noexcept;
  [[nodiscard]] std::vector<double> valid_values() const;
};

std::string_view to_string(device_kind kind) noexcept;
std::string_view to_string(sample_error error) noexcept;
std::string_view to_string(run_status status) noexcept;

// Parsers are case-insensitive and throw std::invalid_argument on unknown names.
device_kind parse_device_kind(std::string_view name);
sample_error parse_sample_error(std::string_view name);
run_status parse_run_status(std::string_view name);

const std::vector<device_kind>& all_device_kinds();

// Factory defaults for the three emulated ammeters.
DeviceEndpoint default_endpoint(device_kind kind);

}  // namespace ammeter_bench::model
