#include "model/measurement.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace ammeter_bench::model {
namespace {

std::string lowercase(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}  // namespace

std::uint64_t TestRun::valid_count() const noexcept {
  return static_cast<std::uint64_t>(
      std::count_if(samples.begin(), samples.end(), [](const Sample& sample) { return sample.valid; }));
}

std::vector<double> TestRun::valid_values() const {
  std::vector<double> values;
  values.reserve(samples.size());
  for (const auto& sample : samples) {
    if (sample.valid) {
      values.push_back(sample.value);
    }
  }
  return values;
}

std::string_view to_string(const device_kind kind) noexcept {
  switch (kind) {
    case device_kind::GREENLEE:
      return "greenlee";
    case device_kind::ENTES:
      return "entes";
    case device_kind::CIRCUTOR:
      return "circutor";
  }
  return "unknown";
}

std::string_view to_string(const sample_error error) noexcept {
  switch (error) {
    case sample_error::CONNECTION:
      return "connection";
    case sample_error::TIMEOUT:
      return "timeout";
    case sample_error::PROTOCOL:
      return "protocol";
    case sample_error::PARSE:
      return "parse";
  }
  return "unknown";
}

std::string_view to_string(const run_status status) noexcept {
  switch (status) {
    case run_status::RUNNING:
      return "running";
    case run_status::COMPLETED:
      return "completed";
    case run_status::DEGRADED:
      return "degraded";
    case run_status::ABORTED:
      return "aborted";
    case run_status::INTERRUPTED:
      return "interrupted";
  }
  return "unknown";
}

device_kind parse_device_kind(const std::string_view name) {
  const std::string lower = lowercase(name);
  for (const auto kind : all_device_kinds()) {
    if (lower == to_string(kind)) {
      return kind;
    }
  }
  throw std::invalid_argument("unknown device kind: " + std::string(name));
}

sample_error parse_sample_error(const std::string_view name) {
  const std::string lower = lowercase(name);
  for (const auto error : {sample_error::CONNECTION, sample_error::TIMEOUT, sample_error::PROTOCOL,
                           sample_error::PARSE}) {
    if (lower == to_string(error)) {
      return error;
    }
  }
  throw std::invalid_argument("unknown sample error: " + std::string(name));
}

run_status parse_run_status(const std::string_view name) {
  const std::string lower = lowercase(name);
  for (const auto status : {run_status::RUNNING, run_status::COMPLETED, run_status::DEGRADED, run_status::ABORTED,
                            run_status::INTERRUPTED}) {
    if (lower == to_string(status)) {
      return status;
    }
  }
  throw std::invalid_argument("unknown run status: " + std::string(name));
}

const std::vector<device_kind>& all_device_kinds() {
  static const std::vector<device_kind> kKinds = {device_kind::GREENLEE, device_kind::ENTES, device_kind::CIRCUTOR};
  return kKinds;
}

DeviceEndpoint default_endpoint(const device_kind kind) {
  switch (kind) {
    case device_kind::GREENLEE:
      return DeviceEndpoint{kind, "127.0.0.1", 5000, "MEASURE_GREENLEE -get_measurement"};
    case device_kind::ENTES:
      return DeviceEndpoint{kind, "127.0.0.1", 5001, "MEASURE_ENTES -get_data"};
    case device_kind::CIRCUTOR:
      return DeviceEndpoint{kind, "127.0.0.1", 5002, "MEASURE_CIRCUTOR -get_measurement"};
  }
  throw std::invalid_argument("unknown device kind");
}

}  // namespace ammeter_bench::model
