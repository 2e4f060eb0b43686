#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"

namespace ammeter_bench::core {
namespace {

constexpr double kSamplingTolerance = 1e-3;

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::uint64_t parse_unsigned(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed < 0) {
    throw ConfigError(key + " must be greater than or equal to 0");
  }
  return static_cast<std::uint64_t>(parsed);
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  const auto parsed = std::stoi(value);
  if (parsed <= 0 || parsed > 65535) {
    throw ConfigError(key + " must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(parsed);
}

std::chrono::milliseconds parse_positive_ms(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw ConfigError(key + " must be greater than 0");
  }
  return std::chrono::milliseconds(parsed);
}

void apply_device_key(BenchConfig& config, const model::device_kind kind, const std::string& field,
                      const std::string& key, const std::string& value) {
  if (field != "enabled" && field != "host" && field != "port" && field != "command") {
    std::cerr << "[config] ignoring unknown device setting " << key << '\n';
    return;
  }
  DeviceSettings& device = config.devices[kind];

  if (field == "enabled") {
    device.enabled = parse_bool(value);
    return;
  }
  if (field == "host") {
    if (value.empty()) {
      throw ConfigError(key + " must not be empty");
    }
    device.endpoint.host = value;
    return;
  }
  if (field == "port") {
    device.endpoint.port = parse_port(key, value);
    return;
  }
  device.endpoint.command = value;
}

void apply_key_value(BenchConfig& config, SamplingSpec& sampling, const std::string& key, const std::string& raw) {
  const std::string value = unquote(raw);

  if (key == "sampling.num_samples" || key == "sampling.measurements_count") {
    const auto parsed = parse_unsigned(key, value);
    if (parsed == 0) {
      throw ConfigError(key + " must be greater than 0");
    }
    sampling.num_samples = parsed;
    return;
  }

  if (key == "sampling.duration_seconds" || key == "sampling.total_duration_seconds") {
    sampling.duration_seconds = std::stod(value);
    return;
  }

  if (key == "sampling.frequency_hz" || key == "sampling.sampling_frequency_hz") {
    sampling.frequency_hz = std::stod(value);
    return;
  }

  if (key == "sampling.max_consecutive_failures") {
    const auto parsed = parse_unsigned(key, value);
    if (parsed == 0) {
      throw ConfigError(key + " must be at least 1");
    }
    sampling.max_consecutive_failures = static_cast<std::uint32_t>(parsed);
    return;
  }

  if (key == "client.timeout_ms") {
    config.client.timeout = parse_positive_ms(key, value);
    return;
  }

  if (key == "client.max_retries") {
    config.client.max_retries = static_cast<std::uint32_t>(parse_unsigned(key, value));
    return;
  }

  if (key == "client.backoff_ms") {
    config.client.backoff = std::chrono::milliseconds(parse_unsigned(key, value));
    return;
  }

  if (key == "client.backoff_max_ms") {
    config.client.backoff_max = std::chrono::milliseconds(parse_unsigned(key, value));
    return;
  }

  if (key.rfind("devices.", 0) == 0) {
    const std::string rest = key.substr(std::string("devices.").size());
    const auto split = rest.find('.');
    if (split == std::string::npos) {
      throw ConfigError("device settings need a field: " + key);
    }

    model::device_kind kind{};
    try {
      kind = model::parse_device_kind(rest.substr(0, split));
    } catch (const std::invalid_argument&) {
      std::cerr << "[config] ignoring settings for unknown device " << key << '\n';
      return;
    }
    apply_device_key(config, kind, rest.substr(split + 1), key, value);
    return;
  }

  if (key == "emulator.enabled") {
    config.emulator.enabled = parse_bool(value);
    return;
  }

  if (key == "emulator.bind_address") {
    config.emulator.bind_address = value;
    return;
  }

  if (key == "emulator.seed") {
    config.emulator.seed = parse_unsigned(key, value);
    return;
  }

  if (key == "emulator.circutor_samples") {
    const auto parsed = parse_unsigned(key, value);
    if (parsed == 0) {
      throw ConfigError(key + " must be greater than 0");
    }
    config.emulator.circutor_samples = static_cast<std::size_t>(parsed);
    config.client.circutor_samples = static_cast<std::size_t>(parsed);
    return;
  }

  if (key == "archive.address") {
    if (value.empty()) {
      throw ConfigError("archive.address must not be empty");
    }
    config.archive.address = value;
    return;
  }

  if (key == "archive.key_prefix") {
    config.archive.key_prefix = value;
    return;
  }

  if (key == "archive.password") {
    config.archive.password = value;
    return;
  }

  if (key == "archive.db") {
    config.archive.db = static_cast<int>(parse_unsigned(key, value));
    return;
  }

  std::cerr << "[config] ignoring unknown key " << key << '\n';
}

}  // namespace

std::vector<model::DeviceEndpoint> BenchConfig::enabled_endpoints() const {
  std::vector<model::DeviceEndpoint> endpoints;
  for (const auto& [kind, device] : devices) {
    if (device.enabled) {
      endpoints.push_back(device.endpoint);
    }
  }
  return endpoints;
}

BenchConfig default_bench_config() {
  BenchConfig config{};
  for (const auto kind : model::all_device_kinds()) {
    config.devices[kind] = DeviceSettings{true, model::default_endpoint(kind)};
  }
  return config;
}

model::SamplingConfig resolve_sampling(const SamplingSpec& spec) {
  std::optional<double> duration = spec.duration_seconds;
  if (duration.has_value() && (!std::isfinite(*duration) || *duration < 0.0)) {
    throw ConfigError("duration_seconds must be a finite value >= 0");
  }
  if (duration.has_value() && *duration == 0.0) {
    duration.reset();
  }
  if (spec.frequency_hz.has_value() && (!std::isfinite(*spec.frequency_hz) || *spec.frequency_hz <= 0.0)) {
    throw ConfigError("frequency_hz must be greater than 0");
  }
  if (spec.num_samples.has_value() && *spec.num_samples == 0) {
    throw ConfigError("num_samples must be greater than 0");
  }
  if (spec.max_consecutive_failures == 0) {
    throw ConfigError("max_consecutive_failures must be at least 1");
  }

  const int provided = static_cast<int>(spec.num_samples.has_value()) + static_cast<int>(duration.has_value()) +
                       static_cast<int>(spec.frequency_hz.has_value());
  if (provided < 2) {
    throw ConfigError("sampling must provide at least two of num_samples, duration_seconds, frequency_hz");
  }

  model::SamplingConfig resolved{};
  resolved.max_consecutive_failures = spec.max_consecutive_failures;

  if (!spec.num_samples.has_value()) {
    const double expected = *duration * *spec.frequency_hz;
    const double rounded = std::round(expected);
    if (std::fabs(expected - rounded) > kSamplingTolerance || rounded < 1.0) {
      throw ConfigError("duration_seconds * frequency_hz must yield a whole, positive num_samples");
    }
    resolved.num_samples = static_cast<std::uint64_t>(rounded);
    resolved.duration_seconds = *duration;
    resolved.frequency_hz = *spec.frequency_hz;
    return resolved;
  }

  resolved.num_samples = *spec.num_samples;
  if (!spec.frequency_hz.has_value()) {
    resolved.duration_seconds = *duration;
    resolved.frequency_hz = static_cast<double>(resolved.num_samples) / *duration;
    return resolved;
  }

  resolved.frequency_hz = *spec.frequency_hz;
  if (!duration.has_value()) {
    resolved.duration_seconds = static_cast<double>(resolved.num_samples) / resolved.frequency_hz;
    return resolved;
  }

  const double expected = *duration * resolved.frequency_hz;
  if (std::fabs(expected - static_cast<double>(resolved.num_samples)) > kSamplingTolerance) {
    std::ostringstream message;
    message << "sampling conflict: duration_seconds(" << *duration << ") * frequency_hz(" << resolved.frequency_hz
            << ") = " << expected << ", but num_samples = " << resolved.num_samples;
    throw ConfigError(message.str());
  }
  resolved.duration_seconds = *duration;
  return resolved;
}

BenchConfig load_bench_config(const std::string& path) {
  BenchConfig config = default_bench_config();
  SamplingSpec sampling{};
  bool sampling_seen = false;

  std::ifstream input(path);
  if (!input.is_open()) {
    throw ConfigError("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    const std::string qualified = full_key.str();
    sampling_seen = sampling_seen || qualified.rfind("sampling.", 0) == 0;
    try {
      apply_key_value(config, sampling, qualified, value);
    } catch (const std::logic_error&) {
      // std::stoi and friends report malformed numbers as invalid_argument / out_of_range.
      throw ConfigError(path + ':' + std::to_string(line_number) + ": invalid value for " + qualified + ": " +
                        value);
    }
  }

  if (sampling_seen) {
    const bool only_failures = !sampling.num_samples.has_value() && !sampling.duration_seconds.has_value() &&
                               !sampling.frequency_hz.has_value();
    if (only_failures) {
      config.sampling.max_consecutive_failures = sampling.max_consecutive_failures;
    } else {
      config.sampling = resolve_sampling(sampling);
    }
  }

  if (config.enabled_endpoints().empty()) {
    throw ConfigError("no device is enabled");
  }
  return config;
}

}  // namespace ammeter_bench::core
