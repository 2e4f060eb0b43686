#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>

#include "archive/factory.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/scheduler.hpp"

using ammeter_bench::archive::parse_redis_address;
using ammeter_bench::core::ArchiveSettings;
using ammeter_bench::core::BenchConfig;
using ammeter_bench::core::ConfigError;
using ammeter_bench::core::load_bench_config;
using ammeter_bench::core::resolve_sampling;
using ammeter_bench::core::SamplingScheduler;
using ammeter_bench::core::SamplingSpec;
using ammeter_bench::model::device_kind;
using ammeter_bench::model::SamplingConfig;

namespace {

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

class TempConfig {
 public:
  explicit TempConfig(const std::string& content)
      : path_(std::filesystem::temp_directory_path() /
              ("ammeter_bench_config_" + std::to_string(::getpid()) + "_" + std::to_string(counter_++) + ".yaml")) {
    std::ofstream out(path_);
    out << content;
  }
  ~TempConfig() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  std::string path() const { return path_.string(); }

 private:
  static inline int counter_ = 0;
  std::filesystem::path path_;
};

bool throws_config_error(const SamplingSpec& spec) {
  try {
    (void)resolve_sampling(spec);
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

bool load_throws_config_error(const std::string& content) {
  const TempConfig file(content);
  try {
    (void)load_bench_config(file.path());
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

int test_sampling_derives_missing_field() {
  SamplingSpec from_duration{};
  from_duration.duration_seconds = 5.0;
  from_duration.frequency_hz = 2.0;
  const SamplingConfig a = resolve_sampling(from_duration);
  if (a.num_samples != 10 || !almost_equal(a.duration_seconds, 5.0)) {
    return fail("test_sampling_derives_missing_field", "num_samples should be duration * frequency");
  }

  SamplingSpec from_count{};
  from_count.num_samples = 20;
  from_count.duration_seconds = 10.0;
  if (!almost_equal(resolve_sampling(from_count).frequency_hz, 2.0)) {
    return fail("test_sampling_derives_missing_field", "frequency should be num_samples / duration");
  }

  SamplingSpec from_frequency{};
  from_frequency.num_samples = 5;
  from_frequency.frequency_hz = 4.0;
  if (!almost_equal(resolve_sampling(from_frequency).duration_seconds, 1.25)) {
    return fail("test_sampling_derives_missing_field", "duration should be num_samples / frequency");
  }

  SamplingSpec consistent{};
  consistent.num_samples = 10;
  consistent.duration_seconds = 5.0;
  consistent.frequency_hz = 2.0;
  if (resolve_sampling(consistent).num_samples != 10) {
    return fail("test_sampling_derives_missing_field", "consistent triple should be accepted");
  }

  return 0;
}

int test_sampling_rejects_conflicts_and_gaps() {
  SamplingSpec conflict{};
  conflict.num_samples = 10;
  conflict.duration_seconds = 3.0;
  conflict.frequency_hz = 2.0;
  if (!throws_config_error(conflict)) {
    return fail("test_sampling_rejects_conflicts_and_gaps", "inconsistent triple should throw");
  }

  SamplingSpec only_one{};
  only_one.frequency_hz = 1.0;
  if (!throws_config_error(only_one)) {
    return fail("test_sampling_rejects_conflicts_and_gaps", "a single field should throw");
  }

  SamplingSpec zero_duration{};
  zero_duration.duration_seconds = 0.0;
  zero_duration.frequency_hz = 1.0;
  if (!throws_config_error(zero_duration)) {
    return fail("test_sampling_rejects_conflicts_and_gaps", "zero duration counts as absent");
  }

  SamplingSpec fractional{};
  fractional.duration_seconds = 1.0;
  fractional.frequency_hz = 0.3;
  if (!throws_config_error(fractional)) {
    return fail("test_sampling_rejects_conflicts_and_gaps", "non-integral derived count should throw");
  }

  SamplingSpec negative_frequency{};
  negative_frequency.num_samples = 3;
  negative_frequency.frequency_hz = -1.0;
  if (!throws_config_error(negative_frequency)) {
    return fail("test_sampling_rejects_conflicts_and_gaps", "negative frequency should throw");
  }

  return 0;
}

int test_scheduler_validation() {
  SamplingConfig config{};
  config.num_samples = 0;
  try {
    SamplingScheduler::validate(config);
    return fail("test_scheduler_validation", "zero samples should throw");
  } catch (const ConfigError&) {
  }

  config.num_samples = 3;
  config.frequency_hz = 0.0;
  try {
    SamplingScheduler::validate(config);
    return fail("test_scheduler_validation", "zero frequency should throw");
  } catch (const ConfigError&) {
  }

  config.frequency_hz = 4.0;
  if (SamplingScheduler::sample_interval(config) != std::chrono::milliseconds(250)) {
    return fail("test_scheduler_validation", "interval should be 1 / frequency");
  }
  return 0;
}

int test_load_full_config() {
  const TempConfig file(
      "sampling:\n"
      "  duration_seconds: 3\n"
      "  frequency_hz: 2\n"
      "  max_consecutive_failures: 5\n"
      "client:\n"
      "  timeout_ms: 250\n"
      "  max_retries: 1\n"
      "devices:\n"
      "  entes:\n"
      "    enabled: false\n"
      "  circutor:\n"
      "    host: localhost\n"
      "    port: 6002\n"
      "emulator:\n"
      "  seed: 7\n"
      "  circutor_samples: 20\n"
      "archive:\n"
      "  address: \"redis://10.0.0.5:6380\"  # trailing comment\n"
      "  db: 2\n");

  const BenchConfig config = load_bench_config(file.path());

  if (config.sampling.num_samples != 6 || config.sampling.max_consecutive_failures != 5) {
    return fail("test_load_full_config", "sampling section mismatch");
  }
  if (config.client.timeout != std::chrono::milliseconds(250) || config.client.max_retries != 1) {
    return fail("test_load_full_config", "client section mismatch");
  }
  const auto endpoints = config.enabled_endpoints();
  if (endpoints.size() != 2 || endpoints[1].kind != device_kind::CIRCUTOR || endpoints[1].port != 6002 ||
      endpoints[1].host != "localhost") {
    return fail("test_load_full_config", "device section mismatch");
  }
  if (endpoints[0].port != 5000 || endpoints[0].command != "MEASURE_GREENLEE -get_measurement") {
    return fail("test_load_full_config", "untouched devices should keep factory defaults");
  }
  if (config.emulator.seed != 7 || config.client.circutor_samples != 20) {
    return fail("test_load_full_config", "emulator section mismatch");
  }

  const auto redis = parse_redis_address(config.archive);
  if (redis.host != "10.0.0.5" || redis.port != 6380 || redis.db != 2) {
    return fail("test_load_full_config", "redis address mismatch");
  }

  return 0;
}

int test_load_accepts_alias_keys() {
  const TempConfig file(
      "sampling:\n"
      "  measurements_count: 4\n"
      "  sampling_frequency_hz: 2\n");

  const BenchConfig config = load_bench_config(file.path());
  if (config.sampling.num_samples != 4 || !almost_equal(config.sampling.duration_seconds, 2.0)) {
    return fail("test_load_accepts_alias_keys", "alias keys should resolve like the canonical ones");
  }
  return 0;
}

int test_load_ignores_unknown_device_keys() {
  const TempConfig file(
      "devices:\n"
      "  fluke:\n"
      "    port: 5003\n"
      "  greenlee:\n"
      "    range: auto\n"
      "    port: 6100\n");

  BenchConfig config{};
  try {
    config = load_bench_config(file.path());
  } catch (const ConfigError&) {
    return fail("test_load_ignores_unknown_device_keys", "unknown device keys should be skipped");
  }

  const auto endpoints = config.enabled_endpoints();
  if (endpoints.size() != 3 || endpoints[0].kind != device_kind::GREENLEE || endpoints[0].port != 6100) {
    return fail("test_load_ignores_unknown_device_keys", "known settings should still apply");
  }
  return 0;
}

int test_load_rejects_bad_values() {
  if (!load_throws_config_error("devices:\n  greenlee:\n    port: 70000\n")) {
    return fail("test_load_rejects_bad_values", "out of range port should throw");
  }
  if (!load_throws_config_error("client:\n  timeout_ms: fast\n")) {
    return fail("test_load_rejects_bad_values", "non-numeric timeout should throw");
  }
  if (!load_throws_config_error(
          "devices:\n  greenlee:\n    enabled: false\n  entes:\n    enabled: false\n  circutor:\n    enabled: false\n")) {
    return fail("test_load_rejects_bad_values", "config without devices should throw");
  }
  if (!load_throws_config_error("sampling:\n  num_samples: 10\n  duration_seconds: 3\n  frequency_hz: 2\n")) {
    return fail("test_load_rejects_bad_values", "sampling conflict should throw");
  }

  try {
    (void)load_bench_config("/nonexistent/ammeter-bench.yaml");
    return fail("test_load_rejects_bad_values", "missing file should throw");
  } catch (const ConfigError&) {
  }
  return 0;
}

int test_redis_address_parsing() {
  ArchiveSettings settings{};
  settings.address = "unix:///run/redis.sock";
  if (parse_redis_address(settings).unix_socket != "/run/redis.sock") {
    return fail("test_redis_address_parsing", "unix socket path mismatch");
  }

  settings.address = "redis://cache";
  const auto defaults = parse_redis_address(settings);
  if (defaults.host != "cache" || defaults.port != 6379) {
    return fail("test_redis_address_parsing", "default port should be 6379");
  }

  settings.address = "redis://cache:notaport";
  try {
    (void)parse_redis_address(settings);
    return fail("test_redis_address_parsing", "malformed port should throw");
  } catch (const ConfigError&) {
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_sampling_derives_missing_field(); rc != 0) return rc;
  if (int rc = test_sampling_rejects_conflicts_and_gaps(); rc != 0) return rc;
  if (int rc = test_scheduler_validation(); rc != 0) return rc;
  if (int rc = test_load_full_config(); rc != 0) return rc;
  if (int rc = test_load_accepts_alias_keys(); rc != 0) return rc;
  if (int rc = test_load_ignores_unknown_device_keys(); rc != 0) return rc;
  if (int rc = test_load_rejects_bad_values(); rc != 0) return rc;
  if (int rc = test_redis_address_parsing(); rc != 0) return rc;

  std::cout << "[PASS] config unit tests\n";
  return 0;
}
