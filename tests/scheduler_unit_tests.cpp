#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "archive/memory_archive.hpp"
#include "archive/result_archive.hpp"
#include "core/bench.hpp"
#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/run_id.hpp"
#include "core/scheduler.hpp"
#include "devices/ammeter.hpp"
#include "emulator/device_server.hpp"
#include "model/measurement.hpp"
#include "net/socket.hpp"

using ammeter_bench::archive::MemoryArchive;
using ammeter_bench::client::ClientOptions;
using ammeter_bench::core::Bench;
using ammeter_bench::core::BenchConfig;
using ammeter_bench::core::CancellationToken;
using ammeter_bench::core::ConfigError;
using ammeter_bench::core::default_bench_config;
using ammeter_bench::core::exit_code;
using ammeter_bench::core::exit_code_for;
using ammeter_bench::core::generate_run_id;
using ammeter_bench::core::is_valid_run_id;
using ammeter_bench::core::NotFoundError;
using ammeter_bench::core::run_until_shutdown;
using ammeter_bench::core::SamplingScheduler;
using ammeter_bench::devices::make_ammeter;
using ammeter_bench::emulator::DeviceServer;
using ammeter_bench::emulator::DeviceServerOptions;
using ammeter_bench::model::default_endpoint;
using ammeter_bench::model::DeviceEndpoint;
using ammeter_bench::model::device_kind;
using ammeter_bench::model::run_status;
using ammeter_bench::model::Sample;
using ammeter_bench::model::sample_error;
using ammeter_bench::model::SamplingConfig;
using ammeter_bench::model::TestRun;
using ammeter_bench::net::Socket;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::unique_ptr<DeviceServer> start_server(const device_kind kind) {
  DeviceServerOptions options{};
  options.seed = 2024;
  options.poll_interval = std::chrono::milliseconds(20);
  auto server = std::make_unique<DeviceServer>(make_ammeter(kind), options);
  server->start();
  return server;
}

DeviceEndpoint local_endpoint(const device_kind kind, const std::uint16_t port) {
  DeviceEndpoint endpoint = default_endpoint(kind);
  endpoint.port = port;
  return endpoint;
}

ClientOptions fast_client_options() {
  ClientOptions options{};
  options.timeout = std::chrono::milliseconds(300);
  options.max_retries = 1;
  options.backoff = std::chrono::milliseconds(5);
  options.backoff_max = std::chrono::milliseconds(10);
  return options;
}

SamplingConfig fast_config(const std::uint64_t num_samples, const std::uint32_t max_failures = 3) {
  SamplingConfig config{};
  config.num_samples = num_samples;
  config.frequency_hz = 20.0;
  config.max_consecutive_failures = max_failures;
  return config;
}

std::uint16_t closed_port() {
  Socket scratch(::socket(AF_INET, SOCK_STREAM, 0));
  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t length = sizeof(address);
  if (::bind(scratch.fd(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0 ||
      ::getsockname(scratch.fd(), reinterpret_cast<sockaddr*>(&address), &length) != 0) {
    return 1;
  }
  return ntohs(address.sin_port);
}

int test_completed_run_collects_every_sample() {
  auto server = start_server(device_kind::GREENLEE);
  SamplingScheduler scheduler(fast_client_options());

  std::size_t observed = 0;
  scheduler.set_sample_observer([&observed](const TestRun&, const Sample&) { ++observed; });

  const TestRun run = scheduler.run(local_endpoint(device_kind::GREENLEE, server->port()), fast_config(5));

  if (run.status != run_status::COMPLETED) {
    return fail("test_completed_run_collects_every_sample", "expected a completed run");
  }
  if (run.samples.size() != 5 || !run.stats.has_value() || run.stats->count != 5 || observed != 5) {
    return fail("test_completed_run_collects_every_sample", "expected five valid samples");
  }
  if (!is_valid_run_id(run.run_id)) {
    return fail("test_completed_run_collects_every_sample", "run id should be a uuid");
  }
  for (std::size_t i = 0; i < run.samples.size(); ++i) {
    if (run.samples[i].index != i) {
      return fail("test_completed_run_collects_every_sample", "sample indices should be sequential");
    }
    if (i > 0 && run.samples[i].timestamp_ns < run.samples[i - 1].timestamp_ns) {
      return fail("test_completed_run_collects_every_sample", "timestamps must not decrease");
    }
    if (run.samples[i].timestamp_ns < run.created_at_ns) {
      return fail("test_completed_run_collects_every_sample", "samples cannot predate the run");
    }
  }
  // Deadline at index k is start + k / frequency.
  if (run.elapsed_ns < 200'000'000ULL) {
    return fail("test_completed_run_collects_every_sample", "sampling should follow the configured rate");
  }

  server->stop();
  return 0;
}

int test_five_samples_at_one_hertz() {
  auto server = start_server(device_kind::GREENLEE);
  SamplingScheduler scheduler(fast_client_options());

  SamplingConfig config{};
  config.num_samples = 5;
  config.duration_seconds = 5.0;
  config.frequency_hz = 1.0;
  const TestRun run = scheduler.run(local_endpoint(device_kind::GREENLEE, server->port()), config);

  if (run.status != run_status::COMPLETED || !run.stats.has_value() || run.stats->count != 5) {
    return fail("test_five_samples_at_one_hertz", "expected a completed run with five valid samples");
  }
  if (run.samples.back().timestamp_ns - run.samples.front().timestamp_ns < 3'900'000'000ULL) {
    return fail("test_five_samples_at_one_hertz", "samples should be one second apart");
  }

  server->stop();
  return 0;
}

int test_duration_limits_collection() {
  auto server = start_server(device_kind::ENTES);
  SamplingScheduler scheduler(fast_client_options());

  SamplingConfig config = fast_config(100);
  config.duration_seconds = 0.2;
  const TestRun run = scheduler.run(local_endpoint(device_kind::ENTES, server->port()), config);

  if (run.status != run_status::COMPLETED || run.samples.empty() || run.samples.size() > 5) {
    return fail("test_duration_limits_collection", "duration should stop collection early");
  }

  server->stop();
  return 0;
}

int test_wrong_command_aborts_run() {
  auto server = start_server(device_kind::GREENLEE);
  SamplingScheduler scheduler(fast_client_options());

  DeviceEndpoint endpoint = local_endpoint(device_kind::GREENLEE, server->port());
  endpoint.command = "MEASURE_ENTES -get_data";
  const TestRun run = scheduler.run(endpoint, fast_config(10, 2));

  if (run.status != run_status::ABORTED || run.samples.size() != 2) {
    return fail("test_wrong_command_aborts_run", "run should abort after two consecutive failures");
  }
  if (run.samples.back().error != sample_error::PROTOCOL) {
    return fail("test_wrong_command_aborts_run", "failure should be classified as protocol");
  }
  if (exit_code_for({run}) != exit_code::PROTOCOL_FAILURE) {
    return fail("test_wrong_command_aborts_run", "protocol abort should map to exit code 2");
  }

  server->stop();
  return 0;
}

int test_unreachable_device_degrades_or_aborts() {
  SamplingScheduler scheduler(fast_client_options());
  const DeviceEndpoint endpoint = local_endpoint(device_kind::CIRCUTOR, closed_port());

  const TestRun degraded = scheduler.run(endpoint, fast_config(2, 3));
  if (degraded.status != run_status::DEGRADED || degraded.valid_count() != 0 || degraded.stats->count != 0) {
    return fail("test_unreachable_device_degrades_or_aborts", "run without valid samples should be degraded");
  }

  const TestRun aborted = scheduler.run(endpoint, fast_config(5, 2));
  if (aborted.status != run_status::ABORTED || aborted.samples.size() != 2) {
    return fail("test_unreachable_device_degrades_or_aborts", "threshold should abort the run");
  }
  if (aborted.samples.front().error != sample_error::CONNECTION) {
    return fail("test_unreachable_device_degrades_or_aborts", "failure should be classified as connection");
  }
  if (exit_code_for({degraded, aborted}) != exit_code::CONNECTION_FAILURE) {
    return fail("test_unreachable_device_degrades_or_aborts", "connection abort should map to exit code 1");
  }
  if (exit_code_for({degraded}) != exit_code::SUCCESS) {
    return fail("test_unreachable_device_degrades_or_aborts", "degraded runs should not fail the process");
  }
  return 0;
}

int test_cancellation_interrupts_run() {
  auto server = start_server(device_kind::ENTES);
  SamplingScheduler scheduler(fast_client_options());
  CancellationToken cancellation;

  SamplingConfig config = fast_config(1000);
  config.frequency_hz = 10.0;

  std::thread canceller([&cancellation]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    cancellation.cancel();
  });
  const auto started = std::chrono::steady_clock::now();
  const TestRun run = scheduler.run(local_endpoint(device_kind::ENTES, server->port()), config, &cancellation);
  canceller.join();

  if (run.status != run_status::INTERRUPTED) {
    return fail("test_cancellation_interrupts_run", "cancelled run should be interrupted");
  }
  if (run.samples.empty() || run.samples.size() >= 10) {
    return fail("test_cancellation_interrupts_run", "cancelled run should keep the samples collected so far");
  }
  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(2)) {
    return fail("test_cancellation_interrupts_run", "cancellation should not wait for the next deadline");
  }

  server->stop();
  return 0;
}

int test_invalid_config_rejected_before_contact() {
  auto server = start_server(device_kind::GREENLEE);
  SamplingScheduler scheduler(fast_client_options());

  SamplingConfig config = fast_config(5);
  config.frequency_hz = -1.0;
  try {
    (void)scheduler.run(local_endpoint(device_kind::GREENLEE, server->port()), config);
    return fail("test_invalid_config_rejected_before_contact", "negative frequency should throw");
  } catch (const ConfigError&) {
  }
  try {
    (void)scheduler.run(std::vector<DeviceEndpoint>{}, fast_config(1));
    return fail("test_invalid_config_rejected_before_contact", "empty endpoint list should throw");
  } catch (const ConfigError&) {
  }
  if (server->connections_accepted() != 0) {
    return fail("test_invalid_config_rejected_before_contact", "device must not be contacted");
  }

  server->stop();
  return 0;
}

int test_multi_device_round() {
  auto greenlee = start_server(device_kind::GREENLEE);
  auto entes = start_server(device_kind::ENTES);
  auto circutor = start_server(device_kind::CIRCUTOR);
  SamplingScheduler scheduler(fast_client_options());

  const std::vector<DeviceEndpoint> endpoints{local_endpoint(device_kind::GREENLEE, greenlee->port()),
                                              local_endpoint(device_kind::ENTES, entes->port()),
                                              local_endpoint(device_kind::CIRCUTOR, circutor->port())};
  const auto runs = scheduler.run(endpoints, fast_config(4));

  if (runs.size() != 3) {
    return fail("test_multi_device_round", "expected one run per device");
  }
  std::set<std::string> ids;
  for (std::size_t i = 0; i < runs.size(); ++i) {
    if (runs[i].kind != endpoints[i].kind || runs[i].status != run_status::COMPLETED || runs[i].samples.size() != 4) {
      return fail("test_multi_device_round", "every device should complete");
    }
    if (runs[i].created_at_ns != runs[0].created_at_ns) {
      return fail("test_multi_device_round", "runs of one session share their creation time");
    }
    ids.insert(runs[i].run_id);
  }
  if (ids.size() != 3) {
    return fail("test_multi_device_round", "run ids must be unique");
  }

  greenlee->stop();
  entes->stop();
  circutor->stop();
  return 0;
}

int test_run_ids_are_unique() {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    const std::string id = generate_run_id();
    if (!is_valid_run_id(id)) {
      return fail("test_run_ids_are_unique", "malformed run id");
    }
    ids.insert(id);
  }
  if (ids.size() != 1000) {
    return fail("test_run_ids_are_unique", "duplicate run id");
  }
  if (is_valid_run_id("not-a-uuid") || is_valid_run_id("")) {
    return fail("test_run_ids_are_unique", "garbage should not validate");
  }
  return 0;
}

int test_bench_archives_and_ranks() {
  auto greenlee = start_server(device_kind::GREENLEE);
  auto entes = start_server(device_kind::ENTES);

  BenchConfig config = default_bench_config();
  config.emulator.enabled = false;
  config.client = fast_client_options();
  config.sampling = fast_config(3);
  config.devices[device_kind::GREENLEE].endpoint.port = greenlee->port();
  config.devices[device_kind::ENTES].endpoint.port = entes->port();
  config.devices[device_kind::CIRCUTOR].enabled = false;

  auto archive = std::make_unique<MemoryArchive>();
  const MemoryArchive* archive_view = archive.get();
  Bench bench(config, std::move(archive), ammeter_bench::sinks::ConsoleReport{stdout, false});

  const auto first = bench.run();
  const auto second = bench.run();

  if (first.code != exit_code::SUCCESS || second.code != exit_code::SUCCESS) {
    return fail("test_bench_archives_and_ranks", "healthy session should exit with success");
  }
  if (first.runs.size() != 2 || !first.accuracy.has_value() || first.accuracy->ranking.size() != 2) {
    return fail("test_bench_archives_and_ranks", "both devices should be ranked");
  }
  if (!first.archive_failures.empty()) {
    return fail("test_bench_archives_and_ranks", "archive should accept every finalized run");
  }

  const auto summary = archive_view->summary();
  if (summary.total_runs != 4 || summary.runs_by_kind.at(device_kind::GREENLEE) != 2) {
    return fail("test_bench_archives_and_ranks", "archive should hold every run of both sessions");
  }
  const auto latest = archive_view->latest(device_kind::ENTES);
  if (latest == nullptr || latest->run_id != second.runs[1].run_id) {
    return fail("test_bench_archives_and_ranks", "latest entes run should come from the second session");
  }

  greenlee->stop();
  entes->stop();
  return 0;
}

// Fails every store with an error outside the archive hierarchy.
class FailingArchive final : public ammeter_bench::archive::ResultArchive {
 public:
  void store(const TestRun& /*run*/) override { throw std::runtime_error("storage backend vanished"); }
  ammeter_bench::archive::RunPtr get(const std::string& run_id) const override { throw NotFoundError(run_id); }
  ammeter_bench::archive::RunCursor query(const ammeter_bench::archive::RunQuery& /*query*/) const override {
    return ammeter_bench::archive::RunCursor({}, [](const std::string& run_id) -> ammeter_bench::archive::RunPtr {
      throw NotFoundError(run_id);
    });
  }
  bool remove(const std::string& /*run_id*/) override { return false; }
  std::string describe() const override { return "failing"; }
};

int test_unexpected_failure_maps_to_exit_code() {
  auto greenlee = start_server(device_kind::GREENLEE);

  BenchConfig config = default_bench_config();
  config.emulator.enabled = false;
  config.client = fast_client_options();
  config.sampling = fast_config(2);
  config.devices[device_kind::GREENLEE].endpoint.port = greenlee->port();
  config.devices[device_kind::ENTES].enabled = false;
  config.devices[device_kind::CIRCUTOR].enabled = false;

  Bench bench(config, std::make_unique<FailingArchive>(), ammeter_bench::sinks::ConsoleReport{stdout, false});
  const volatile std::sig_atomic_t shutdown_requested = 0;
  if (run_until_shutdown(bench, shutdown_requested) != exit_code::CONNECTION_FAILURE) {
    return fail("test_unexpected_failure_maps_to_exit_code", "escaping failure should end the session with code 1");
  }

  greenlee->stop();
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_completed_run_collects_every_sample(); rc != 0) return rc;
  if (int rc = test_five_samples_at_one_hertz(); rc != 0) return rc;
  if (int rc = test_duration_limits_collection(); rc != 0) return rc;
  if (int rc = test_wrong_command_aborts_run(); rc != 0) return rc;
  if (int rc = test_unreachable_device_degrades_or_aborts(); rc != 0) return rc;
  if (int rc = test_cancellation_interrupts_run(); rc != 0) return rc;
  if (int rc = test_invalid_config_rejected_before_contact(); rc != 0) return rc;
  if (int rc = test_multi_device_round(); rc != 0) return rc;
  if (int rc = test_run_ids_are_unique(); rc != 0) return rc;
  if (int rc = test_bench_archives_and_ranks(); rc != 0) return rc;
  if (int rc = test_unexpected_failure_maps_to_exit_code(); rc != 0) return rc;

  std::cout << "[PASS] scheduler unit tests\n";
  return 0;
}
