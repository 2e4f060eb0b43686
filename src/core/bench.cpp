#include "core/bench.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "core/errors.hpp"
#include "devices/ammeter.hpp"

namespace ammeter_bench::core {
namespace {

std::optional<model::sample_error> last_error(const model::TestRun& run) {
  for (auto it = run.samples.rbegin(); it != run.samples.rend(); ++it) {
    if (!it->valid) {
      return it->error;
    }
  }
  return std::nullopt;
}

}  // namespace

exit_code exit_code_for(const std::vector<model::TestRun>& runs) {
  exit_code code = exit_code::SUCCESS;
  for (const auto& run : runs) {
    if (run.status != model::run_status::ABORTED) {
      continue;
    }

    const auto error = last_error(run);
    if (error == model::sample_error::CONNECTION || error == model::sample_error::TIMEOUT) {
      return exit_code::CONNECTION_FAILURE;
    }
    code = exit_code::PROTOCOL_FAILURE;
  }
  return code;
}

Bench::Bench(BenchConfig config, std::unique_ptr<archive::ResultArchive> archive, sinks::ConsoleReport report)
    : config_(std::move(config)), archive_(std::move(archive)), report_(report), scheduler_(config_.client) {
  if (archive_ == nullptr) {
    throw std::invalid_argument("bench requires a result archive");
  }
  scheduler_.set_sample_observer(
      [this](const model::TestRun& run, const model::Sample& sample) { report_.publish_sample(run, sample); });
  std::cerr << "[bench] archive at " << archive_->describe() << '\n';
}

Bench::~Bench() { stop_emulators(); }

void Bench::start_emulators() {
  const devices::AmmeterOptions ammeter_options{config_.emulator.circutor_samples};

  for (const auto& [kind, device] : config_.devices) {
    if (!device.enabled) {
      continue;
    }

    emulator::DeviceServerOptions options{};
    options.bind_address = config_.emulator.bind_address;
    options.port = device.endpoint.port;
    // Distinct but reproducible streams per device when a seed is configured.
    options.seed = config_.emulator.seed == 0 ? 0 : config_.emulator.seed + static_cast<std::uint64_t>(kind);

    auto server = std::make_unique<emulator::DeviceServer>(devices::make_ammeter(kind, ammeter_options), options);
    server->start();
    emulators_.push_back(std::move(server));
  }
}

void Bench::stop_emulators() noexcept {
  for (auto& server : emulators_) {
    server->stop();
  }
  emulators_.clear();
}

BenchOutcome Bench::run(const CancellationToken* cancellation) {
  BenchOutcome outcome{};

  const auto endpoints = config_.enabled_endpoints();
  outcome.runs = scheduler_.run(endpoints, config_.sampling, cancellation);

  for (const auto& run : outcome.runs) {
    report_.publish_run(run);
    archive_run(run, outcome);
  }

  if (outcome.runs.size() < 2) {
    outcome.code = exit_code_for(outcome.runs);
    return outcome;
  }

  try {
    outcome.accuracy = analysis::rank_devices(outcome.runs);
    report_.publish_ranking(*outcome.accuracy);
  } catch (const std::invalid_argument& ex) {
    std::cerr << "[bench] accuracy ranking unavailable: " << ex.what() << '\n';
  }

  outcome.code = exit_code_for(outcome.runs);
  return outcome;
}

void Bench::archive_run(const model::TestRun& run, BenchOutcome& outcome) {
  try {
    archive_->store(run);
    std::cerr << "[archive] stored run " << run.run_id << '\n';
  } catch (const ArchiveError& ex) {
    // The statistics already printed stay valid; only persistence failed.
    std::cerr << "[archive] store failed for " << run.run_id << ": " << ex.what() << '\n';
    outcome.archive_failures.push_back(run.run_id);
    return;
  }

  compare_with_previous(run);
}

void Bench::compare_with_previous(const model::TestRun& run) const {
  archive::RunQuery query{};
  query.kind = run.kind;

  try {
    auto cursor = archive_->query(query);
    while (const auto previous = cursor.next()) {
      if (previous->run_id == run.run_id || previous->created_at_ns > run.created_at_ns) {
        continue;
      }
      if (!previous->stats.has_value() || !run.stats.has_value() || previous->stats->count == 0 ||
          run.stats->count == 0) {
        return;
      }
      report_.publish_comparison(archive_->compare(previous->run_id, run.run_id));
      return;
    }
  } catch (const std::invalid_argument& ex) {
    std::cerr << "[archive] comparison with previous run skipped: " << ex.what() << '\n';
  } catch (const BenchError& ex) {
    std::cerr << "[archive] comparison with previous run failed: " << ex.what() << '\n';
  }
}

exit_code run_until_shutdown(Bench& bench, const volatile std::sig_atomic_t& shutdown_requested) {
  CancellationToken cancellation;
  std::atomic<bool> finished{false};
  std::thread signal_watcher([&cancellation, &finished, &shutdown_requested]() {
    while (!finished.load()) {
      if (shutdown_requested != 0) {
        std::cerr << "[bench] shutdown signal received; finishing current round\n";
        cancellation.cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  exit_code code = exit_code::SUCCESS;
  try {
    code = bench.run(&cancellation).code;
  } catch (const ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    code = exit_code::INVALID_CONFIG;
  } catch (const std::exception& ex) {
    std::cerr << "[bench] run failed: " << ex.what() << '\n';
    code = exit_code::CONNECTION_FAILURE;
  }

  finished.store(true);
  signal_watcher.join();
  return code;
}

}  // namespace ammeter_bench::core
