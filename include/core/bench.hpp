#pragma once

#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analysis/statistics.hpp"
#include "archive/result_archive.hpp"
#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "core/scheduler.hpp"
#include "emulator/device_server.hpp"
#include "model/measurement.hpp"
#include "sinks/console_report.hpp"

namespace ammeter_bench::core {

enum class exit_code : int {
  SUCCESS = 0,
  CONNECTION_FAILURE = 1,
  PROTOCOL_FAILURE = 2,
  INVALID_CONFIG = 3,
};

struct BenchOutcome {
  std::vector<model::TestRun> runs{};
  std::optional<analysis::AccuracyReport> accuracy{};
  std::vector<std::string> archive_failures{};
  exit_code code{exit_code::SUCCESS};
};

// Aborted runs map to the failure class that exhausted the consecutive-failure budget.
exit_code exit_code_for(const std::vector<model::TestRun>& runs);

class Bench {
 public:
  Bench(BenchConfig config, std::unique_ptr<archive::ResultArchive> archive,
        sinks::ConsoleReport report = sinks::ConsoleReport{});
  ~Bench();

  Bench(const Bench&) = delete;
  Bench& operator=(const Bench&) = delete;

  // Starts one emulator per enabled device on its configured port. Throws std::runtime_error on bind failure.
  void start_emulators();
  void stop_emulators() noexcept;

  // Samples every enabled device, archives each finalized run and ranks the devices. Throws ConfigError.
  BenchOutcome run(const CancellationToken* cancellation = nullptr);

  [[nodiscard]] const BenchConfig& config() const noexcept { return config_; }
  [[nodiscard]] const archive::ResultArchive& archive() const noexcept { return *archive_; }

 private:
  void archive_run(const model::TestRun& run, BenchOutcome& outcome);
  void compare_with_previous(const model::TestRun& run) const;

  BenchConfig config_;
  std::unique_ptr<archive::ResultArchive> archive_;
  sinks::ConsoleReport report_;
  SamplingScheduler scheduler_;
  std::vector<std::unique_ptr<emulator::DeviceServer>> emulators_{};
};

// Runs the bench while a watcher thread turns a raised `shutdown_requested` flag into cancellation.
// Any failure escaping Bench::run is logged and mapped to an exit code; the watcher is always joined.
exit_code run_until_shutdown(Bench& bench, const volatile std::sig_atomic_t& shutdown_requested);

}  // namespace ammeter_bench::core
