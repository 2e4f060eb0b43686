#include "core/scheduler.hpp"

#include <cmath>
#include <cstdio>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "analysis/statistics.hpp"
#include "core/errors.hpp"
#include "core/run_id.hpp"
#include "core/timestamp.hpp"

namespace ammeter_bench::core {
namespace {

struct RunState {
  model::TestRun run;
  std::unique_ptr<client::MeasurementClient> client;
  std::uint32_t consecutive_failures{0};
  bool active{true};
  model::Sample pending{};
};

void finalize(RunState& state, const bool interrupted, const std::uint64_t elapsed_ns) {
  model::TestRun& run = state.run;
  if (run.status == model::run_status::RUNNING) {
    if (interrupted) {
      run.status = model::run_status::INTERRUPTED;
    } else if (run.valid_count() < run.samples.size() || run.samples.empty()) {
      run.status = model::run_status::DEGRADED;
    } else {
      run.status = model::run_status::COMPLETED;
    }
  }
  run.stats = analysis::compute_stats(run);
  run.elapsed_ns = elapsed_ns;

  char elapsed_text[32];
  std::snprintf(elapsed_text, sizeof(elapsed_text), "%.3f", static_cast<double>(elapsed_ns) / 1e9);
  std::cerr << "[scheduler] run " << run.run_id << ' ' << model::to_string(run.kind) << ' '
            << model::to_string(run.status) << ": " << run.stats->count << '/' << run.config.num_samples
            << " valid in " << elapsed_text << "s\n";
}

}  // namespace

SamplingScheduler::SamplingScheduler(client::ClientOptions client_options) : client_options_(client_options) {}

void SamplingScheduler::validate(const model::SamplingConfig& config) {
  if (config.num_samples < 1) {
    throw ConfigError("num_samples must be at least 1");
  }
  if (!std::isfinite(config.duration_seconds) || config.duration_seconds < 0.0) {
    throw ConfigError("duration_seconds must be a finite value >= 0");
  }
  if (!std::isfinite(config.frequency_hz) || config.frequency_hz <= 0.0) {
    throw ConfigError("frequency_hz must be greater than 0");
  }
  if (config.max_consecutive_failures < 1) {
    throw ConfigError("max_consecutive_failures must be at least 1");
  }
}

std::chrono::steady_clock::duration SamplingScheduler::sample_interval(const model::SamplingConfig& config) {
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(1.0 / config.frequency_hz));
}

model::TestRun SamplingScheduler::run(const model::DeviceEndpoint& endpoint, const model::SamplingConfig& config,
                                      const CancellationToken* cancellation) {
  auto runs = run(std::vector<model::DeviceEndpoint>{endpoint}, config, cancellation);
  return std::move(runs.front());
}

std::vector<model::TestRun> SamplingScheduler::run(const std::vector<model::DeviceEndpoint>& endpoints,
                                                   const model::SamplingConfig& config,
                                                   const CancellationToken* cancellation) {
  validate(config);
  if (endpoints.empty()) {
    throw ConfigError("at least one device endpoint is required");
  }

  const std::uint64_t created_at_ns = unix_timestamp_now_ns();
  std::vector<RunState> states;
  states.reserve(endpoints.size());
  for (const auto& endpoint : endpoints) {
    RunState state{};
    state.run.run_id = generate_run_id();
    state.run.kind = endpoint.kind;
    state.run.config = config;
    state.run.created_at_ns = created_at_ns;
    state.run.samples.reserve(config.num_samples);
    state.client = std::make_unique<client::MeasurementClient>(endpoint, client_options_);
    states.push_back(std::move(state));
  }

  const auto interval = sample_interval(config);
  const auto max_duration = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(config.duration_seconds));
  const auto start = std::chrono::steady_clock::now();
  const auto timestamp_now = [&]() {
    return created_at_ns + to_ns(std::chrono::steady_clock::now() - start);
  };

  bool interrupted = false;
  for (std::uint64_t index = 0; index < config.num_samples; ++index) {
    bool any_active = false;
    for (const auto& state : states) {
      any_active = any_active || state.active;
    }
    if (!any_active) {
      break;
    }

    const auto deadline = start + (interval * static_cast<std::int64_t>(index));
    if (config.duration_seconds > 0.0) {
      const auto now = std::chrono::steady_clock::now();
      const auto reference = now > deadline ? now : deadline;
      if (reference - start >= max_duration) {
        break;
      }
    }

    if (cancellation != nullptr) {
      if (cancellation->wait_until(deadline)) {
        interrupted = true;
        break;
      }
    } else {
      std::this_thread::sleep_until(deadline);
    }

    std::vector<RunState*> active;
    for (auto& state : states) {
      if (state.active) {
        active.push_back(&state);
      }
    }

    if (active.size() == 1) {
      active.front()->pending = active.front()->client->sample(index, timestamp_now());
    } else {
      std::vector<std::future<void>> round;
      round.reserve(active.size());
      for (RunState* state : active) {
        round.push_back(std::async(std::launch::async, [state, index, &timestamp_now]() {
          state->pending = state->client->sample(index, timestamp_now());
        }));
      }
      for (auto& task : round) {
        task.get();
      }
    }

    for (RunState* state : active) {
      state->run.samples.push_back(state->pending);
      if (state->pending.valid) {
        state->consecutive_failures = 0;
      } else if (++state->consecutive_failures >= config.max_consecutive_failures) {
        state->run.status = model::run_status::ABORTED;
        state->active = false;
        std::cerr << "[scheduler] run " << state->run.run_id << ' ' << model::to_string(state->run.kind)
                  << " aborted after " << state->consecutive_failures << " consecutive failures\n";
      }

      if (observer_) {
        observer_(state->run, state->pending);
      }
    }
  }

  const std::uint64_t elapsed_ns = to_ns(std::chrono::steady_clock::now() - start);
  std::vector<model::TestRun> runs;
  runs.reserve(states.size());
  for (auto& state : states) {
    finalize(state, interrupted, elapsed_ns);
    runs.push_back(std::move(state.run));
  }
  return runs;
}

}  // namespace ammeter_bench::core
