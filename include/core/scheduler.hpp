#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

#include "client/measurement_client.hpp"
#include "core/cancellation.hpp"
#include "model/measurement.hpp"

namespace ammeter_bench::core {

using SampleObserver = std::function<void(const model::TestRun& run, const model::Sample& sample)>;

class SamplingScheduler {
 public:
  explicit SamplingScheduler(client::ClientOptions client_options = {});

  // Throws ConfigError.
  static void validate(const model::SamplingConfig& config);
  static std::chrono::steady_clock::duration sample_interval(const model::SamplingConfig& config);

  void set_sample_observer(SampleObserver observer) { observer_ = std::move(observer); }

  model::TestRun run(const model::DeviceEndpoint& endpoint, const model::SamplingConfig& config,
                     const CancellationToken* cancellation = nullptr);

  // One run per endpoint. Every round polls all still-active endpoints concurrently and joins them before the
  // next deadline.
  std::vector<model::TestRun> run(const std::vector<model::DeviceEndpoint>& endpoints,
                                  const model::SamplingConfig& config,
                                  const CancellationToken* cancellation = nullptr);

 private:
  client::ClientOptions client_options_;
  SampleObserver observer_{};
};

}  // namespace ammeter_bench::core
