#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "model/measurement.hpp"

namespace ammeter_bench::analysis {

// Descriptive statistics over `values`; all fields are 0 for an empty sequence.
model::StatsSnapshot compute_stats(const std::vector<double>& values);
// Valid samples only.
model::StatsSnapshot compute_stats(const model::TestRun& run);

double mean(const std::vector<double>& values);
double median(std::vector<double> values);
// Bessel-corrected; 0 for fewer than two values.
double sample_stdev(const std::vector<double>& values);

// Linear interpolation between closest ranks, `fraction` in [0, 1].
double percentile(std::vector<double> values, double fraction);

struct DistributionSummary {
  double q1{0.0};
  double q3{0.0};
  double iqr{0.0};
  double lower_fence{0.0};
  double upper_fence{0.0};
  std::size_t outlier_count{0};
};

// Tukey fences at 1.5 IQR.
DistributionSummary summarize_distribution(const std::vector<double>& values);

struct DeviceAccuracy {
  model::device_kind kind{model::device_kind::GREENLEE};
  std::string run_id{};
  double median{0.0};
  double deviation{0.0};
  double stdev{0.0};
  std::size_t rank{0};
};

struct AccuracyReport {
  double reference{0.0};
  std::vector<DeviceAccuracy> ranking{};
  // Runs without a single valid sample cannot be judged.
  std::vector<std::string> skipped_run_ids{};
};

// Reference is the median of the per-run medians. Ranked by ascending |median - reference|, ties broken by
// ascending stdev. Throws std::invalid_argument when no run carries a valid sample.
AccuracyReport rank_devices(const std::vector<model::TestRun>& runs);

}  // namespace ammeter_bench::analysis
