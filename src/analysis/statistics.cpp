#include "analysis/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace ammeter_bench::analysis {

double mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double median(std::vector<double> values) {
  if (values.empty()) {
    return 0.0;
  }

  std::sort(values.begin(), values.end());
  const std::size_t middle = values.size() / 2;
  if (values.size() % 2 == 1) {
    return values[middle];
  }
  return (values[middle - 1] + values[middle]) / 2.0;
}

double sample_stdev(const std::vector<double>& values) {
  if (values.size() <= 1) {
    return 0.0;
  }

  const double center = mean(values);
  double squared = 0.0;
  for (const double value : values) {
    const double deviation = value - center;
    squared += deviation * deviation;
  }
  return std::sqrt(squared / static_cast<double>(values.size() - 1));
}

model::StatsSnapshot compute_stats(const std::vector<double>& values) {
  model::StatsSnapshot stats{};
  if (values.empty()) {
    return stats;
  }

  const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
  stats.count = values.size();
  stats.mean = mean(values);
  stats.median = median(values);
  stats.stdev = sample_stdev(values);
  stats.min = *min_it;
  stats.max = *max_it;
  return stats;
}

model::StatsSnapshot compute_stats(const model::TestRun& run) { return compute_stats(run.valid_values()); }

double percentile(std::vector<double> values, const double fraction) {
  if (values.empty()) {
    return 0.0;
  }
  if (fraction < 0.0 || fraction > 1.0) {
    throw std::invalid_argument("percentile fraction must be within [0, 1]");
  }

  std::sort(values.begin(), values.end());
  const double position = fraction * static_cast<double>(values.size() - 1);
  const auto lower = static_cast<std::size_t>(std::floor(position));
  const auto upper = static_cast<std::size_t>(std::ceil(position));
  const double weight = position - static_cast<double>(lower);
  return values[lower] + ((values[upper] - values[lower]) * weight);
}

DistributionSummary summarize_distribution(const std::vector<double>& values) {
  DistributionSummary summary{};
  if (values.empty()) {
    return summary;
  }

  summary.q1 = percentile(values, 0.25);
  summary.q3 = percentile(values, 0.75);
  summary.iqr = summary.q3 - summary.q1;
  summary.lower_fence = summary.q1 - (1.5 * summary.iqr);
  summary.upper_fence = summary.q3 + (1.5 * summary.iqr);
  summary.outlier_count = static_cast<std::size_t>(std::count_if(values.begin(), values.end(), [&](const double v) {
    return v < summary.lower_fence || v > summary.upper_fence;
  }));
  return summary;
}

AccuracyReport rank_devices(const std::vector<model::TestRun>& runs) {
  AccuracyReport report{};

  std::vector<double> medians;
  for (const auto& run : runs) {
    const model::StatsSnapshot stats = run.stats.has_value() ? *run.stats : compute_stats(run);
    if (stats.count == 0) {
      report.skipped_run_ids.push_back(run.run_id);
      continue;
    }

    DeviceAccuracy entry{};
    entry.kind = run.kind;
    entry.run_id = run.run_id;
    entry.median = stats.median;
    entry.stdev = stats.stdev;
    report.ranking.push_back(entry);
    medians.push_back(stats.median);
  }

  if (report.ranking.empty()) {
    throw std::invalid_argument("accuracy ranking requires at least one run with valid samples");
  }

  report.reference = median(medians);
  for (auto& entry : report.ranking) {
    entry.deviation = std::fabs(entry.median - report.reference);
  }

  std::stable_sort(report.ranking.begin(), report.ranking.end(),
                   [](const DeviceAccuracy& lhs, const DeviceAccuracy& rhs) {
                     if (lhs.deviation != rhs.deviation) {
                       return lhs.deviation < rhs.deviation;
                     }
                     return lhs.stdev < rhs.stdev;
                   });

  for (std::size_t i = 0; i < report.ranking.size(); ++i) {
    report.ranking[i].rank = i + 1;
  }
  return report;
}

}  // namespace ammeter_bench::analysis
