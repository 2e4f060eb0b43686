#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "analysis/statistics.hpp"
#include "model/measurement.hpp"

using ammeter_bench::analysis::AccuracyReport;
using ammeter_bench::analysis::compute_stats;
using ammeter_bench::analysis::median;
using ammeter_bench::analysis::percentile;
using ammeter_bench::analysis::rank_devices;
using ammeter_bench::analysis::sample_stdev;
using ammeter_bench::analysis::summarize_distribution;
using ammeter_bench::model::device_kind;
using ammeter_bench::model::Sample;
using ammeter_bench::model::sample_error;
using ammeter_bench::model::TestRun;

namespace {

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

TestRun make_run(const std::string& run_id, const device_kind kind, const std::vector<double>& values,
                 const std::size_t invalid = 0) {
  TestRun run{};
  run.run_id = run_id;
  run.kind = kind;
  std::uint64_t index = 0;
  for (const double value : values) {
    run.samples.push_back(Sample{kind, index++, 1000 + index, value, true, std::nullopt});
  }
  for (std::size_t i = 0; i < invalid; ++i) {
    run.samples.push_back(Sample{kind, index++, 1000 + index, 0.0, false, sample_error::TIMEOUT});
  }
  return run;
}

int test_stats_over_known_values() {
  const auto stats = compute_stats(std::vector<double>{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});

  if (stats.count != 8) {
    return fail("test_stats_over_known_values", "count mismatch");
  }
  if (!almost_equal(stats.mean, 5.0) || !almost_equal(stats.median, 4.5)) {
    return fail("test_stats_over_known_values", "mean or median mismatch");
  }
  if (!almost_equal(stats.stdev, std::sqrt(32.0 / 7.0))) {
    return fail("test_stats_over_known_values", "stdev must be Bessel-corrected");
  }
  if (!almost_equal(stats.min, 2.0) || !almost_equal(stats.max, 9.0)) {
    return fail("test_stats_over_known_values", "min or max mismatch");
  }

  return 0;
}

int test_median_odd_and_even_counts() {
  if (!almost_equal(median({3.0, 1.0, 2.0}), 2.0)) {
    return fail("test_median_odd_and_even_counts", "odd count should pick the middle value");
  }
  if (!almost_equal(median({4.0, 1.0, 3.0, 2.0}), 2.5)) {
    return fail("test_median_odd_and_even_counts", "even count should average the two middle values");
  }
  if (!almost_equal(median({}), 0.0)) {
    return fail("test_median_odd_and_even_counts", "empty median should be 0");
  }
  return 0;
}

int test_stdev_single_value_and_translation() {
  if (!almost_equal(sample_stdev({42.0}), 0.0)) {
    return fail("test_stdev_single_value_and_translation", "single value stdev should be 0");
  }

  const std::vector<double> base{0.5, 0.7, 0.2, 0.9, 0.4};
  std::vector<double> shifted;
  for (const double value : base) {
    shifted.push_back(value + 1000.0);
  }
  if (!almost_equal(sample_stdev(base), sample_stdev(shifted), 1e-9)) {
    return fail("test_stdev_single_value_and_translation", "stdev must not change under translation");
  }

  const auto empty = compute_stats(std::vector<double>{});
  if (empty.count != 0 || empty.mean != 0.0 || empty.stdev != 0.0) {
    return fail("test_stdev_single_value_and_translation", "empty stats should be all zero");
  }
  return 0;
}

int test_stats_ignore_invalid_samples() {
  const TestRun run = make_run("a", device_kind::ENTES, {10.0, 20.0, 30.0}, 2);
  const auto stats = compute_stats(run);

  if (stats.count != 3 || !almost_equal(stats.mean, 20.0)) {
    return fail("test_stats_ignore_invalid_samples", "invalid samples leaked into statistics");
  }
  if (run.valid_count() != 3) {
    return fail("test_stats_ignore_invalid_samples", "valid_count mismatch");
  }
  return 0;
}

int test_percentile_and_outliers() {
  const std::vector<double> values{1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 100.0};

  if (!almost_equal(percentile(values, 0.0), 1.0) || !almost_equal(percentile(values, 1.0), 100.0)) {
    return fail("test_percentile_and_outliers", "percentile bounds mismatch");
  }
  if (!almost_equal(percentile({1.0, 2.0, 3.0, 4.0}, 0.5), 2.5)) {
    return fail("test_percentile_and_outliers", "percentile should interpolate");
  }

  const auto summary = summarize_distribution(values);
  if (!almost_equal(summary.q1, 3.0) || !almost_equal(summary.q3, 7.0) || !almost_equal(summary.iqr, 4.0)) {
    return fail("test_percentile_and_outliers", "quartiles mismatch");
  }
  if (summary.outlier_count != 1) {
    return fail("test_percentile_and_outliers", "expected exactly one outlier");
  }

  try {
    (void)percentile(values, 1.5);
    return fail("test_percentile_and_outliers", "fraction above 1 should throw");
  } catch (const std::invalid_argument&) {
  }
  return 0;
}

int test_ranking_orders_by_deviation() {
  std::vector<TestRun> runs;
  runs.push_back(make_run("greenlee", device_kind::GREENLEE, {1.0, 1.2, 1.1}));
  runs.push_back(make_run("entes", device_kind::ENTES, {5.0, 5.0, 5.0}));
  runs.push_back(make_run("circutor", device_kind::CIRCUTOR, {1.5, 1.5, 1.5}));

  const AccuracyReport report = rank_devices(runs);
  if (!almost_equal(report.reference, 1.5)) {
    return fail("test_ranking_orders_by_deviation", "reference should be the median of medians");
  }
  if (report.ranking.size() != 3 || report.ranking[0].run_id != "circutor" ||
      report.ranking[1].run_id != "greenlee" || report.ranking[2].run_id != "entes") {
    return fail("test_ranking_orders_by_deviation", "ranking order mismatch");
  }
  if (report.ranking[0].rank != 1 || report.ranking[2].rank != 3) {
    return fail("test_ranking_orders_by_deviation", "ranks should start at 1");
  }
  if (!almost_equal(report.ranking[2].deviation, 3.5)) {
    return fail("test_ranking_orders_by_deviation", "deviation mismatch");
  }
  return 0;
}

int test_ranking_ties_and_skipped_runs() {
  std::vector<TestRun> runs;
  runs.push_back(make_run("noisy", device_kind::GREENLEE, {0.0, 2.0}));
  runs.push_back(make_run("steady", device_kind::ENTES, {1.0, 1.0}));
  runs.push_back(make_run("empty", device_kind::CIRCUTOR, {}, 3));

  const AccuracyReport report = rank_devices(runs);
  if (report.skipped_run_ids.size() != 1 || report.skipped_run_ids[0] != "empty") {
    return fail("test_ranking_ties_and_skipped_runs", "run without valid samples should be skipped");
  }
  if (report.ranking.size() != 2 || report.ranking[0].run_id != "steady") {
    return fail("test_ranking_ties_and_skipped_runs", "equal deviation should fall back to lower stdev");
  }

  try {
    (void)rank_devices({make_run("empty", device_kind::ENTES, {}, 2)});
    return fail("test_ranking_ties_and_skipped_runs", "ranking without valid samples should throw");
  } catch (const std::invalid_argument&) {
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_stats_over_known_values(); rc != 0) return rc;
  if (int rc = test_median_odd_and_even_counts(); rc != 0) return rc;
  if (int rc = test_stdev_single_value_and_translation(); rc != 0) return rc;
  if (int rc = test_stats_ignore_invalid_samples(); rc != 0) return rc;
  if (int rc = test_percentile_and_outliers(); rc != 0) return rc;
  if (int rc = test_ranking_orders_by_deviation(); rc != 0) return rc;
  if (int rc = test_ranking_ties_and_skipped_runs(); rc != 0) return rc;

  std::cout << "[PASS] statistics unit tests\n";
  return 0;
}
