#include "sinks/console_report.hpp"

#include <string>

#include "core/timestamp.hpp"

namespace ammeter_bench::sinks {

void ConsoleReport::publish_sample(const model::TestRun& run, const model::Sample& sample) const {
  if (!verbose_samples_) {
    return;
  }
  if (sample.valid) {
    std::fprintf(out_, "[sample] %s #%llu current_a=%.6f\n", std::string(model::to_string(run.kind)).c_str(),
                 static_cast<unsigned long long>(sample.index), sample.value);
  } else {
    std::fprintf(out_, "[sample] %s #%llu invalid error=%s\n", std::string(model::to_string(run.kind)).c_str(),
                 static_cast<unsigned long long>(sample.index),
                 sample.error.has_value() ? std::string(model::to_string(*sample.error)).c_str() : "unknown");
  }
}

void ConsoleReport::publish_run(const model::TestRun& run) const {
  const model::StatsSnapshot stats = run.stats.value_or(model::StatsSnapshot{});
  const auto distribution = analysis::summarize_distribution(run.valid_values());

  std::fprintf(out_, "[run] %s device=%s status=%s created_at=%s elapsed_s=%.3f\n", run.run_id.c_str(),
               std::string(model::to_string(run.kind)).c_str(), std::string(model::to_string(run.status)).c_str(),
               core::format_iso8601(run.created_at_ns).c_str(), static_cast<double>(run.elapsed_ns) / 1e9);
  std::fprintf(out_, "[run]   samples expected=%llu collected=%zu valid=%llu\n",
               static_cast<unsigned long long>(run.config.num_samples), run.samples.size(),
               static_cast<unsigned long long>(stats.count));
  std::fprintf(out_, "[run]   mean=%.6f median=%.6f stdev=%.6f min=%.6f max=%.6f\n", stats.mean, stats.median,
               stats.stdev, stats.min, stats.max);
  std::fprintf(out_, "[run]   q1=%.6f q3=%.6f iqr=%.6f outliers=%zu\n", distribution.q1, distribution.q3,
               distribution.iqr, distribution.outlier_count);
}

void ConsoleReport::publish_ranking(const analysis::AccuracyReport& report) const {
  std::fprintf(out_, "[accuracy] reference_median_a=%.6f\n", report.reference);
  for (const auto& entry : report.ranking) {
    std::fprintf(out_, "[accuracy] #%zu %s median=%.6f deviation=%.6f stdev=%.6f\n", entry.rank,
                 std::string(model::to_string(entry.kind)).c_str(), entry.median, entry.deviation, entry.stdev);
  }
  for (const auto& run_id : report.skipped_run_ids) {
    std::fprintf(out_, "[accuracy] skipped %s (no valid samples)\n", run_id.c_str());
  }
}

void ConsoleReport::publish_comparison(const archive::RunComparison& comparison) const {
  std::fprintf(out_, "[compare] %s %s -> %s\n", std::string(model::to_string(comparison.kind)).c_str(),
               comparison.run_id_a.c_str(), comparison.run_id_b.c_str());
  std::fprintf(out_, "[compare]   d_mean=%+.6f d_median=%+.6f d_stdev=%+.6f d_min=%+.6f d_max=%+.6f\n",
               comparison.mean.delta, comparison.median.delta, comparison.stdev.delta, comparison.min.delta,
               comparison.max.delta);
}

}  // namespace ammeter_bench::sinks
