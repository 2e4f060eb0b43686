#pragma once

#include <cstdio>

#include "analysis/statistics.hpp"
#include "archive/result_archive.hpp"
#include "model/measurement.hpp"

namespace ammeter_bench::sinks {

class ConsoleReport {
 public:
  explicit ConsoleReport(std::FILE* out = stdout, bool verbose_samples = false) noexcept
      : out_(out), verbose_samples_(verbose_samples) {}

  void publish_sample(const model::TestRun& run, const model::Sample& sample) const;
  void publish_run(const model::TestRun& run) const;
  void publish_ranking(const analysis::AccuracyReport& report) const;
  void publish_comparison(const archive::RunComparison& comparison) const;

 private:
  std::FILE* out_;
  bool verbose_samples_;
};

}  // namespace ammeter_bench::sinks
