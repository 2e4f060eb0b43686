#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "model/measurement.hpp"

namespace ammeter_bench::archive {

using RunPtr = std::shared_ptr<const model::TestRun>;

struct TimeRange {
  std::uint64_t from_ns{0};
  std::uint64_t to_ns{std::numeric_limits<std::uint64_t>::max()};

  [[nodiscard]] bool contains(std::uint64_t timestamp_ns) const noexcept {
    return timestamp_ns >= from_ns && timestamp_ns <= to_ns;
  }
};

struct RunQuery {
  std::optional<model::device_kind> kind{};
  std::optional<TimeRange> created{};
  std::optional<model::run_status> status{};
};

// What every backend keeps per run to answer queries without loading the record.
struct IndexEntry {
  std::string run_id{};
  model::device_kind kind{model::device_kind::GREENLEE};
  std::uint64_t created_at_ns{0};
  model::run_status status{model::run_status::COMPLETED};
};

// Matching ids, most recent first; equal timestamps fall back to descending run_id.
std::vector<std::string> select_run_ids(std::vector<IndexEntry> entries, const RunQuery& query);

// Pull-based sequence: each run is loaded when next() reaches it. Runs removed after the query are skipped.
class RunCursor {
 public:
  using Loader = std::function<RunPtr(const std::string& run_id)>;

  RunCursor(std::vector<std::string> run_ids, Loader loader);

  // nullptr once exhausted.
  RunPtr next();
  std::vector<RunPtr> collect();
  [[nodiscard]] std::size_t remaining() const noexcept { return run_ids_.size() - position_; }

 private:
  std::vector<std::string> run_ids_;
  Loader loader_;
  std::size_t position_{0};
};

struct MetricDelta {
  double a{0.0};
  double b{0.0};
  // b - a
  double delta{0.0};
};

struct RunComparison {
  std::string run_id_a{};
  std::string run_id_b{};
  model::device_kind kind{model::device_kind::GREENLEE};
  MetricDelta count{};
  MetricDelta mean{};
  MetricDelta median{};
  MetricDelta stdev{};
  MetricDelta min{};
  MetricDelta max{};
};

struct ArchiveSummary {
  std::size_t total_runs{0};
  std::size_t completed_runs{0};
  std::map<model::device_kind, std::size_t> runs_by_kind{};
  std::map<model::run_status, std::size_t> runs_by_status{};
};

class ResultArchive {
 public:
  // Only finalized runs are accepted; a run_id can be stored once. Throws core::ArchiveError.
  virtual void store(const model::TestRun& run) = 0;
  // Throws core::NotFoundError, or core::ArchiveError when the backend fails.
  virtual RunPtr get(const std::string& run_id) const = 0;
  virtual RunCursor query(const RunQuery& query = {}) const = 0;
  virtual bool remove(const std::string& run_id) = 0;
  virtual std::string describe() const = 0;
  virtual ~ResultArchive() = default;

  // Runs must share a device kind and carry statistics; throws std::invalid_argument otherwise.
  RunComparison compare(const std::string& run_id_a, const std::string& run_id_b) const;
  RunPtr latest(std::optional<model::device_kind> kind = std::nullopt) const;
  ArchiveSummary summary() const;

 protected:
  // Shared admission check for store(); throws core::ArchiveError.
  static void check_storable(const model::TestRun& run);
};

}  // namespace ammeter_bench::archive
