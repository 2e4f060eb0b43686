#include "archive/result_archive.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace ammeter_bench::archive {
namespace {

MetricDelta delta_of(const double a, const double b) { return MetricDelta{a, b, b - a}; }

}  // namespace

std::vector<std::string> select_run_ids(std::vector<IndexEntry> entries, const RunQuery& query) {
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&query](const IndexEntry& entry) {
                                 if (query.kind.has_value() && entry.kind != *query.kind) {
                                   return true;
                                 }
                                 if (query.status.has_value() && entry.status != *query.status) {
                                   return true;
                                 }
                                 return query.created.has_value() && !query.created->contains(entry.created_at_ns);
                               }),
                entries.end());

  std::sort(entries.begin(), entries.end(), [](const IndexEntry& lhs, const IndexEntry& rhs) {
    if (lhs.created_at_ns != rhs.created_at_ns) {
      return lhs.created_at_ns > rhs.created_at_ns;
    }
    return lhs.run_id > rhs.run_id;
  });

  std::vector<std::string> ids;
  ids.reserve(entries.size());
  for (auto& entry : entries) {
    ids.push_back(std::move(entry.run_id));
  }
  return ids;
}

RunCursor::RunCursor(std::vector<std::string> run_ids, Loader loader)
    : run_ids_(std::move(run_ids)), loader_(std::move(loader)) {}

RunPtr RunCursor::next() {
  while (position_ < run_ids_.size()) {
    const std::string& run_id = run_ids_[position_++];
    try {
      if (RunPtr run = loader_(run_id)) {
        return run;
      }
    } catch (const core::NotFoundError&) {
      continue;
    }
  }
  return nullptr;
}

std::vector<RunPtr> RunCursor::collect() {
  std::vector<RunPtr> runs;
  runs.reserve(remaining());
  while (RunPtr run = next()) {
    runs.push_back(std::move(run));
  }
  return runs;
}

RunComparison ResultArchive::compare(const std::string& run_id_a, const std::string& run_id_b) const {
  const RunPtr a = get(run_id_a);
  const RunPtr b = get(run_id_b);

  if (a->kind != b->kind) {
    throw std::invalid_argument("cannot compare " + std::string(model::to_string(a->kind)) + " run with " +
                                std::string(model::to_string(b->kind)) + " run");
  }
  if (!a->stats.has_value() || !b->stats.has_value()) {
    throw std::invalid_argument("both runs need statistics to be compared");
  }

  const model::StatsSnapshot& sa = *a->stats;
  const model::StatsSnapshot& sb = *b->stats;

  RunComparison comparison{};
  comparison.run_id_a = run_id_a;
  comparison.run_id_b = run_id_b;
  comparison.kind = a->kind;
  comparison.count = delta_of(static_cast<double>(sa.count), static_cast<double>(sb.count));
  comparison.mean = delta_of(sa.mean, sb.mean);
  comparison.median = delta_of(sa.median, sb.median);
  comparison.stdev = delta_of(sa.stdev, sb.stdev);
  comparison.min = delta_of(sa.min, sb.min);
  comparison.max = delta_of(sa.max, sb.max);
  return comparison;
}

RunPtr ResultArchive::latest(const std::optional<model::device_kind> kind) const {
  RunQuery filter{};
  filter.kind = kind;
  return query(filter).next();
}

ArchiveSummary ResultArchive::summary() const {
  ArchiveSummary summary{};
  auto cursor = query();
  while (const RunPtr run = cursor.next()) {
    ++summary.total_runs;
    ++summary.runs_by_kind[run->kind];
    ++summary.runs_by_status[run->status];
    if (run->status == model::run_status::COMPLETED) {
      ++summary.completed_runs;
    }
  }
  return summary;
}

void ResultArchive::check_storable(const model::TestRun& run) {
  if (run.run_id.empty()) {
    throw core::ArchiveError("run has no run_id");
  }
  if (run.status == model::run_status::RUNNING) {
    throw core::ArchiveError("run " + run.run_id + " is not finalized");
  }
  if (!run.stats.has_value()) {
    throw core::ArchiveError("run " + run.run_id + " has no statistics");
  }
}

}  // namespace ammeter_bench::archive
