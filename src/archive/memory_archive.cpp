#include "archive/memory_archive.hpp"

#include <memory>
#include <vector>

#include "archive/run_codec.hpp"
#include "core/errors.hpp"

namespace ammeter_bench::archive {

void MemoryArchive::store(const model::TestRun& run) {
  check_storable(run);

  std::lock_guard<std::mutex> lock(mutex_);
  if (runs_.find(run.run_id) != runs_.end()) {
    throw core::ArchiveError("run " + run.run_id + " already archived");
  }
  runs_.emplace(run.run_id, std::make_shared<const model::TestRun>(run));
}

RunPtr MemoryArchive::find(const std::string& run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = runs_.find(run_id);
  return it == runs_.end() ? nullptr : it->second;
}

RunPtr MemoryArchive::get(const std::string& run_id) const {
  RunPtr run = find(run_id);
  if (run == nullptr) {
    throw core::NotFoundError(run_id);
  }
  return run;
}

RunCursor MemoryArchive::query(const RunQuery& query) const {
  std::vector<IndexEntry> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.reserve(runs_.size());
    for (const auto& [_, run] : runs_) {
      entries.push_back(index_entry_of(*run));
    }
  }
  return RunCursor(select_run_ids(std::move(entries), query), [this](const std::string& run_id) { return find(run_id); });
}

bool MemoryArchive::remove(const std::string& run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return runs_.erase(run_id) > 0;
}

}  // namespace ammeter_bench::archive
