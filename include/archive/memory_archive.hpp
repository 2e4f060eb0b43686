#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "archive/result_archive.hpp"

namespace ammeter_bench::archive {

class MemoryArchive final : public ResultArchive {
 public:
  void store(const model::TestRun& run) override;
  RunPtr get(const std::string& run_id) const override;
  RunCursor query(const RunQuery& query = {}) const override;
  bool remove(const std::string& run_id) override;
  std::string describe() const override { return "memory"; }

 private:
  RunPtr find(const std::string& run_id) const;

  mutable std::mutex mutex_{};
  std::unordered_map<std::string, RunPtr> runs_{};
};

}  // namespace ammeter_bench::archive
