#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "archive/result_archive.hpp"

namespace ammeter_bench::archive {

// One pretty-printed JSON file per run (<yyyymmdd>_<run_id>.json) plus results_index.json.
class DirectoryArchive final : public ResultArchive {
 public:
  static constexpr const char* kIndexFilename = "results_index.json";

  // Creates the directory when missing and loads the index. Throws core::ArchiveError.
  explicit DirectoryArchive(std::filesystem::path root);

  void store(const model::TestRun& run) override;
  RunPtr get(const std::string& run_id) const override;
  RunCursor query(const RunQuery& query = {}) const override;
  bool remove(const std::string& run_id) override;
  std::string describe() const override { return root_.string(); }

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

 private:
  struct Entry {
    IndexEntry index;
    std::string filename;
  };

  void load_index();
  void save_index() const;
  RunPtr load(const std::string& run_id) const;

  std::filesystem::path root_;
  mutable std::mutex mutex_{};
  std::map<std::string, Entry> index_{};
};

}  // namespace ammeter_bench::archive
