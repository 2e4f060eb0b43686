#include "archive/directory_archive.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "archive/run_codec.hpp"
#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace ammeter_bench::archive {
namespace {

// Write-then-rename so a crash never leaves a truncated record behind.
void write_file_atomically(const std::filesystem::path& path, const std::string& content) {
  const std::filesystem::path temp = path.string() + ".tmp";
  {
    std::ofstream out(temp, std::ios::trunc);
    if (!out.is_open()) {
      throw core::ArchiveError("unable to open " + temp.string() + " for writing");
    }
    out << content;
    out.flush();
    if (!out) {
      throw core::ArchiveError("failed writing " + temp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp, path, ec);
  if (ec) {
    std::filesystem::remove(temp, ec);
    throw core::ArchiveError("failed to move " + temp.string() + " into place");
  }
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw core::ArchiveError("unable to open " + path.string());
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

}  // namespace

DirectoryArchive::DirectoryArchive(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw core::ArchiveError("unable to create archive directory " + root_.string() + ": " + ec.message());
  }
  load_index();
}

void DirectoryArchive::load_index() {
  const auto path = root_ / kIndexFilename;
  if (!std::filesystem::exists(path)) {
    return;
  }

  try {
    const auto index = nlohmann::json::parse(read_file(path));
    for (auto it = index.begin(); it != index.end(); ++it) {
      const std::string& run_id = it.key();
      const auto& item = it.value();
      Entry entry{};
      entry.index.run_id = run_id;
      entry.index.kind = model::parse_device_kind(item.at("device_kind").get<std::string>());
      entry.index.created_at_ns = item.at("created_at_ns").get<std::uint64_t>();
      entry.index.status = model::parse_run_status(item.at("status").get<std::string>());
      entry.filename = item.at("filename").get<std::string>();
      index_.emplace(run_id, std::move(entry));
    }
  } catch (const nlohmann::json::exception& ex) {
    throw core::ArchiveError("corrupt archive index " + path.string() + ": " + ex.what());
  } catch (const std::invalid_argument& ex) {
    throw core::ArchiveError("corrupt archive index " + path.string() + ": " + ex.what());
  }
}

void DirectoryArchive::save_index() const {
  nlohmann::json index = nlohmann::json::object();
  for (const auto& [run_id, entry] : index_) {
    index[run_id] = nlohmann::json{{"filename", entry.filename},
                                   {"device_kind", std::string(model::to_string(entry.index.kind))},
                                   {"created_at_ns", entry.index.created_at_ns},
                                   {"created_at", core::format_iso8601(entry.index.created_at_ns)},
                                   {"status", std::string(model::to_string(entry.index.status))}};
  }
  write_file_atomically(root_ / kIndexFilename, index.dump(2));
}

void DirectoryArchive::store(const model::TestRun& run) {
  check_storable(run);

  std::lock_guard<std::mutex> lock(mutex_);
  if (index_.find(run.run_id) != index_.end()) {
    throw core::ArchiveError("run " + run.run_id + " already archived");
  }

  Entry entry{};
  entry.index = index_entry_of(run);
  entry.filename = core::format_date_compact(run.created_at_ns) + "_" + run.run_id + ".json";
  write_file_atomically(root_ / entry.filename, encode_run(run, 4));

  index_.emplace(run.run_id, entry);
  try {
    save_index();
  } catch (const core::ArchiveError&) {
    index_.erase(run.run_id);
    std::error_code ec;
    std::filesystem::remove(root_ / entry.filename, ec);
    throw;
  }
}

RunPtr DirectoryArchive::load(const std::string& run_id) const {
  std::filesystem::path path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = index_.find(run_id);
    if (it == index_.end()) {
      throw core::NotFoundError(run_id);
    }
    path = root_ / it->second.filename;
  }

  if (!std::filesystem::exists(path)) {
    throw core::ArchiveError("archived record missing on disk: " + path.string());
  }
  return std::make_shared<const model::TestRun>(decode_run(read_file(path)));
}

RunPtr DirectoryArchive::get(const std::string& run_id) const { return load(run_id); }

RunCursor DirectoryArchive::query(const RunQuery& query) const {
  std::vector<IndexEntry> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.reserve(index_.size());
    for (const auto& [_, entry] : index_) {
      entries.push_back(entry.index);
    }
  }
  return RunCursor(select_run_ids(std::move(entries), query), [this](const std::string& run_id) { return load(run_id); });
}

bool DirectoryArchive::remove(const std::string& run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = index_.find(run_id);
  if (it == index_.end()) {
    return false;
  }

  std::error_code ec;
  std::filesystem::remove(root_ / it->second.filename, ec);
  if (ec) {
    std::cerr << "[archive] unable to delete " << it->second.filename << ": " << ec.message() << '\n';
  }
  index_.erase(it);
  save_index();
  return true;
}

}  // namespace ammeter_bench::archive
