#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "archive/result_archive.hpp"
#include "model/measurement.hpp"

namespace ammeter_bench::archive {

nlohmann::json run_to_json(const model::TestRun& run);
// Throws core::ArchiveError on a malformed record.
model::TestRun run_from_json(const nlohmann::json& record);

std::string encode_run(const model::TestRun& run, int indent = -1);
model::TestRun decode_run(const std::string& text);

IndexEntry index_entry_of(const model::TestRun& run);

}  // namespace ammeter_bench::archive
