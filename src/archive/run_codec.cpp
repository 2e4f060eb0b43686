#include "archive/run_codec.hpp"

#include <stdexcept>

#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace ammeter_bench::archive {
namespace {

constexpr int kRecordVersion = 1;

nlohmann::json stats_to_json(const model::StatsSnapshot& stats) {
  return nlohmann::json{{"count", stats.count}, {"mean", stats.mean},   {"median", stats.median},
                        {"stdev", stats.stdev}, {"min", stats.min},     {"max", stats.max}};
}

model::StatsSnapshot stats_from_json(const nlohmann::json& json) {
  model::StatsSnapshot stats{};
  stats.count = json.at("count").get<std::uint64_t>();
  stats.mean = json.at("mean").get<double>();
  stats.median = json.at("median").get<double>();
  stats.stdev = json.at("stdev").get<double>();
  stats.min = json.at("min").get<double>();
  stats.max = json.at("max").get<double>();
  return stats;
}

nlohmann::json sample_to_json(const model::Sample& sample) {
  nlohmann::json json{{"index", sample.index},
                      {"device_kind", std::string(model::to_string(sample.kind))},
                      {"timestamp_ns", sample.timestamp_ns},
                      {"value", sample.value},
                      {"valid", sample.valid}};
  json["error"] = sample.error.has_value() ? nlohmann::json(std::string(model::to_string(*sample.error))) : nlohmann::json(nullptr);
  return json;
}

model::Sample sample_from_json(const nlohmann::json& json) {
  model::Sample sample{};
  sample.index = json.at("index").get<std::uint64_t>();
  sample.kind = model::parse_device_kind(json.at("device_kind").get<std::string>());
  sample.timestamp_ns = json.at("timestamp_ns").get<std::uint64_t>();
  sample.value = json.at("value").get<double>();
  sample.valid = json.at("valid").get<bool>();
  const auto& error = json.at("error");
  if (!error.is_null()) {
    sample.error = model::parse_sample_error(error.get<std::string>());
  }
  return sample;
}

}  // namespace

nlohmann::json run_to_json(const model::TestRun& run) {
  nlohmann::json samples = nlohmann::json::array();
  for (const auto& sample : run.samples) {
    samples.push_back(sample_to_json(sample));
  }

  const std::uint64_t valid = run.valid_count();
  nlohmann::json record{
      {"version", kRecordVersion},
      {"run_id", run.run_id},
      {"device_kind", std::string(model::to_string(run.kind))},
      {"config",
       {{"num_samples", run.config.num_samples},
        {"duration_seconds", run.config.duration_seconds},
        {"frequency_hz", run.config.frequency_hz},
        {"max_consecutive_failures", run.config.max_consecutive_failures}}},
      {"status", std::string(model::to_string(run.status))},
      {"created_at_ns", run.created_at_ns},
      {"created_at", core::format_iso8601(run.created_at_ns)},
      {"elapsed_ns", run.elapsed_ns},
      {"metadata",
       {{"expected_count", run.config.num_samples},
        {"collected_count", run.samples.size()},
        {"valid_count", valid},
        {"actual_duration_seconds", static_cast<double>(run.elapsed_ns) / 1e9}}},
      {"samples", samples},
  };
  record["stats"] = run.stats.has_value() ? stats_to_json(*run.stats) : nlohmann::json(nullptr);
  return record;
}

model::TestRun run_from_json(const nlohmann::json& record) {
  try {
    if (record.at("version").get<int>() != kRecordVersion) {
      throw core::ArchiveError("unsupported run record version");
    }

    model::TestRun run{};
    run.run_id = record.at("run_id").get<std::string>();
    run.kind = model::parse_device_kind(record.at("device_kind").get<std::string>());

    const auto& config = record.at("config");
    run.config.num_samples = config.at("num_samples").get<std::uint64_t>();
    run.config.duration_seconds = config.at("duration_seconds").get<double>();
    run.config.frequency_hz = config.at("frequency_hz").get<double>();
    run.config.max_consecutive_failures = config.at("max_consecutive_failures").get<std::uint32_t>();

    run.status = model::parse_run_status(record.at("status").get<std::string>());
    run.created_at_ns = record.at("created_at_ns").get<std::uint64_t>();
    run.elapsed_ns = record.at("elapsed_ns").get<std::uint64_t>();

    for (const auto& sample : record.at("samples")) {
      run.samples.push_back(sample_from_json(sample));
    }

    const auto& stats = record.at("stats");
    if (!stats.is_null()) {
      run.stats = stats_from_json(stats);
    }
    return run;
  } catch (const nlohmann::json::exception& ex) {
    throw core::ArchiveError(std::string("malformed run record: ") + ex.what());
  } catch (const std::invalid_argument& ex) {
    throw core::ArchiveError(std::string("malformed run record: ") + ex.what());
  }
}

std::string encode_run(const model::TestRun& run, const int indent) { return run_to_json(run).dump(indent); }

model::TestRun decode_run(const std::string& text) {
  nlohmann::json record;
  try {
    record = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& ex) {
    throw core::ArchiveError(std::string("unparseable run record: ") + ex.what());
  }
  return run_from_json(record);
}

IndexEntry index_entry_of(const model::TestRun& run) {
  return IndexEntry{run.run_id, run.kind, run.created_at_ns, run.status};
}

}  // namespace ammeter_bench::archive
