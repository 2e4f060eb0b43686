#include "archive/redis_archive.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <utility>

#include <hiredis/hiredis.h>

#include "archive/run_codec.hpp"
#include "core/errors.hpp"

namespace ammeter_bench::archive {
namespace {

std::string score_of(const std::uint64_t created_at_ns) { return std::to_string(created_at_ns / 1'000'000ULL); }

std::string upper_bound_of(const std::uint64_t to_ns) {
  if (to_ns == std::numeric_limits<std::uint64_t>::max()) {
    return "+inf";
  }
  return std::to_string(to_ns / 1'000'000ULL);
}

}  // namespace

void RedisArchive::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

void RedisArchive::ReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

RedisArchive::RedisArchive(RedisArchiveOptions options) : options_(std::move(options)) {}

RedisArchive::~RedisArchive() = default;

std::string RedisArchive::describe() const {
  if (!options_.unix_socket.empty()) {
    return "unix://" + options_.unix_socket;
  }
  return "redis://" + options_.host + ':' + std::to_string(options_.port);
}

std::string RedisArchive::run_key(const std::string& run_id) const { return options_.key_prefix + ":run:" + run_id; }

std::string RedisArchive::runs_key() const { return options_.key_prefix + ":runs"; }

std::string RedisArchive::runs_key(const model::device_kind kind) const {
  return options_.key_prefix + ":runs:" + std::string(model::to_string(kind));
}

bool RedisArchive::check_connectivity() {
  std::lock_guard<std::mutex> lock(mutex_);
  return ensure_connected();
}

bool RedisArchive::ensure_connected() const {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisArchive::reconnect() const {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (was_ok_) {
      if (raw != nullptr) {
        std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      } else {
        std::cerr << "[redis] connect failed: out of memory\n";
      }
      was_ok_ = false;
    }
    if (raw != nullptr) {
      redisFree(raw);
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }

  if (!was_ok_) {
    std::cerr << "[redis] connection recovered\n";
    was_ok_ = true;
  }
  return true;
}

bool RedisArchive::authenticate() const {
  if (options_.password.empty()) {
    return true;
  }

  const char* argv[] = {"AUTH", options_.password.c_str()};
  const std::size_t lengths[] = {4, options_.password.size()};
  ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(context_.get(), 2, argv, lengths)));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  return ok;
}

bool RedisArchive::select_db() const {
  if (options_.db == 0) {
    return true;
  }

  const std::string db = std::to_string(options_.db);
  const char* argv[] = {"SELECT", db.c_str()};
  const std::size_t lengths[] = {6, db.size()};
  ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(context_.get(), 2, argv, lengths)));
  return reply != nullptr && reply->type != REDIS_REPLY_ERROR;
}

RedisArchive::ReplyPtr RedisArchive::command(const std::vector<std::string>& args) const {
  std::vector<const char*> argv;
  std::vector<std::size_t> lengths;
  argv.reserve(args.size());
  lengths.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    lengths.push_back(arg.size());
  }

  for (int attempt = 0; attempt < 2; ++attempt) {
    if (!ensure_connected()) {
      return nullptr;
    }
    ReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), lengths.data())));
    if (reply != nullptr) {
      return reply;
    }
    context_.reset();
  }
  return nullptr;
}

RedisArchive::ReplyPtr RedisArchive::command_or_throw(const std::vector<std::string>& args, const char* what) const {
  ReplyPtr reply = command(args);
  if (reply == nullptr) {
    throw core::ArchiveError(std::string("redis ") + what + " failed: no connection to " + describe());
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    throw core::ArchiveError(std::string("redis ") + what + " failed: " +
                             (reply->str != nullptr ? std::string(reply->str, reply->len) : std::string("unknown")));
  }
  return reply;
}

void RedisArchive::store(const model::TestRun& run) {
  check_storable(run);
  const std::string record = encode_run(run);
  const std::string key = run_key(run.run_id);
  const std::string score = score_of(run.created_at_ns);

  std::lock_guard<std::mutex> lock(mutex_);
  const ReplyPtr created = command_or_throw({"SET", key, record, "NX"}, "SET");
  if (created->type == REDIS_REPLY_NIL) {
    throw core::ArchiveError("run " + run.run_id + " already archived");
  }

  try {
    command_or_throw({"ZADD", runs_key(), score, run.run_id}, "ZADD");
    command_or_throw({"ZADD", runs_key(run.kind), score, run.run_id}, "ZADD");
  } catch (const core::ArchiveError&) {
    // Keep the record and the indexes consistent: an unindexed record is dropped.
    (void)command({"DEL", key});
    (void)command({"ZREM", runs_key(), run.run_id});
    throw;
  }
}

RunPtr RedisArchive::get(const std::string& run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const ReplyPtr reply = command_or_throw({"GET", run_key(run_id)}, "GET");
  if (reply->type == REDIS_REPLY_NIL) {
    throw core::NotFoundError(run_id);
  }
  if (reply->type != REDIS_REPLY_STRING || reply->str == nullptr) {
    throw core::ArchiveError("unexpected reply type for " + run_key(run_id));
  }
  return std::make_shared<const model::TestRun>(decode_run(std::string(reply->str, reply->len)));
}

RunCursor RedisArchive::query(const RunQuery& query) const {
  const std::string key = query.kind.has_value() ? runs_key(*query.kind) : runs_key();
  const std::string max = query.created.has_value() ? upper_bound_of(query.created->to_ns) : "+inf";
  const std::string min = query.created.has_value() ? score_of(query.created->from_ns) : "-inf";

  std::vector<std::string> run_ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const ReplyPtr reply = command_or_throw({"ZREVRANGEBYSCORE", key, max, min}, "ZREVRANGEBYSCORE");
    if (reply->type != REDIS_REPLY_ARRAY) {
      throw core::ArchiveError("unexpected reply type for " + key);
    }
    run_ids.reserve(reply->elements);
    for (std::size_t i = 0; i < reply->elements; ++i) {
      const redisReply* element = reply->element[i];
      if (element != nullptr && element->str != nullptr) {
        run_ids.emplace_back(element->str, element->len);
      }
    }
  }

  // Scores are millisecond buckets; the exact bound and the status are checked once the record is loaded.
  const std::optional<TimeRange> created = query.created;
  const std::optional<model::run_status> status = query.status;
  return RunCursor(std::move(run_ids), [this, created, status](const std::string& run_id) -> RunPtr {
    RunPtr run = get(run_id);
    if (created.has_value() && !created->contains(run->created_at_ns)) {
      return nullptr;
    }
    if (status.has_value() && run->status != *status) {
      return nullptr;
    }
    return run;
  });
}

bool RedisArchive::remove(const std::string& run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const ReplyPtr current = command_or_throw({"GET", run_key(run_id)}, "GET");
  if (current->type == REDIS_REPLY_NIL) {
    return false;
  }

  model::device_kind kind{};
  bool kind_known = false;
  if (current->type == REDIS_REPLY_STRING && current->str != nullptr) {
    try {
      kind = decode_run(std::string(current->str, current->len)).kind;
      kind_known = true;
    } catch (const core::ArchiveError& ex) {
      std::cerr << "[archive] removing unreadable record " << run_id << ": " << ex.what() << '\n';
    }
  }

  command_or_throw({"DEL", run_key(run_id)}, "DEL");
  command_or_throw({"ZREM", runs_key(), run_id}, "ZREM");
  if (kind_known) {
    command_or_throw({"ZREM", runs_key(kind), run_id}, "ZREM");
  } else {
    for (const auto candidate : model::all_device_kinds()) {
      command_or_throw({"ZREM", runs_key(candidate), run_id}, "ZREM");
    }
  }
  return true;
}

}  // namespace ammeter_bench::archive
