#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "archive/result_archive.hpp"

struct redisContext;
struct redisReply;

namespace ammeter_bench::archive {

struct RedisArchiveOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"ammeter:bench"};
  std::uint32_t connect_timeout_ms{1000};
};

// Layout: <prefix>:run:<id> holds the JSON record, <prefix>:runs and <prefix>:runs:<kind> are sorted sets of
// run ids scored by created_at in milliseconds.
class RedisArchive final : public ResultArchive {
 public:
  explicit RedisArchive(RedisArchiveOptions options = {});
  ~RedisArchive() override;

  RedisArchive(const RedisArchive&) = delete;
  RedisArchive& operator=(const RedisArchive&) = delete;

  bool check_connectivity();

  void store(const model::TestRun& run) override;
  RunPtr get(const std::string& run_id) const override;
  RunCursor query(const RunQuery& query = {}) const override;
  bool remove(const std::string& run_id) override;
  std::string describe() const override;

  [[nodiscard]] std::string run_key(const std::string& run_id) const;
  [[nodiscard]] std::string runs_key() const;
  [[nodiscard]] std::string runs_key(model::device_kind kind) const;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };
  struct ReplyDeleter {
    void operator()(redisReply* reply) const;
  };
  using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

  bool ensure_connected() const;
  bool reconnect() const;
  bool authenticate() const;
  bool select_db() const;
  // Caller holds mutex_. Returns nullptr when the connection is unusable; reconnects once on I/O failure.
  ReplyPtr command(const std::vector<std::string>& args) const;
  ReplyPtr command_or_throw(const std::vector<std::string>& args, const char* what) const;

  RedisArchiveOptions options_;
  mutable std::mutex mutex_{};
  mutable std::unique_ptr<redisContext, ContextDeleter> context_{};
  mutable bool was_ok_{true};
};

}  // namespace ammeter_bench::archive
