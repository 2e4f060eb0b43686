#pragma once

#include <memory>

#include "archive/redis_archive.hpp"
#include "archive/result_archive.hpp"
#include "core/config.hpp"

namespace ammeter_bench::archive {

// "memory" -> MemoryArchive, "redis://host[:port]" or "unix:///path" -> RedisArchive, anything else is a
// directory path. Throws core::ConfigError on a malformed redis address and core::ArchiveError when a
// directory archive cannot be opened.
std::unique_ptr<ResultArchive> make_archive(const core::ArchiveSettings& settings);

RedisArchiveOptions parse_redis_address(const core::ArchiveSettings& settings);

}  // namespace ammeter_bench::archive
