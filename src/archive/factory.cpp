#include "archive/factory.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

#include "archive/directory_archive.hpp"
#include "archive/memory_archive.hpp"
#include "core/errors.hpp"

namespace ammeter_bench::archive {
namespace {

constexpr const char* kRedisScheme = "redis://";
constexpr const char* kUnixScheme = "unix://";

bool starts_with(const std::string& value, const std::string& prefix) { return value.rfind(prefix, 0) == 0; }

}  // namespace

RedisArchiveOptions parse_redis_address(const core::ArchiveSettings& settings) {
  RedisArchiveOptions options{};
  options.key_prefix = settings.key_prefix;
  options.password = settings.password;
  options.db = settings.db;

  const std::string& address = settings.address;
  if (starts_with(address, kUnixScheme)) {
    options.unix_socket = address.substr(std::string(kUnixScheme).size());
    options.host.clear();
    options.port = 0;
    if (options.unix_socket.empty()) {
      throw core::ConfigError("archive.address unix socket path is empty");
    }
    return options;
  }

  if (!starts_with(address, kRedisScheme)) {
    throw core::ConfigError("archive.address is not a redis address: " + address);
  }

  const std::string host_port = address.substr(std::string(kRedisScheme).size());
  const auto split = host_port.find(':');
  if (split == std::string::npos) {
    options.host = host_port;
  } else {
    options.host = host_port.substr(0, split);
    int parsed_port = 0;
    try {
      parsed_port = std::stoi(host_port.substr(split + 1));
    } catch (const std::logic_error&) {
      throw core::ConfigError("archive.address port is not a number: " + address);
    }
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw core::ConfigError("archive.address port must be in range 1..65535");
    }
    options.port = static_cast<std::uint16_t>(parsed_port);
  }

  if (options.host.empty()) {
    throw core::ConfigError("archive.address host is empty");
  }
  return options;
}

std::unique_ptr<ResultArchive> make_archive(const core::ArchiveSettings& settings) {
  if (settings.address == "memory") {
    return std::make_unique<MemoryArchive>();
  }

  if (starts_with(settings.address, kRedisScheme) || starts_with(settings.address, kUnixScheme)) {
    auto archive = std::make_unique<RedisArchive>(parse_redis_address(settings));
    if (archive->check_connectivity()) {
      std::cerr << "[archive] redis connectivity confirmed at " << archive->describe() << '\n';
    } else {
      std::cerr << "[archive] redis connectivity check failed at " << archive->describe() << '\n';
    }
    return archive;
  }

  return std::make_unique<DirectoryArchive>(settings.address);
}

}  // namespace ammeter_bench::archive
