#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace ammeter_bench::core {

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::uint64_t to_ns(const std::chrono::steady_clock::duration duration) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());
}

// UTC, millisecond precision: 2024-05-01T12:30:00.250Z
inline std::string format_iso8601(const std::uint64_t unix_ns) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ns / 1'000'000'000ULL);
  const auto millis = static_cast<unsigned>((unix_ns / 1'000'000ULL) % 1000ULL);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03uZ", date, millis);
  return out;
}

// Compact date used in archive file names: 20240501
inline std::string format_date_compact(const std::uint64_t unix_ns) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ns / 1'000'000'000ULL);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char out[16];
  std::strftime(out, sizeof(out), "%Y%m%d", &utc);
  return out;
}

}  // namespace ammeter_bench::core
