#include "core/run_id.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <random>

namespace ammeter_bench::core {
namespace {

std::mt19937_64& thread_engine() {
  thread_local std::mt19937_64 engine = []() {
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device(), device(), device(), device(), device()};
    return std::mt19937_64(seed);
  }();
  return engine;
}

}  // namespace

std::string generate_run_id() {
  std::array<std::uint8_t, 16> bytes{};
  auto& engine = thread_engine();
  const std::uint64_t high = engine();
  const std::uint64_t low = engine();
  for (std::size_t i = 0; i < 8; ++i) {
    bytes[i] = static_cast<std::uint8_t>(high >> (8U * i));
    bytes[8 + i] = static_cast<std::uint8_t>(low >> (8U * i));
  }

  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3FU) | 0x80U);

  constexpr const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHex[bytes[i] >> 4U]);
    out.push_back(kHex[bytes[i] & 0x0FU]);
  }
  return out;
}

bool is_valid_run_id(const std::string& run_id) noexcept {
  if (run_id.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < run_id.size(); ++i) {
    const bool dash_position = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash_position) {
      if (run_id[i] != '-') {
        return false;
      }
    } else if (std::isxdigit(static_cast<unsigned char>(run_id[i])) == 0) {
      return false;
    }
  }
  return true;
}

}  // namespace ammeter_bench::core
