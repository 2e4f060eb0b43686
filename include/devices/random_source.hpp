#pragma once

#include <cstdint>
#include <random>

namespace ammeter_bench::devices {

class RandomSource {
 public:
  virtual double uniform(double min_value, double max_value) = 0;
  virtual ~RandomSource() = default;
};

class SeededRandomSource final : public RandomSource {
 public:
  explicit SeededRandomSource(std::uint64_t seed);

  double uniform(double min_value, double max_value) override;

  [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

 private:
  std::uint64_t seed_;
  std::mt19937_64 engine_;
};

// Non-deterministic seed for production emulators.
std::uint64_t entropy_seed();

}  // namespace ammeter_bench::devices
