#include "devices/random_source.hpp"

#include <stdexcept>

namespace ammeter_bench::devices {

SeededRandomSource::SeededRandomSource(const std::uint64_t seed) : seed_(seed), engine_(seed) {}

double SeededRandomSource::uniform(const double min_value, const double max_value) {
  if (!(min_value <= max_value)) {
    throw std::invalid_argument("uniform range must satisfy min <= max");
  }
  if (min_value == max_value) {
    return min_value;
  }
  std::uniform_real_distribution<double> distribution(min_value, max_value);
  return distribution(engine_);
}

std::uint64_t entropy_seed() {
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32U) ^ static_cast<std::uint64_t>(device());
}

}  // namespace ammeter_bench::devices
