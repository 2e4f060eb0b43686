#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "devices/random_source.hpp"
#include "model/measurement.hpp"

namespace ammeter_bench::devices {

struct CurrentRange {
  double min_a;
  double max_a;

  [[nodiscard]] bool contains(double value) const noexcept;
};

class Ammeter {
 public:
  virtual model::device_kind kind() const noexcept = 0;
  virtual std::string_view command() const noexcept = 0;
  // One measurement; every input is drawn from `random`.
  virtual double measure(RandomSource& random) const = 0;
  virtual CurrentRange plausible_range() const noexcept = 0;
  virtual ~Ammeter() = default;

  [[nodiscard]] bool accepts(std::string_view request) const noexcept { return request == command(); }
};

struct AmmeterOptions {
  std::size_t circutor_samples{10};
};

std::unique_ptr<Ammeter> make_ammeter(model::device_kind kind, const AmmeterOptions& options = {});

}  // namespace ammeter_bench::devices
