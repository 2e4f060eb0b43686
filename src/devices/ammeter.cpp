#include "devices/ammeter.hpp"

#include <cmath>
#include <stdexcept>

#include "devices/circutor.hpp"
#include "devices/entes.hpp"
#include "devices/greenlee.hpp"

namespace ammeter_bench::devices {
namespace {

// Absorbs rounding at the range edges.
constexpr double kRangeTolerance = 1e-9;

}  // namespace

bool CurrentRange::contains(const double value) const noexcept {
  if (!std::isfinite(value)) {
    return false;
  }
  const double slack = kRangeTolerance * (std::fabs(max_a) + 1.0);
  return value >= min_a - slack && value <= max_a + slack;
}

std::unique_ptr<Ammeter> make_ammeter(const model::device_kind kind, const AmmeterOptions& options) {
  switch (kind) {
    case model::device_kind::GREENLEE:
      return std::make_unique<GreenleeAmmeter>();
    case model::device_kind::ENTES:
      return std::make_unique<EntesAmmeter>();
    case model::device_kind::CIRCUTOR:
      return std::make_unique<CircutorAmmeter>(options.circutor_samples);
  }
  throw std::invalid_argument("unknown device kind");
}

}  // namespace ammeter_bench::devices
