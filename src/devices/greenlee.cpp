#include "devices/greenlee.hpp"

#include <stdexcept>

namespace ammeter_bench::devices {

double GreenleeAmmeter::current(const double voltage_v, const double resistance_ohm) {
  if (resistance_ohm <= 0.0) {
    throw std::invalid_argument("resistance must be greater than 0");
  }
  return voltage_v / resistance_ohm;
}

double GreenleeAmmeter::measure(RandomSource& random) const {
  const double voltage = random.uniform(kMinVoltage, kMaxVoltage);
  const double resistance = random.uniform(kMinResistance, kMaxResistance);
  return current(voltage, resistance);
}

CurrentRange GreenleeAmmeter::plausible_range() const noexcept {
  return CurrentRange{kMinVoltage / kMaxResistance, kMaxVoltage / kMinResistance};
}

}  // namespace ammeter_bench::devices
