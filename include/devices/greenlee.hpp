#pragma once

#include "devices/ammeter.hpp"

namespace ammeter_bench::devices {

// Shunt-style meter: I = V / R.
class GreenleeAmmeter final : public Ammeter {
 public:
  static constexpr double kMinVoltage = 1.0;
  static constexpr double kMaxVoltage = 10.0;
  static constexpr double kMinResistance = 0.1;
  static constexpr double kMaxResistance = 100.0;

  model::device_kind kind() const noexcept override { return model::device_kind::GREENLEE; }
  std::string_view command() const noexcept override { return "MEASURE_GREENLEE -get_measurement"; }
  double measure(RandomSource& random) const override;
  CurrentRange plausible_range() const noexcept override;

  static double current(double voltage_v, double resistance_ohm);
};

}  // namespace ammeter_bench::devices
