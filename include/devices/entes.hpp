#pragma once

#include "devices/ammeter.hpp"

namespace ammeter_bench::devices {

// Hall-effect clamp: I = B * K.
class EntesAmmeter final : public Ammeter {
 public:
  static constexpr double kMinFluxDensity = 0.01;
  static constexpr double kMaxFluxDensity = 0.1;
  static constexpr double kMinCalibration = 500.0;
  static constexpr double kMaxCalibration = 2000.0;

  model::device_kind kind() const noexcept override { return model::device_kind::ENTES; }
  std::string_view command() const noexcept override { return "MEASURE_ENTES -get_data"; }
  double measure(RandomSource& random) const override;
  CurrentRange plausible_range() const noexcept override;

  static double current(double flux_density_t, double calibration_factor);
};

}  // namespace ammeter_bench::devices
