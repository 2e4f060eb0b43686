#pragma once

#include <cstddef>
#include <vector>

#include "devices/ammeter.hpp"

namespace ammeter_bench::devices {

// Rogowski coil: discrete integration I = sum(v_i * dt).
class CircutorAmmeter final : public Ammeter {
 public:
  static constexpr double kMinVoltage = 0.1;
  static constexpr double kMaxVoltage = 1.0;
  static constexpr double kMinTimeStep = 0.001;
  static constexpr double kMaxTimeStep = 0.01;
  static constexpr std::size_t kDefaultSamples = 10;

  explicit CircutorAmmeter(std::size_t samples = kDefaultSamples);

  model::device_kind kind() const noexcept override { return model::device_kind::CIRCUTOR; }
  std::string_view command() const noexcept override { return "MEASURE_CIRCUTOR -get_measurement"; }
  double measure(RandomSource& random) const override;
  CurrentRange plausible_range() const noexcept override;

  [[nodiscard]] std::size_t samples() const noexcept { return samples_; }

  static double current(const std::vector<double>& voltages, const std::vector<double>& time_steps);

 private:
  std::size_t samples_;
};

}  // namespace ammeter_bench::devices
