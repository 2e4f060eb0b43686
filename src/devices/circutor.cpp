#include "devices/circutor.hpp"

#include <stdexcept>

namespace ammeter_bench::devices {

CircutorAmmeter::CircutorAmmeter(const std::size_t samples) : samples_(samples) {
  if (samples_ == 0) {
    throw std::invalid_argument("circutor sample count must be greater than 0");
  }
}

double CircutorAmmeter::current(const std::vector<double>& voltages, const std::vector<double>& time_steps) {
  if (voltages.size() != time_steps.size()) {
    throw std::invalid_argument("voltage and time step series must have the same length");
  }

  double integral = 0.0;
  for (std::size_t i = 0; i < voltages.size(); ++i) {
    integral += voltages[i] * time_steps[i];
  }
  return integral;
}

double CircutorAmmeter::measure(RandomSource& random) const {
  std::vector<double> voltages;
  std::vector<double> time_steps;
  voltages.reserve(samples_);
  time_steps.reserve(samples_);

  for (std::size_t i = 0; i < samples_; ++i) {
    voltages.push_back(random.uniform(kMinVoltage, kMaxVoltage));
    time_steps.push_back(random.uniform(kMinTimeStep, kMaxTimeStep));
  }
  return current(voltages, time_steps);
}

CurrentRange CircutorAmmeter::plausible_range() const noexcept {
  const auto n = static_cast<double>(samples_);
  return CurrentRange{n * kMinVoltage * kMinTimeStep, n * kMaxVoltage * kMaxTimeStep};
}

}  // namespace ammeter_bench::devices
