#include "devices/entes.hpp"

namespace ammeter_bench::devices {

double EntesAmmeter::current(const double flux_density_t, const double calibration_factor) {
  return flux_density_t * calibration_factor;
}

double EntesAmmeter::measure(RandomSource& random) const {
  const double flux_density = random.uniform(kMinFluxDensity, kMaxFluxDensity);
  const double calibration = random.uniform(kMinCalibration, kMaxCalibration);
  return current(flux_density, calibration);
}

CurrentRange EntesAmmeter::plausible_range() const noexcept {
  return CurrentRange{kMinFluxDensity * kMinCalibration, kMaxFluxDensity * kMaxCalibration};
}

}  // namespace ammeter_bench::devices
