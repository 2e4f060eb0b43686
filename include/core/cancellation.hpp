#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ammeter_bench::core {

class CancellationToken {
 public:
  void cancel() noexcept;
  [[nodiscard]] bool cancelled() const noexcept;

  // Sleeps until `deadline` or cancellation; returns true if cancelled.
  bool wait_until(std::chrono::steady_clock::time_point deadline) const;

 private:
  mutable std::mutex mutex_{};
  mutable std::condition_variable cv_{};
  bool cancelled_{false};
};

}  // namespace ammeter_bench::core
