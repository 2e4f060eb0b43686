#pragma once

#include <string>

namespace ammeter_bench::core {

// Random (version 4) UUID in canonical 8-4-4-4-12 hex form.
std::string generate_run_id();

[[nodiscard]] bool is_valid_run_id(const std::string& run_id) noexcept;

}  // namespace ammeter_bench::core
