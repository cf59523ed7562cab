#pragma once
#include <cstdint>

namespace skynode::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
  uint64_t swap_total_kb{};
  uint64_t swap_used_kb{};
  double   used_pct{};      // 0..100
  double   swap_used_pct{}; // 0..100, 0 without swap
};

} // namespace skynode::model
