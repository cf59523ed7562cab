#pragma once
#include <string>
#include <vector>

namespace skynode::model {

struct FanReading {
  std::string label;  // fanN_label when present, else chip/fanN
  long rpm{};
};

struct FanSnapshot {
  std::vector<FanReading> fans;
  int total{0};
  int stopped{0};  // rpm == 0
  int slow{0};     // 0 < rpm < slow threshold
};

} // namespace skynode::model
