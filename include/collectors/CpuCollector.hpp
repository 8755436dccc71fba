#pragma once
#include "model/System.hpp"

namespace lanlink::collectors {

class CpuCollector {
public:
  CpuCollector() = default;
  bool sample(lanlink::model::CpuSample& out);
private:
  lanlink::model::CpuTimes last_total_{};
  bool has_last_{false};
};

} // namespace lanlink::collectors
