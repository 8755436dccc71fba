#pragma once
#include "model/System.hpp"

namespace lanlink::collectors {

// Total and used memory from /proc/meminfo.
class MemoryCollector {
public:
  [[nodiscard]] bool sample(model::MemorySample& out) const;
};

} // namespace lanlink::collectors
