#pragma once
#include <mutex>
#include "collectors/CpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "platform/Platform.hpp"

namespace lanlink::platform {

// CPU and memory load from /proc. The first CPU reading is 0% since usage
// is a delta between samples.
class ProcMetricsProvider final : public IMetricsProvider {
public:
  bool sample(model::SystemLoad& out) override;

private:
  std::mutex mu_;
  collectors::CpuCollector cpu_;
  collectors::MemoryCollector mem_;
};

} // namespace lanlink::platform
