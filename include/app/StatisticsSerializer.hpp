#pragma once
#include <string>
#include "model/Statistics.hpp"

namespace lanlink::app {

// Serialize a statistics aggregate as one JSON object (diagnostics/export).
std::string statistics_to_json(const model::NetworkStatistics& st);

} // namespace lanlink::app
