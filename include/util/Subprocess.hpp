#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lanlink::util {

struct ProcessResult {
  int exit_code{-1};
  std::string output;  // stdout and stderr interleaved
};

// Runs argv[0] from PATH without a shell. nullopt if it could not be started
// or was killed after `timeout`.
[[nodiscard]] std::optional<ProcessResult> run_process(const std::vector<std::string>& argv,
                                                       std::chrono::milliseconds timeout = std::chrono::seconds(30));

// True if `name` resolves to an executable on PATH.
[[nodiscard]] bool executable_on_path(const std::string& name);

} // namespace lanlink::util
