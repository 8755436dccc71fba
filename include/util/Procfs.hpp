// C++23 helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace lanlink::util {

// Map an absolute /proc path to an alternate root if LANLINK_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if LANLINK_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Read entire file as string (both remaps applied). Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// First line of a file with trailing whitespace removed (sysfs attributes).
auto read_first_line(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// True if the (remapped) path exists.
auto path_exists(const std::string& abs) -> bool;

} // namespace lanlink::util
