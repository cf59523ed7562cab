// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace skynode::util {

// Map an absolute /proc path to an alternate root if SKYNODE_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if SKYNODE_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Map either kind of path; anything else is returned unchanged.
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read the first integer in a file (sysfs attribute style).
auto read_file_long(const std::string& abs) -> std::optional<long>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace skynode::util
