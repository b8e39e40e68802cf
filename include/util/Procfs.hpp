// Helpers for reading /proc with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace hostwatch::util {

// Map an absolute /proc path to an alternate root if HOSTWATCH_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read the first line of a file without its trailing newline.
auto read_first_line(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace hostwatch::util
