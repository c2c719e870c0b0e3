#pragma once

/// @file executable.hpp
/// Locate the engine executable.

#include <filesystem>
#include <optional>
#include <string_view>

namespace fenprobe {

/// Resolve a comma-separated list of candidates to the first usable executable.
///
/// A candidate containing '/' is taken as a path; a bare name is looked up in
/// each directory of `search_path` (an empty entry means the current
/// directory). The result is absolute. Returns std::nullopt if no candidate
/// names an executable regular file.
[[nodiscard]] std::optional<std::filesystem::path> resolve_executable(
    std::string_view candidates, std::string_view search_path);

/// Same, searching the PATH environment variable.
[[nodiscard]] std::optional<std::filesystem::path> resolve_executable(
    std::string_view candidates);

/// True if `path` is a regular file the current user may execute.
[[nodiscard]] bool is_executable_file(const std::filesystem::path& path);

}  // namespace fenprobe
