/// @file executable.cpp
/// Executable lookup over explicit paths and PATH.

#include <fenprobe/executable.hpp>

#include <unistd.h>

#include <cstdlib>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace fenprobe {

namespace {

std::vector<std::string_view> split(std::string_view sv, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    for (;;) {
        std::size_t pos = sv.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(sv.substr(start));
            return parts;
        }
        parts.push_back(sv.substr(start, pos - start));
        start = pos + 1;
    }
}

std::optional<fs::path> absolute_if_executable(const fs::path& candidate) {
    if (!is_executable_file(candidate))
        return std::nullopt;
    std::error_code ec;
    fs::path abs = fs::absolute(candidate, ec);
    if (ec)
        return std::nullopt;
    return abs.lexically_normal();
}

}  // namespace

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return false;
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<fs::path> resolve_executable(std::string_view candidates,
                                           std::string_view search_path) {
    for (std::string_view name : split(candidates, ',')) {
        if (name.empty())
            continue;

        if (name.find('/') != std::string_view::npos) {
            if (auto hit = absolute_if_executable(fs::path(name)))
                return hit;
            continue;
        }

        for (std::string_view dir : split(search_path, ':')) {
            fs::path base = dir.empty() ? fs::path(".") : fs::path(dir);
            if (auto hit = absolute_if_executable(base / name))
                return hit;
        }
    }
    return std::nullopt;
}

std::optional<fs::path> resolve_executable(std::string_view candidates) {
    const char* env = std::getenv("PATH");
    return resolve_executable(candidates, env ? std::string_view(env) : std::string_view());
}

}  // namespace fenprobe
