/*
 * PATH resolution utilities - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>
#include <vector>

namespace dockstack {

// Split a PATH-style list on ':' dropping empty entries.
std::vector<std::string> split_search_path(const std::string& path_list);

// Resolve a program name to an executable path. Names containing '/' are
// checked as-is; bare names are searched in `path_list` (defaults to $PATH).
std::optional<std::string> resolve_executable(const std::string& cmd);
std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& path_list);

} // namespace dockstack
