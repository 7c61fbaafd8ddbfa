/*
 * PATH resolution implementation - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/exec/path.hpp>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace dockstack {

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(p.c_str(), X_OK) == 0;
}

std::vector<std::string> split_search_path(const std::string& path_list) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t colon = path_list.find(':', start);
        if (colon == std::string::npos) colon = path_list.size();
        if (colon > start) parts.push_back(path_list.substr(start, colon - start));
        start = colon + 1;
    }
    return parts;
}

std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& path_list) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd;
        return std::nullopt;
    }
    for (auto &d : split_search_path(path_list)) {
        std::string full = d + '/' + cmd;
        if (is_executable(full)) return full;
    }
    return std::nullopt;
}

std::optional<std::string> resolve_executable(const std::string& cmd) {
    const char* path_env = std::getenv("PATH");
    return resolve_executable(cmd, path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
}

} // namespace dockstack
