/*
 * Event payloads - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/core/event.hpp>

namespace dockstack {

std::string describe(const ExitStatus& status) {
    if (status.signaled()) return "killed by signal " + std::to_string(status.signal);
    return "exit code " + std::to_string(status.code);
}

std::string terminal_source_id(SessionId id) { return "terminal:" + std::to_string(id); }

} // namespace dockstack
