/*
 * Error taxonomy - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/core/error.hpp>

namespace dockstack {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SpawnFailure: return "spawn_failure";
        case ErrorKind::IOFailure: return "io_failure";
        case ErrorKind::ParseFailure: return "parse_failure";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::SessionStateError: return "session_state_error";
        case ErrorKind::ExitFailure: return "exit_failure";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Rejected: return "rejected";
    }
    return "unknown";
}

} // namespace dockstack
