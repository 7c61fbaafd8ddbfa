/*
 * Error taxonomy - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace dockstack {

enum class ErrorKind {
    SpawnFailure,      // executable not found, permission denied, fork/pty failure
    IOFailure,         // read/write error on a live process or terminal
    ParseFailure,      // one output line did not match the schema (non-fatal)
    Timeout,           // shutdown grace period exceeded
    SessionStateError, // operation on a Closing/Closed session
    ExitFailure,       // process exited unsuccessfully with no parseable output
    Cancelled,         // command cancelled before completion
    Rejected           // supervisor is shutting down
};

struct Failure {
    ErrorKind kind;
    std::string message;
};

// Empty on success.
using MaybeFailure = std::optional<Failure>;

const char* to_string(ErrorKind kind);

} // namespace dockstack
