/*
 * Log stream worker: line-by-line follower of a child's output - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/cancel.hpp>
#include <dockstack/core/event_channel.hpp>
#include <dockstack/exec/spawn.hpp>
#include <dockstack/supervisor/supervisor.hpp>
#include <memory>
#include <optional>
#include <string>

namespace dockstack {

// Emits one ProcessOutputLine per line until EOF or cancellation, then
// exactly one ProcessExited. Not restartable: start a new worker to re-attach.
// Stop it with Supervisor::request_stop so a child that never writes again
// is still killed and reaped.
class LogStreamWorker {
public:
    LogStreamWorker(Supervisor& sup, EventSender events) : m_sup(sup), m_events(std::move(events)) {}

    // Follows the stdout pipe of an already spawned child.
    std::optional<WorkerId> start(std::string source_id, std::shared_ptr<ChildProcess> child,
                                  CancellationFlag cancel);
    // Spawns `spec` (stderr merged into stdout) and follows it.
    std::optional<WorkerId> follow(std::string source_id, CommandSpec spec, CancellationFlag cancel);

private:
    Supervisor& m_sup;
    EventSender m_events;
};

// The worker loop itself, exposed for reuse. Blocks until EOF or cancellation
// and always reaps `child` before returning.
void run_log_stream(const std::string& source_id, ChildProcess& child, const CancellationFlag& cancel,
                    const EventSender& events);

} // namespace dockstack
