/*
 * Command executor: one external invocation per worker - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/cancel.hpp>
#include <dockstack/core/event_channel.hpp>
#include <dockstack/exec/record_parser.hpp>
#include <dockstack/exec/spawn.hpp>
#include <dockstack/supervisor/supervisor.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dockstack {

struct CaptureResult {
    std::string stdout_text;
    std::string stderr_text;
    ExitStatus status;
    bool cancelled = false;
    std::optional<Failure> error; // spawn or read failure
};

// Spawns `spec` and collects stdout/stderr until both close, then reaps the
// child. Blocking: only call from a worker thread. `on_spawn` runs right
// after a successful spawn (used to hand the child to the supervisor).
CaptureResult capture_output(const CommandSpec& spec, const CancellationFlag& cancel,
                             const std::function<void(std::shared_ptr<ChildProcess>)>& on_spawn = {});

// Partial-success policy: output plus per-line parse errors, unless the
// process failed to start, was cancelled, or exited unsuccessfully without
// any parseable output.
CommandResult make_command_result(RequestId request_id, const CommandSpec& spec, const CaptureResult& cap,
                                  const std::optional<RecordSchema>& schema);

class CommandExecutor {
public:
    CommandExecutor(Supervisor& sup, EventSender events) : m_sup(sup), m_events(std::move(events)) {}

    // Emits exactly one CommandResult for `request_id`.
    std::optional<WorkerId> execute(RequestId request_id, std::string program, std::vector<std::string> args,
                                    std::optional<RecordSchema> schema = std::nullopt,
                                    std::string working_dir = {});
    std::optional<WorkerId> execute(RequestId request_id, CommandSpec spec,
                                    std::optional<RecordSchema> schema = std::nullopt);
    // Runs `steps` in order on one worker and stops at the first failure.
    // The single CommandResult describes the last step that ran.
    std::optional<WorkerId> execute_sequence(RequestId request_id, std::vector<CommandSpec> steps,
                                             std::optional<RecordSchema> schema = std::nullopt);

private:
    Supervisor& m_sup;
    EventSender m_events;
};

} // namespace dockstack
