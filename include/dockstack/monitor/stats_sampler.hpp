/*
 * Periodic container stats sampler - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/cancel.hpp>
#include <dockstack/core/event_channel.hpp>
#include <dockstack/exec/record_parser.hpp>
#include <dockstack/exec/spawn.hpp>
#include <dockstack/supervisor/supervisor.hpp>
#include <chrono>
#include <optional>

namespace dockstack {

// Runs `spec` every `interval` and emits each sample as a CommandResult
// tagged with the same request id. A failed sample is reported and the
// loop keeps going until cancelled.
class StatsSampler {
public:
    StatsSampler(Supervisor& sup, EventSender events) : m_sup(sup), m_events(std::move(events)) {}

    std::optional<WorkerId> start(RequestId request_id, CommandSpec spec, RecordSchema schema,
                                  std::chrono::milliseconds interval, CancellationFlag cancel);

private:
    Supervisor& m_sup;
    EventSender m_events;
};

// Sleeps up to `total` in cancel_poll_interval slices. False if cancelled.
bool sleep_unless_cancelled(std::chrono::milliseconds total, const CancellationFlag& cancel);

} // namespace dockstack
