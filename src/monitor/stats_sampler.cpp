/*
 * Periodic container stats sampler - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/monitor/stats_sampler.hpp>
#include <dockstack/exec/command_executor.hpp>
#include <dockstack/util/log.hpp>
#include <algorithm>
#include <thread>

namespace dockstack {

bool sleep_unless_cancelled(std::chrono::milliseconds total, const CancellationFlag& cancel) {
    auto deadline = std::chrono::steady_clock::now() + total;
    while (!cancel.is_cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, cancel_poll_interval));
    }
    return false;
}

std::optional<WorkerId> StatsSampler::start(RequestId request_id, CommandSpec spec, RecordSchema schema,
                                            std::chrono::milliseconds interval, CancellationFlag cancel) {
    auto id = m_sup.launch("stats sampler: " + display_command(spec), cancel,
        [events = m_events, request_id, spec = std::move(spec), schema = std::move(schema), interval](WorkerContext& ctx) {
            std::size_t samples = 0;
            while (!ctx.cancelled()) {
                auto cap = capture_output(spec, ctx.cancel(), [&](std::shared_ptr<ChildProcess> c){ ctx.adopt(std::move(c)); });
                if (cap.cancelled) break;
                auto res = make_command_result(request_id, spec, cap, schema);
                if (auto f = res.failure()) log_debug("stats sample failed: " + f->message);
                events.send(std::move(res));
                ++samples;
                if (!sleep_unless_cancelled(interval, ctx.cancel())) break;
            }
            log_debug("stats sampler stopped after " + std::to_string(samples) + " sample(s)");
        }, nullptr);
    if (!id) m_events.send(CommandResult{request_id, Failure{ErrorKind::Rejected, "supervisor is shutting down"}});
    return id;
}

} // namespace dockstack
