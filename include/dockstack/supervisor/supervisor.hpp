/*
 * Process supervisor / shutdown coordinator - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/cancel.hpp>
#include <dockstack/core/event_channel.hpp>
#include <dockstack/exec/child_process.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dockstack {

using WorkerId = std::uint64_t;

class Supervisor;

// A registered worker thread and the child it drives (if any). Owned by the
// Supervisor until the thread is joined and the child reaped.
struct ManagedProcess {
    WorkerId id = 0;
    std::string label;
    CancellationFlag cancel;
    std::shared_ptr<ChildProcess> child;
    std::thread worker;
    bool finished = false;
    // Set by request_stop; collect_finished kills the child once it passes.
    std::optional<std::chrono::steady_clock::time_point> stop_deadline;
    bool overdue_reported = false;
};

// What a worker body sees of its own registration.
class WorkerContext {
public:
    WorkerContext(Supervisor& sup, WorkerId id, CancellationFlag cancel)
        : m_sup(sup), m_id(id), m_cancel(std::move(cancel)) {}
    WorkerId id() const { return m_id; }
    const CancellationFlag& cancel() const { return m_cancel; }
    bool cancelled() const { return m_cancel.is_cancelled(); }
    // Attach a child spawned inside the worker so shutdown can reach it.
    void adopt(std::shared_ptr<ChildProcess> child);
private:
    Supervisor& m_sup;
    WorkerId m_id;
    CancellationFlag m_cancel;
};

struct ProcessInfo {
    WorkerId id = 0;
    std::string label;
    pid_t pid = -1;      // -1 if no child attached
    bool finished = false;
};

struct ShutdownReport {
    std::size_t workers = 0;        // workers registered when shutdown began
    std::size_t clean = 0;          // exited within the grace period
    std::size_t forced = 0;         // needed SIGKILL
    std::vector<pid_t> killed;      // pids signalled
    std::size_t stuck = 0;          // still running after the forced phase; left registered
};

class Supervisor {
public:
    using Body = std::function<void(WorkerContext&)>;

    // `errors` receives an ErrorEvent for any exception escaping a worker body.
    explicit Supervisor(EventSender errors = {},
                        std::chrono::milliseconds default_grace = std::chrono::milliseconds(3000));
    ~Supervisor();
    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Registers and starts a worker. nullopt once shutdown has begun.
    std::optional<WorkerId> launch(std::string label, CancellationFlag cancel, Body body,
                                   std::shared_ptr<ChildProcess> child = nullptr);
    bool adopt(WorkerId id, std::shared_ptr<ChildProcess> child);

    // Cancel one worker, wait up to `grace`, then kill its child and wait up
    // to `grace` again. Joins it. False if unknown or if the worker still runs
    // after that; it then stays registered with an expired stop deadline.
    bool stop(WorkerId id, std::chrono::milliseconds grace);
    // Non-blocking stop: cancels the worker now and lets collect_finished()
    // SIGKILL its child once `grace` has passed. False if no live worker `id`.
    bool request_stop(WorkerId id, std::chrono::milliseconds grace);
    // Joins workers that already finished and escalates overdue stop
    // requests. Cheap; call once per tick.
    std::size_t collect_finished();

    // Cancel everything, wait up to `grace`, SIGKILL the rest, join and reap all.
    // Workers still running `grace` after the kill are reported as stuck and
    // joined by the destructor.
    ShutdownReport shutdown_all(std::chrono::milliseconds grace);
    ShutdownReport shutdown_all() { return shutdown_all(m_default_grace); }

    bool shutting_down() const;
    std::size_t live_count() const;
    std::vector<ProcessInfo> processes() const;

private:
    friend class WorkerContext;
    void finish(WorkerId id);
    void report_timeout(const std::string& msg);
    static void reap_after_join(ManagedProcess& mp);

    EventSender m_errors;
    std::chrono::milliseconds m_default_grace;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<WorkerId, std::unique_ptr<ManagedProcess>> m_registry;
    WorkerId m_next_id = 1;
    bool m_shutting_down = false;
};

} // namespace dockstack
