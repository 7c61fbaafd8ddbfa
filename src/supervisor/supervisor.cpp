/*
 * Process supervisor / shutdown coordinator - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/supervisor/supervisor.hpp>
#include <dockstack/util/log.hpp>
#include <csignal>
#include <exception>
#include <set>
#include <system_error>

namespace dockstack {

void WorkerContext::adopt(std::shared_ptr<ChildProcess> child) { m_sup.adopt(m_id, std::move(child)); }

Supervisor::Supervisor(EventSender errors, std::chrono::milliseconds default_grace)
    : m_errors(std::move(errors)), m_default_grace(default_grace) {}

Supervisor::~Supervisor() {
    ShutdownReport rep = shutdown_all(m_default_grace);
    if (rep.stuck == 0) return;
    // Their threads still reference this object.
    std::vector<std::unique_ptr<ManagedProcess>> rest;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto &kv : m_registry) rest.push_back(std::move(kv.second));
        m_registry.clear();
    }
    log_error("waiting for " + std::to_string(rest.size()) + " worker(s) that ignore cancellation");
    for (auto &mp : rest) reap_after_join(*mp);
}

void Supervisor::report_timeout(const std::string& msg) {
    log_warn(msg);
    m_errors.send(ErrorEvent{ErrorKind::Timeout, "supervisor", msg});
}

std::optional<WorkerId> Supervisor::launch(std::string label, CancellationFlag cancel, Body body,
                                           std::shared_ptr<ChildProcess> child) {
    std::unique_lock<std::mutex> lk(m_mutex);
    if (m_shutting_down) {
        lk.unlock();
        log_warn("refusing new worker '" + label + "': shutting down");
        // A child handed over with a refused launch is still ours to reap.
        if (child) { child->terminate(SIGKILL); child->wait(); }
        return std::nullopt;
    }
    auto mp = std::make_unique<ManagedProcess>();
    mp->id = m_next_id++;
    mp->label = label;
    mp->cancel = cancel;
    mp->child = child;
    ManagedProcess* raw = mp.get();
    WorkerId id = raw->id;
    m_registry.emplace(id, std::move(mp));
    try {
        raw->worker = std::thread([this, id, cancel, body = std::move(body), label]() mutable {
            WorkerContext ctx(*this, id, cancel);
            try {
                body(ctx);
            } catch (const std::exception& e) {
                log_error("worker '" + label + "' failed: " + e.what());
                m_errors.send(ErrorEvent{ErrorKind::IOFailure, label, e.what()});
            } catch (...) {
                log_error("worker '" + label + "' failed with a non-standard exception");
                m_errors.send(ErrorEvent{ErrorKind::IOFailure, label, "unknown exception in worker"});
            }
            finish(id);
        });
    } catch (const std::system_error& e) {
        m_registry.erase(id);
        lk.unlock();
        log_error("cannot start worker '" + label + "': " + e.what());
        m_errors.send(ErrorEvent{ErrorKind::SpawnFailure, label, e.what()});
        if (child) { child->terminate(SIGKILL); child->wait(); }
        return std::nullopt;
    }
    lk.unlock();
    log_debug("worker " + std::to_string(id) + " started: " + label);
    return id;
}

bool Supervisor::adopt(WorkerId id, std::shared_ptr<ChildProcess> child) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_registry.find(id);
    if (it == m_registry.end()) return false;
    it->second->child = std::move(child);
    return true;
}

void Supervisor::finish(WorkerId id) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_registry.find(id);
        if (it != m_registry.end()) it->second->finished = true;
    }
    m_cv.notify_all();
}

void Supervisor::reap_after_join(ManagedProcess& mp) {
    if (mp.worker.joinable()) mp.worker.join();
    if (mp.child && !mp.child->reaped()) {
        log_warn("worker '" + mp.label + "' left pid " + std::to_string(mp.child->pid()) + " unreaped; killing it");
        mp.child->terminate(SIGKILL);
        mp.child->wait();
    }
}

std::size_t Supervisor::collect_finished() {
    std::vector<std::unique_ptr<ManagedProcess>> done;
    std::vector<std::string> overdue;
    std::vector<std::shared_ptr<ChildProcess>> to_kill;
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto it = m_registry.begin(); it != m_registry.end();) {
            auto &mp = *it->second;
            if (mp.finished) { done.push_back(std::move(it->second)); it = m_registry.erase(it); continue; }
            if (mp.stop_deadline && now >= *mp.stop_deadline) {
                if (!mp.overdue_reported) {
                    mp.overdue_reported = true;
                    overdue.push_back("worker " + std::to_string(mp.id) + " (" + mp.label
                                      + ") did not stop within grace period; forcing");
                }
                // Adopted children may show up after the deadline: retry every tick.
                if (mp.child && !mp.child->reaped()) to_kill.push_back(mp.child);
            }
            ++it;
        }
    }
    for (auto &msg : overdue) report_timeout(msg);
    for (auto &child : to_kill)
        if (child->terminate(SIGKILL)) log_debug("killed pid " + std::to_string(child->pid()));
    for (auto &mp : done) reap_after_join(*mp);
    return done.size();
}

bool Supervisor::request_stop(WorkerId id, std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_registry.find(id);
    if (it == m_registry.end() || it->second->finished) return false;
    auto &mp = *it->second;
    mp.cancel.cancel();
    auto deadline = std::chrono::steady_clock::now() + grace;
    if (!mp.stop_deadline || deadline < *mp.stop_deadline) mp.stop_deadline = deadline;
    return true;
}

bool Supervisor::stop(WorkerId id, std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lk(m_mutex);
    auto it = m_registry.find(id);
    if (it == m_registry.end()) return false;
    it->second->cancel.cancel();
    auto done = [&]{ auto f = m_registry.find(id); return f == m_registry.end() || f->second->finished; };
    if (!m_cv.wait_for(lk, grace, done)) {
        lk.unlock();
        report_timeout("worker " + std::to_string(id) + " did not stop within grace period; forcing");
        lk.lock();
        auto give_up = std::chrono::steady_clock::now() + grace;
        while (!done() && std::chrono::steady_clock::now() < give_up) {
            auto child = m_registry.find(id)->second->child;
            lk.unlock();
            if (child) child->terminate(SIGKILL);
            lk.lock();
            m_cv.wait_for(lk, cancel_poll_interval, done);
        }
        if (!done()) {
            auto &mp = *m_registry.find(id)->second;
            mp.stop_deadline = std::chrono::steady_clock::now();
            mp.overdue_reported = true;
            lk.unlock();
            report_timeout("worker " + std::to_string(id) + " ignores cancellation; left registered");
            return false;
        }
    }
    it = m_registry.find(id);
    if (it == m_registry.end()) return true; // collected concurrently
    auto mp = std::move(it->second);
    m_registry.erase(it);
    lk.unlock();
    reap_after_join(*mp);
    return true;
}

ShutdownReport Supervisor::shutdown_all(std::chrono::milliseconds grace) {
    ShutdownReport rep;
    std::unique_lock<std::mutex> lk(m_mutex);
    m_shutting_down = true;
    rep.workers = m_registry.size();
    if (m_registry.empty()) return rep;
    for (auto &kv : m_registry) kv.second->cancel.cancel();

    auto all_finished = [&]{
        for (auto &kv : m_registry) if (!kv.second->finished) return false;
        return true;
    };
    m_cv.wait_until(lk, std::chrono::steady_clock::now() + grace, all_finished);
    for (auto &kv : m_registry) if (kv.second->finished) ++rep.clean;

    if (!all_finished()) {
        lk.unlock();
        report_timeout("shutdown grace period of " + std::to_string(grace.count()) + "ms exceeded by "
                       + std::to_string(rep.workers - rep.clean) + " worker(s); forcing termination");
        lk.lock();
    }
    std::set<WorkerId> forced;
    auto give_up = std::chrono::steady_clock::now() + grace;
    while (!all_finished() && std::chrono::steady_clock::now() < give_up) {
        std::vector<std::pair<WorkerId, std::shared_ptr<ChildProcess>>> targets;
        for (auto &kv : m_registry)
            if (!kv.second->finished && kv.second->child) targets.emplace_back(kv.first, kv.second->child);
        lk.unlock();
        for (auto &t : targets) {
            if (t.second->terminate(SIGKILL) && forced.insert(t.first).second) {
                rep.killed.push_back(t.second->pid());
                log_warn("killed pid " + std::to_string(t.second->pid()));
            }
        }
        lk.lock();
        m_cv.wait_for(lk, cancel_poll_interval, all_finished);
    }
    rep.forced = forced.size();

    std::vector<std::unique_ptr<ManagedProcess>> all;
    for (auto it = m_registry.begin(); it != m_registry.end();) {
        if (it->second->finished) { all.push_back(std::move(it->second)); it = m_registry.erase(it); }
        else { ++rep.stuck; ++it; }
    }
    lk.unlock();
    if (rep.stuck > 0)
        report_timeout(std::to_string(rep.stuck) + " worker(s) ignore cancellation after forced termination");
    for (auto &mp : all) reap_after_join(*mp);
    log_info("shutdown complete: " + std::to_string(rep.workers) + " worker(s), "
             + std::to_string(rep.forced) + " forced");
    return rep;
}

bool Supervisor::shutting_down() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_shutting_down;
}

std::size_t Supervisor::live_count() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    std::size_t n = 0;
    for (auto &kv : m_registry) if (!kv.second->finished) ++n;
    return n;
}

std::vector<ProcessInfo> Supervisor::processes() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    std::vector<ProcessInfo> out;
    for (auto &kv : m_registry) {
        auto &mp = *kv.second;
        out.push_back(ProcessInfo{mp.id, mp.label, mp.child ? mp.child->pid() : -1, mp.finished});
    }
    return out;
}

} // namespace dockstack
