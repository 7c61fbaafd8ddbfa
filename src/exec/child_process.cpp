/*
 * Child process handle - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/exec/child_process.hpp>
#include <cerrno>
#include <csignal>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

namespace dockstack {

void UniqueFd::reset(int fd) {
    if (m_fd >= 0) ::close(m_fd);
    m_fd = fd;
}

ExitStatus decode_wait_status(int st) {
    ExitStatus s;
    if (WIFEXITED(st)) s.code = WEXITSTATUS(st);
    else if (WIFSIGNALED(st)) { s.signal = WTERMSIG(st); s.code = 128 + s.signal; }
    return s;
}

ChildProcess::ChildProcess(pid_t pid, UniqueFd in, UniqueFd out, UniqueFd err)
    : m_pid(pid), m_in(std::move(in)), m_out(std::move(out)), m_err(std::move(err)) {}

bool ChildProcess::try_reap() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_reaped) return true;
    while (true) {
        int st = 0;
        pid_t r = waitpid(m_pid, &st, WNOHANG);
        if (r == 0) return false;
        if (r < 0) {
            if (errno == EINTR) continue;
            // ECHILD: nothing left to collect for this pid.
            m_reaped = true;
            return true;
        }
        if (WIFEXITED(st) || WIFSIGNALED(st)) {
            m_status = decode_wait_status(st);
            m_reaped = true;
            return true;
        }
        return false;
    }
}

ExitStatus ChildProcess::wait(std::chrono::milliseconds poll) {
    while (!try_reap()) std::this_thread::sleep_for(poll);
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_status;
}

bool ChildProcess::terminate(int sig) {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_reaped) return false;
    if (kill(-m_pid, sig) == 0) return true;
    return kill(m_pid, sig) == 0;
}

bool ChildProcess::reaped() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_reaped;
}

std::optional<ExitStatus> ChildProcess::exit_status() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_reaped) return std::nullopt;
    return m_status;
}

} // namespace dockstack
