/*
 * Child process handle - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/event.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <sys/types.h>

namespace dockstack {

// Owning file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : m_fd(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(UniqueFd&& o) noexcept : m_fd(o.release()) {}
    UniqueFd& operator=(UniqueFd&& o) noexcept { if (this != &o) reset(o.release()); return *this; }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return m_fd; }
    explicit operator bool() const { return m_fd >= 0; }
    int release() { int fd = m_fd; m_fd = -1; return fd; }
    void reset(int fd = -1);
private:
    int m_fd = -1;
};

// A spawned child living in its own process group (pgid == pid).
// Reaping is guarded: the pid is waited on exactly once, and no signal is
// ever sent after that (the pid may already belong to someone else).
class ChildProcess {
public:
    ChildProcess(pid_t pid, UniqueFd in, UniqueFd out, UniqueFd err);
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return m_pid; }

    // Pipe ends (may be empty). take_* hands ownership to the reader.
    UniqueFd take_stdin() { return std::move(m_in); }
    UniqueFd take_stdout() { return std::move(m_out); }
    UniqueFd take_stderr() { return std::move(m_err); }

    // waitpid(WNOHANG). True once the child has been reaped (now or earlier).
    bool try_reap();
    // Polls try_reap() until the child is gone.
    ExitStatus wait(std::chrono::milliseconds poll = std::chrono::milliseconds(5));
    // Signals the whole process group. False if already reaped.
    bool terminate(int sig);

    bool reaped() const;
    std::optional<ExitStatus> exit_status() const;

private:
    pid_t m_pid;
    UniqueFd m_in, m_out, m_err;
    mutable std::mutex m_mutex;
    bool m_reaped = false;
    ExitStatus m_status;
};

ExitStatus decode_wait_status(int st);

} // namespace dockstack
