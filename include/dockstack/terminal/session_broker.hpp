/*
 * Terminal session broker - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/event_channel.hpp>
#include <dockstack/supervisor/supervisor.hpp>
#include <dockstack/terminal/pty.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dockstack {

enum class SessionState { Starting, Running, Closing, Closed };

const char* to_string(SessionState state);

struct TerminalOptions {
    std::string shell = "/bin/sh";
    std::vector<std::string> args;
    std::string term = "xterm-256color";
    std::string working_dir;
    // How long a closed shell may linger after the hangup before it is killed.
    std::chrono::milliseconds close_grace{3000};
};

namespace detail {
// Shared between the broker, the handles and the session worker. The worker
// alone touches the pseudo-terminal; everyone else queues requests here.
struct SessionSlot {
    SessionId id = 0;
    mutable std::mutex mutex;
    SessionState state = SessionState::Starting;
    TermSize size;
    std::deque<std::string> input;
    std::optional<TermSize> pending_resize;
    bool close_requested = false;
    std::optional<WorkerId> worker;
    UniqueFd wake; // eventfd

    void notify() const;
};
} // namespace detail

// What the consumer holds: the session id plus an input endpoint.
class SessionHandle {
public:
    SessionHandle() = default;
    SessionId id() const { return m_slot ? m_slot->id : 0; }
    // SessionStateError once the session is Closing or Closed.
    MaybeFailure send(std::string bytes) const;
    SessionState state() const;
    explicit operator bool() const { return m_slot != nullptr; }
private:
    friend class TerminalSessionBroker;
    explicit SessionHandle(std::shared_ptr<detail::SessionSlot> slot) : m_slot(std::move(slot)) {}
    std::shared_ptr<detail::SessionSlot> m_slot;
};

class TerminalSessionBroker {
public:
    TerminalSessionBroker(Supervisor& sup, EventSender events, TerminalOptions opts = {});
    TerminalSessionBroker(const TerminalSessionBroker&) = delete;
    TerminalSessionBroker& operator=(const TerminalSessionBroker&) = delete;

    // Returns at once in state Starting; the worker allocates the
    // pseudo-terminal and spawns the shell. Allocation or spawn failures
    // arrive as an ErrorEvent and leave the session Closed.
    SessionHandle open(TermSize initial_size = {});

    MaybeFailure write(SessionId id, std::string bytes);
    // Applied asynchronously by the session worker.
    MaybeFailure resize(SessionId id, TermSize size);
    // Moves the session to Closing; the worker hangs up the shell, reaps it
    // and emits ProcessExited{"terminal:<id>"}. A shell still alive after
    // `close_grace` is killed by the supervisor on its next collect_finished().
    MaybeFailure close(SessionId id);

    std::optional<SessionState> state(SessionId id) const;
    std::optional<TermSize> size(SessionId id) const;
    std::vector<SessionId> sessions() const;
    // Forgets Closed sessions. Writes to a forgotten id still fail with
    // SessionStateError. Returns how many were dropped.
    std::size_t prune_closed();

private:
    std::shared_ptr<detail::SessionSlot> find(SessionId id) const;

    Supervisor& m_sup;
    EventSender m_events;
    TerminalOptions m_opts;
    mutable std::mutex m_mutex;
    std::map<SessionId, std::shared_ptr<detail::SessionSlot>> m_sessions;
    SessionId m_next_id = 1;
};

} // namespace dockstack
