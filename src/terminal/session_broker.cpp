/*
 * Terminal session broker implementation - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/terminal/session_broker.hpp>
#include <dockstack/util/log.hpp>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace dockstack {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Starting: return "starting";
        case SessionState::Running: return "running";
        case SessionState::Closing: return "closing";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

void detail::SessionSlot::notify() const {
    if (!wake) return;
    std::uint64_t one = 1;
    // EAGAIN means the counter is already non-zero: the worker wakes anyway.
    while (::write(wake.get(), &one, sizeof(one)) < 0 && errno == EINTR) {}
}

static Failure not_running(SessionId id) {
    return Failure{ErrorKind::SessionStateError, "session " + std::to_string(id) + " not running"};
}

static MaybeFailure queue_input(detail::SessionSlot& slot, std::string bytes) {
    {
        std::lock_guard<std::mutex> lk(slot.mutex);
        if (slot.state == SessionState::Closing || slot.state == SessionState::Closed || slot.close_requested)
            return not_running(slot.id);
        if (bytes.empty()) return std::nullopt;
        slot.input.push_back(std::move(bytes));
    }
    slot.notify();
    return std::nullopt;
}

static void set_state(detail::SessionSlot& slot, SessionState st) {
    std::lock_guard<std::mutex> lk(slot.mutex);
    slot.state = st;
}

MaybeFailure SessionHandle::send(std::string bytes) const {
    if (!m_slot) return Failure{ErrorKind::SessionStateError, "empty session handle"};
    return queue_input(*m_slot, std::move(bytes));
}

SessionState SessionHandle::state() const {
    if (!m_slot) return SessionState::Closed;
    std::lock_guard<std::mutex> lk(m_slot->mutex);
    return m_slot->state;
}

// Session worker: owns the master side until the shell is gone.
static void run_session(const std::shared_ptr<detail::SessionSlot>& slot, const TerminalOptions& opts,
                        WorkerContext& ctx, const EventSender& events) {
    const std::string source = terminal_source_id(slot->id);
    TermSize initial;
    {
        std::lock_guard<std::mutex> lk(slot->mutex);
        initial = slot->size;
    }
    CommandSpec spec{opts.shell, opts.args, opts.working_dir, {}};
    auto sp = spawn_pty(spec, initial, opts.term);
    if (!sp) {
        set_state(*slot, SessionState::Closed);
        log_warn(source + ": " + sp.error->message);
        events.send(ErrorEvent{sp.error->kind, source, sp.error->message});
        return;
    }
    auto child = sp.pty.child;
    ctx.adopt(child);
    UniqueFd master = std::move(sp.pty.master);
    int fl = fcntl(master.get(), F_GETFL);
    if (fl >= 0) fcntl(master.get(), F_SETFL, fl | O_NONBLOCK);
    {
        std::lock_guard<std::mutex> lk(slot->mutex);
        if (slot->state == SessionState::Starting) slot->state = SessionState::Running;
    }
    log_info(source + " running, pid " + std::to_string(child->pid()));

    std::string to_write;
    char buf[4096];
    for (;;) {
        if (ctx.cancelled()) break;
        bool close_now = false;
        std::optional<TermSize> resize;
        {
            std::lock_guard<std::mutex> lk(slot->mutex);
            while (!slot->input.empty()) { to_write += slot->input.front(); slot->input.pop_front(); }
            resize = slot->pending_resize;
            slot->pending_resize.reset();
            close_now = slot->close_requested;
        }
        if (close_now) break;
        if (resize) {
            if (set_window_size(master.get(), *resize)) {
                std::lock_guard<std::mutex> lk(slot->mutex);
                slot->size = *resize;
            } else {
                events.send(ErrorEvent{ErrorKind::IOFailure, source, std::string("resize: ") + std::strerror(errno)});
            }
        }

        pollfd pfd[2];
        pfd[0] = pollfd{master.get(), static_cast<short>(POLLIN | (to_write.empty() ? 0 : POLLOUT)), 0};
        pfd[1] = pollfd{slot->wake.get(), POLLIN, 0};
        int r = poll(pfd, 2, static_cast<int>(cancel_poll_interval.count()));
        if (r < 0) {
            if (errno == EINTR) continue;
            events.send(ErrorEvent{ErrorKind::IOFailure, source, std::string("poll: ") + std::strerror(errno)});
            break;
        }
        if (pfd[1].revents & POLLIN) {
            std::uint64_t counter;
            while (::read(slot->wake.get(), &counter, sizeof(counter)) < 0 && errno == EINTR) {}
        }
        bool hung_up = false;
        if (pfd[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t got = ::read(master.get(), buf, sizeof(buf));
            if (got > 0) {
                events.send(TerminalOutput{slot->id, std::string(buf, static_cast<size_t>(got))});
            } else if (got == 0 || errno == EIO) {
                // Linux reports EIO on the master once the last slave fd is closed.
                hung_up = true;
            } else if (errno != EINTR && errno != EAGAIN) {
                events.send(ErrorEvent{ErrorKind::IOFailure, source, std::string("read: ") + std::strerror(errno)});
                break;
            }
        }
        if (hung_up) break;
        if (!to_write.empty() && (pfd[0].revents & POLLOUT)) {
            ssize_t put = ::write(master.get(), to_write.data(), to_write.size());
            if (put > 0) to_write.erase(0, static_cast<size_t>(put));
            else if (put < 0 && errno != EINTR && errno != EAGAIN) {
                events.send(ErrorEvent{ErrorKind::IOFailure, source, std::string("write: ") + std::strerror(errno)});
                break;
            }
        }
    }

    set_state(*slot, SessionState::Closing);
    // Closing the master hangs up the session: the shell receives SIGHUP.
    master.reset();
    ExitStatus st = child->wait();
    {
        std::lock_guard<std::mutex> lk(slot->mutex);
        slot->state = SessionState::Closed;
        slot->input.clear();
    }
    log_info(source + " closed: " + describe(st));
    events.send(ProcessExited{source, st});
}

TerminalSessionBroker::TerminalSessionBroker(Supervisor& sup, EventSender events, TerminalOptions opts)
    : m_sup(sup), m_events(std::move(events)), m_opts(std::move(opts)) {}

SessionHandle TerminalSessionBroker::open(TermSize initial_size) {
    auto slot = std::make_shared<detail::SessionSlot>();
    slot->size = initial_size;
    slot->wake = UniqueFd(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK));
    int wake_errno = errno;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        slot->id = m_next_id++;
        m_sessions.emplace(slot->id, slot);
    }
    const std::string source = terminal_source_id(slot->id);
    if (initial_size.rows == 0 || initial_size.cols == 0) {
        set_state(*slot, SessionState::Closed);
        m_events.send(ErrorEvent{ErrorKind::SpawnFailure, source, "terminal size must be positive"});
        return SessionHandle(slot);
    }
    if (!slot->wake) {
        set_state(*slot, SessionState::Closed);
        m_events.send(ErrorEvent{ErrorKind::SpawnFailure, source, std::string("eventfd: ") + std::strerror(wake_errno)});
        return SessionHandle(slot);
    }
    auto id = m_sup.launch(source + ": " + m_opts.shell, CancellationFlag{},
        [slot, opts = m_opts, events = m_events](WorkerContext& ctx) {
            run_session(slot, opts, ctx, events);
        });
    if (!id) {
        set_state(*slot, SessionState::Closed);
        m_events.send(ErrorEvent{ErrorKind::Rejected, source, "supervisor is shutting down"});
    } else {
        std::lock_guard<std::mutex> lk(slot->mutex);
        slot->worker = *id;
    }
    return SessionHandle(slot);
}

std::shared_ptr<detail::SessionSlot> TerminalSessionBroker::find(SessionId id) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_sessions.find(id);
    return it == m_sessions.end() ? nullptr : it->second;
}

MaybeFailure TerminalSessionBroker::write(SessionId id, std::string bytes) {
    auto slot = find(id);
    if (!slot) return not_running(id);
    return queue_input(*slot, std::move(bytes));
}

MaybeFailure TerminalSessionBroker::resize(SessionId id, TermSize size) {
    if (size.rows == 0 || size.cols == 0)
        return Failure{ErrorKind::Rejected, "terminal size must be positive"};
    auto slot = find(id);
    if (!slot) return not_running(id);
    {
        std::lock_guard<std::mutex> lk(slot->mutex);
        if (slot->state == SessionState::Closing || slot->state == SessionState::Closed) return not_running(id);
        slot->pending_resize = size;
    }
    slot->notify();
    return std::nullopt;
}

MaybeFailure TerminalSessionBroker::close(SessionId id) {
    auto slot = find(id);
    if (!slot) return not_running(id);
    std::optional<WorkerId> worker;
    {
        std::lock_guard<std::mutex> lk(slot->mutex);
        if (slot->state == SessionState::Closed) return not_running(id);
        slot->close_requested = true;
        if (slot->state != SessionState::Closing) slot->state = SessionState::Closing;
        worker = slot->worker;
    }
    slot->notify();
    if (worker) m_sup.request_stop(*worker, m_opts.close_grace);
    return std::nullopt;
}

std::optional<SessionState> TerminalSessionBroker::state(SessionId id) const {
    auto slot = find(id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lk(slot->mutex);
    return slot->state;
}

std::optional<TermSize> TerminalSessionBroker::size(SessionId id) const {
    auto slot = find(id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lk(slot->mutex);
    return slot->size;
}

std::size_t TerminalSessionBroker::prune_closed() {
    std::lock_guard<std::mutex> lk(m_mutex);
    std::size_t dropped = 0;
    for (auto it = m_sessions.begin(); it != m_sessions.end();) {
        bool closed;
        {
            std::lock_guard<std::mutex> slot_lk(it->second->mutex);
            closed = it->second->state == SessionState::Closed;
        }
        if (closed) { it = m_sessions.erase(it); ++dropped; }
        else ++it;
    }
    return dropped;
}

std::vector<SessionId> TerminalSessionBroker::sessions() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    std::vector<SessionId> out;
    for (auto &kv : m_sessions) out.push_back(kv.first);
    return out;
}

} // namespace dockstack
