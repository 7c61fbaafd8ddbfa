/*
 * Log stream worker implementation - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/stream/log_stream.hpp>
#include <dockstack/util/log.hpp>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace dockstack {

void run_log_stream(const std::string& source_id, ChildProcess& child, const CancellationFlag& cancel,
                    const EventSender& events) {
    UniqueFd fd = child.take_stdout();
    std::string pending;
    char buf[4096];
    bool stop = !fd;
    if (!fd) {
        events.send(ErrorEvent{ErrorKind::IOFailure, source_id, "child has no output pipe"});
    }
    while (!stop) {
        if (cancel.is_cancelled()) break;
        pollfd pfd{fd.get(), POLLIN, 0};
        int r = poll(&pfd, 1, static_cast<int>(cancel_poll_interval.count()));
        if (r < 0) {
            if (errno == EINTR) continue;
            events.send(ErrorEvent{ErrorKind::IOFailure, source_id, std::string("poll: ") + std::strerror(errno)});
            break;
        }
        if (r == 0) continue;
        ssize_t got = ::read(fd.get(), buf, sizeof(buf));
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            log_warn("log stream " + source_id + ": read failed: " + std::strerror(errno));
            events.send(ErrorEvent{ErrorKind::IOFailure, source_id, std::string("read: ") + std::strerror(errno)});
            break;
        }
        if (got == 0) {
            if (!pending.empty() && !cancel.is_cancelled()) events.send(ProcessOutputLine{source_id, pending});
            break;
        }
        pending.append(buf, static_cast<size_t>(got));
        size_t start = 0, nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            if (cancel.is_cancelled()) { stop = true; break; }
            std::string line = pending.substr(start, nl - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            events.send(ProcessOutputLine{source_id, std::move(line)});
            start = nl + 1;
        }
        pending.erase(0, start);
    }
    // Dropping the read end is the cooperative stop: the writer gets SIGPIPE.
    // A quiet writer is killed once its supervisor stop deadline passes.
    fd.reset();
    ExitStatus st = child.wait();
    log_debug("log stream " + source_id + " ended: " + describe(st));
    events.send(ProcessExited{source_id, st});
}

std::optional<WorkerId> LogStreamWorker::start(std::string source_id, std::shared_ptr<ChildProcess> child,
                                               CancellationFlag cancel) {
    auto id = m_sup.launch("log stream " + source_id, cancel,
        [events = m_events, source_id, child](WorkerContext& ctx) {
            run_log_stream(source_id, *child, ctx.cancel(), events);
        }, child);
    if (!id) {
        m_events.send(ErrorEvent{ErrorKind::Rejected, source_id, "supervisor is shutting down"});
    }
    return id;
}

std::optional<WorkerId> LogStreamWorker::follow(std::string source_id, CommandSpec spec, CancellationFlag cancel) {
    auto id = m_sup.launch("log stream " + source_id + ": " + display_command(spec), cancel,
        [events = m_events, source_id, spec = std::move(spec)](WorkerContext& ctx) {
            SpawnOptions opts;
            opts.merge_stderr = true;
            auto sp = spawn_process(spec, opts);
            if (!sp) {
                log_warn("log stream " + source_id + ": " + sp.error->message);
                events.send(ErrorEvent{sp.error->kind, source_id, sp.error->message});
                return;
            }
            ctx.adopt(sp.child);
            run_log_stream(source_id, *sp.child, ctx.cancel(), events);
        });
    if (!id) m_events.send(ErrorEvent{ErrorKind::Rejected, source_id, "supervisor is shutting down"});
    return id;
}

} // namespace dockstack
