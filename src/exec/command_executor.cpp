/*
 * Command executor implementation - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/exec/command_executor.hpp>
#include <dockstack/util/log.hpp>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace dockstack {

static std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b = s.size(); while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b - a);
}

CaptureResult capture_output(const CommandSpec& spec, const CancellationFlag& cancel,
                             const std::function<void(std::shared_ptr<ChildProcess>)>& on_spawn) {
    CaptureResult cap;
    auto sp = spawn_process(spec);
    if (!sp) { cap.error = sp.error; return cap; }
    auto child = sp.child;
    if (on_spawn) on_spawn(child);

    UniqueFd fds[2] = {child->take_stdout(), child->take_stderr()};
    std::string* sinks[2] = {&cap.stdout_text, &cap.stderr_text};
    char buf[4096];
    while (fds[0] || fds[1]) {
        if (cancel.is_cancelled()) { cap.cancelled = true; break; }
        pollfd pfd[2]; int map[2]; nfds_t n = 0;
        for (int i = 0; i < 2; ++i) {
            if (!fds[i]) continue;
            pfd[n] = pollfd{fds[i].get(), POLLIN, 0}; map[n] = i; ++n;
        }
        int r = poll(pfd, n, static_cast<int>(cancel_poll_interval.count()));
        if (r < 0) {
            if (errno == EINTR) continue;
            cap.error = Failure{ErrorKind::IOFailure, std::string("poll: ") + std::strerror(errno)};
            break;
        }
        for (nfds_t k = 0; k < n; ++k) {
            if (!(pfd[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int i = map[k];
            ssize_t got = ::read(fds[i].get(), buf, sizeof(buf));
            if (got > 0) sinks[i]->append(buf, static_cast<size_t>(got));
            else if (got == 0) fds[i].reset();
            else if (errno != EINTR && errno != EAGAIN) {
                cap.error = Failure{ErrorKind::IOFailure, std::string("read: ") + std::strerror(errno)};
                fds[i].reset();
            }
        }
    }
    // Closing our ends asks a still-writing child to stop (SIGPIPE/EPIPE).
    fds[0].reset(); fds[1].reset();
    cap.status = child->wait();
    return cap;
}

CommandResult make_command_result(RequestId request_id, const CommandSpec& spec, const CaptureResult& cap,
                                  const std::optional<RecordSchema>& schema) {
    CommandResult res;
    res.request_id = request_id;
    if (cap.error && cap.error->kind == ErrorKind::SpawnFailure) { res.outcome = *cap.error; return res; }
    if (cap.cancelled) {
        res.outcome = Failure{ErrorKind::Cancelled, display_command(spec) + ": cancelled"};
        return res;
    }
    if (cap.error) { res.outcome = *cap.error; return res; }

    CommandOutput out;
    out.stdout_text = cap.stdout_text;
    out.stderr_text = cap.stderr_text;
    out.status = cap.status;
    if (schema) {
        auto batch = parse_records(cap.stdout_text, *schema);
        out.records = std::move(batch.records);
        out.parse_errors = std::move(batch.errors);
    }
    if (!cap.status.success() && out.records.empty()) {
        std::string detail = trim(cap.stderr_text);
        if (detail.empty()) detail = describe(cap.status);
        res.outcome = Failure{ErrorKind::ExitFailure, display_command(spec) + ": " + detail};
        return res;
    }
    res.outcome = std::move(out);
    return res;
}

std::optional<WorkerId> CommandExecutor::execute(RequestId request_id, std::string program,
                                                 std::vector<std::string> args,
                                                 std::optional<RecordSchema> schema, std::string working_dir) {
    CommandSpec spec{std::move(program), std::move(args), std::move(working_dir), {}};
    return execute(request_id, std::move(spec), std::move(schema));
}

std::optional<WorkerId> CommandExecutor::execute(RequestId request_id, CommandSpec spec,
                                                 std::optional<RecordSchema> schema) {
    std::vector<CommandSpec> steps;
    steps.push_back(std::move(spec));
    return execute_sequence(request_id, std::move(steps), std::move(schema));
}

std::optional<WorkerId> CommandExecutor::execute_sequence(RequestId request_id, std::vector<CommandSpec> steps,
                                                          std::optional<RecordSchema> schema) {
    if (steps.empty()) {
        m_events.send(CommandResult{request_id, Failure{ErrorKind::SpawnFailure, "empty command sequence"}});
        return std::nullopt;
    }
    std::string label = "request " + std::to_string(request_id) + ": " + display_command(steps.front());
    if (steps.size() > 1) label += " (+" + std::to_string(steps.size() - 1) + ")";
    auto id = m_sup.launch(label, CancellationFlag{},
        [events = m_events, steps = std::move(steps), schema = std::move(schema), request_id](WorkerContext& ctx) {
            CommandResult res;
            for (auto &spec : steps) {
                auto cap = capture_output(spec, ctx.cancel(), [&](std::shared_ptr<ChildProcess> c){ ctx.adopt(std::move(c)); });
                res = make_command_result(request_id, spec, cap, schema);
                if (!res.ok()) break;
            }
            if (auto f = res.failure()) log_warn("request " + std::to_string(request_id) + " failed: " + f->message);
            events.send(std::move(res));
        });
    if (!id) m_events.send(CommandResult{request_id, Failure{ErrorKind::Rejected, "supervisor is shutting down"}});
    return id;
}

} // namespace dockstack
