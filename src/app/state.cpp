/*
 * Consumer-side state snapshot - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/app/state.hpp>
#include <sstream>

namespace dockstack {

const char* to_string(ServiceStatus status) {
    switch (status) {
        case ServiceStatus::Stopped: return "stopped";
        case ServiceStatus::Starting: return "starting";
        case ServiceStatus::Running: return "running";
        case ServiceStatus::Stopping: return "stopping";
        case ServiceStatus::Error: return "error";
    }
    return "unknown";
}

std::optional<SessionId> parse_terminal_source(const std::string& source_id) {
    static const std::string prefix = "terminal:";
    if (source_id.compare(0, prefix.size(), prefix) != 0 || source_id.size() == prefix.size()) return std::nullopt;
    SessionId id = 0;
    for (size_t i = prefix.size(); i < source_id.size(); ++i) {
        char c = source_id[i];
        if (c < '0' || c > '9') return std::nullopt;
        id = id * 10 + static_cast<SessionId>(c - '0');
    }
    return id;
}

StateStore::StateStore(StateLimits limits) : m_limits(limits) {
    if (m_limits.log_keep > m_limits.log_max) m_limits.log_keep = m_limits.log_max;
    if (m_limits.error_keep > m_limits.error_max) m_limits.error_keep = m_limits.error_max;
}

void StateStore::track(RequestId id, RequestKind kind) { m_kinds[id] = kind; }

void StateStore::set_service_status(ServiceStatus status, std::string detail) {
    m_state.service = status;
    m_state.service_detail = std::move(detail);
}

void StateStore::note_session(SessionId id, SessionState state) { m_state.terminals[id].state = state; }

void StateStore::append_log(std::string source_id, std::string text) {
    m_state.logs.push_back(LogEntry{std::move(source_id), std::move(text)});
    if (m_state.logs.size() > m_limits.log_max) {
        m_state.logs.erase(m_state.logs.begin(),
                           m_state.logs.begin() + static_cast<std::ptrdiff_t>(m_state.logs.size() - m_limits.log_keep));
    }
}

void StateStore::record_error(ErrorEvent err) {
    m_state.errors.push_back(std::move(err));
    if (m_state.errors.size() > m_limits.error_max) {
        m_state.errors.erase(m_state.errors.begin(),
                             m_state.errors.begin() + static_cast<std::ptrdiff_t>(m_state.errors.size() - m_limits.error_keep));
    }
}

void StateStore::record_result(const CommandResult& res) {
    m_state.results[res.request_id] = res;
    // Requests still tracked (in flight, or the stats sampler's) are kept.
    for (auto it = m_state.results.begin(); m_state.results.size() > m_limits.result_max && it != m_state.results.end();) {
        if (m_kinds.count(it->first)) ++it;
        else it = m_state.results.erase(it);
    }
}

void StateStore::record_exit(const std::string& source_id, ExitStatus status) {
    auto [it, inserted] = m_state.exited.insert_or_assign(source_id, status);
    if (inserted) m_exit_order.push_back(it->first);
    while (m_exit_order.size() > m_limits.exited_max) {
        m_state.exited.erase(m_exit_order.front());
        m_exit_order.pop_front();
    }
}

void StateStore::trim_closed_terminals() {
    std::size_t closed = 0;
    for (auto &kv : m_state.terminals) if (kv.second.state == SessionState::Closed) ++closed;
    for (auto it = m_state.terminals.begin(); closed > m_limits.closed_terminal_max && it != m_state.terminals.end();) {
        if (it->second.state == SessionState::Closed) { it = m_state.terminals.erase(it); --closed; }
        else ++it;
    }
}

void StateStore::apply_result(const CommandResult& res) {
    auto it = m_kinds.find(res.request_id);
    RequestKind kind = it == m_kinds.end() ? RequestKind::Other : it->second;
    const std::string context = "request " + std::to_string(res.request_id);

    if (const Failure* f = res.failure()) {
        record_error(ErrorEvent{f->kind, context, f->message});
        switch (kind) {
            case RequestKind::ComposeUp:
            case RequestKind::ComposeDown:
            case RequestKind::ComposeRestart:
                set_service_status(ServiceStatus::Error, f->message);
                append_log("dockstack", f->message);
                break;
            default: break;
        }
    } else if (const CommandOutput* out = res.output()) {
        for (auto &pe : out->parse_errors) {
            record_error(ErrorEvent{ErrorKind::ParseFailure, context,
                                    "line " + std::to_string(pe.line_no) + ": " + pe.message});
        }
        switch (kind) {
            case RequestKind::ListContainers: m_state.containers = out->records; break;
            case RequestKind::Stats: m_state.stats = out->records; break;
            case RequestKind::ComposeUp:
            case RequestKind::ComposeRestart:
            case RequestKind::ComposeDown: {
                // compose reports progress on stderr
                std::istringstream in(out->stderr_text + out->stdout_text);
                std::string line;
                while (std::getline(in, line)) if (!line.empty()) append_log("compose", line);
                if (kind == RequestKind::ComposeDown) set_service_status(ServiceStatus::Stopped);
                else set_service_status(ServiceStatus::Running);
                break;
            }
            case RequestKind::Other: break;
        }
    }
    // The sampler reuses one id for every sample.
    if (kind != RequestKind::Stats) m_kinds.erase(res.request_id);
    record_result(res);
}

void StateStore::apply(const Event& ev) {
    std::visit(overloaded{
        [&](const ProcessOutputLine& e) { append_log(e.source_id, e.text); },
        [&](const ProcessExited& e) {
            record_exit(e.source_id, e.status);
            if (auto sid = parse_terminal_source(e.source_id)) {
                auto &view = m_state.terminals[*sid];
                view.state = SessionState::Closed;
                view.exit = e.status;
                trim_closed_terminals();
            } else {
                append_log(e.source_id, "[" + e.source_id + " ended: " + describe(e.status) + "]");
            }
        },
        [&](const CommandResult& e) { apply_result(e); },
        [&](const TerminalOutput& e) {
            auto &view = m_state.terminals[e.session_id];
            if (view.state == SessionState::Starting) view.state = SessionState::Running;
            view.scrollback += e.bytes;
            if (view.scrollback.size() > m_limits.scrollback_max)
                view.scrollback.erase(0, view.scrollback.size() - m_limits.scrollback_max);
        },
        [&](const ErrorEvent& e) {
            record_error(e);
            if (auto sid = parse_terminal_source(e.context)) {
                if (e.kind == ErrorKind::SpawnFailure || e.kind == ErrorKind::Rejected) {
                    m_state.terminals[*sid].state = SessionState::Closed;
                    trim_closed_terminals();
                }
            }
        },
        [&](const EngineStatus& e) {
            m_state.engine = e;
            if (!e.available) record_error(ErrorEvent{ErrorKind::SpawnFailure, "engine", e.detail});
        },
    }, ev);
}

} // namespace dockstack
