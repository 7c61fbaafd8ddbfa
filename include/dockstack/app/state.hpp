/*
 * Consumer-side state snapshot - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/event.hpp>
#include <dockstack/terminal/session_broker.hpp>
#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dockstack {

enum class ServiceStatus { Stopped, Starting, Running, Stopping, Error };

const char* to_string(ServiceStatus status);

// What a request id was issued for; decides how its CommandResult is folded.
enum class RequestKind { ListContainers, ComposeUp, ComposeDown, ComposeRestart, Stats, Other };

struct LogEntry {
    std::string source_id;
    std::string text;
};

struct TerminalView {
    SessionState state = SessionState::Starting;
    std::string scrollback;
    std::optional<ExitStatus> exit;
};

struct StateLimits {
    std::size_t log_max = 5000;           // trim when exceeded...
    std::size_t log_keep = 3000;          // ...down to this many entries
    std::size_t scrollback_max = 64 * 1024;
    std::size_t error_max = 1000;         // same trimming for errors
    std::size_t error_keep = 500;
    std::size_t result_max = 256;         // oldest finished requests go first
    std::size_t exited_max = 256;         // oldest exits go first
    std::size_t closed_terminal_max = 16; // lowest closed session ids go first
};

// Everything the render loop reads. Only the consumer thread touches it.
struct StateSnapshot {
    ServiceStatus service = ServiceStatus::Stopped;
    std::string service_detail;
    std::vector<ParsedRecord> containers;
    std::vector<ParsedRecord> stats;
    std::deque<LogEntry> logs;
    std::map<SessionId, TerminalView> terminals;
    std::optional<EngineStatus> engine;
    std::map<RequestId, CommandResult> results;
    std::map<std::string, ExitStatus> exited;
    std::deque<ErrorEvent> errors;
};

class StateStore {
public:
    explicit StateStore(StateLimits limits = {});

    void track(RequestId id, RequestKind kind);
    void set_service_status(ServiceStatus status, std::string detail = {});
    void note_session(SessionId id, SessionState state);
    void append_log(std::string source_id, std::string text);

    // Folds one event. Every alternative of Event is handled.
    void apply(const Event& ev);

    const StateSnapshot& snapshot() const { return m_state; }
    const StateLimits& limits() const { return m_limits; }

private:
    void apply_result(const CommandResult& res);
    void record_error(ErrorEvent err);
    void record_result(const CommandResult& res);
    void record_exit(const std::string& source_id, ExitStatus status);
    void trim_closed_terminals();

    StateLimits m_limits;
    StateSnapshot m_state;
    std::map<RequestId, RequestKind> m_kinds;
    std::deque<std::string> m_exit_order;
};

// Session id for a "terminal:<id>" source, nullopt for anything else.
std::optional<SessionId> parse_terminal_source(const std::string& source_id);

} // namespace dockstack
