/*
 * Event payloads - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace dockstack {

using RequestId = std::uint64_t;
using SessionId = std::uint64_t;

// Decoded waitpid() status. signal != 0 means the process was killed by it.
struct ExitStatus {
    int code = -1;
    int signal = 0;
    bool success() const { return signal == 0 && code == 0; }
    bool signaled() const { return signal != 0; }
};

std::string describe(const ExitStatus& status);

// Field name -> value, one per schema field.
using ParsedRecord = std::map<std::string, std::string>;

struct ParseError {
    std::size_t line_no = 0; // 1-based line in the command output
    std::string line;
    std::string message;
};

struct CommandOutput {
    std::vector<ParsedRecord> records;
    std::vector<ParseError> parse_errors;
    std::string stdout_text;
    std::string stderr_text;
    ExitStatus status;
};

struct ProcessOutputLine {
    std::string source_id;
    std::string text;
};

struct ProcessExited {
    std::string source_id;
    ExitStatus status;
};

struct CommandResult {
    RequestId request_id = 0;
    std::variant<CommandOutput, Failure> outcome;

    bool ok() const { return std::holds_alternative<CommandOutput>(outcome); }
    const CommandOutput* output() const { return std::get_if<CommandOutput>(&outcome); }
    const Failure* failure() const { return std::get_if<Failure>(&outcome); }
};

struct TerminalOutput {
    SessionId session_id = 0;
    std::string bytes; // raw chunk, boundaries carry no meaning
};

struct ErrorEvent {
    ErrorKind kind;
    std::string context;
    std::string message;
};

struct EngineStatus {
    bool available = false;
    bool compose_plugin = false;
    std::string api_version;
    std::string detail;
};

using Event = std::variant<ProcessOutputLine, ProcessExited, CommandResult,
                           TerminalOutput, ErrorEvent, EngineStatus>;

// Source id used in ProcessExited for terminal session `id`.
std::string terminal_source_id(SessionId id);

// Visitor helper for exhaustive std::visit over Event.
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace dockstack
