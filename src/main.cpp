/*
 * DockStack command line driver
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/app/controller.hpp>
#include <dockstack/config/config.hpp>
#include <dockstack/term/raw_mode.hpp>
#include <dockstack/util/log.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <poll.h>
#include <thread>
#include <unistd.h>

using namespace dockstack;

static volatile std::sig_atomic_t g_stop = 0;
static volatile std::sig_atomic_t g_winch = 0;
static void stop_handler(int) { g_stop = 1; }
static void winch_handler(int) { g_winch = 1; }

static constexpr std::chrono::milliseconds frame_interval{16};
static constexpr unsigned char detach_key = 0x1d; // ^]

static void usage(std::ostream& out) {
    out << "usage: dockstack [--config PATH] [-v] <probe|ps|up|down|restart|logs|stats|shell>\n";
}

static void print_records(const std::vector<ParsedRecord>& records, const std::vector<std::string>& fields) {
    std::vector<size_t> width(fields.size());
    for (size_t i = 0; i < fields.size(); ++i) width[i] = fields[i].size();
    for (auto &r : records)
        for (size_t i = 0; i < fields.size(); ++i) {
            auto it = r.find(fields[i]);
            if (it != r.end()) width[i] = std::max(width[i], it->second.size());
        }
    for (size_t i = 0; i < fields.size(); ++i) std::cout << std::left << std::setw((int)width[i] + 2) << fields[i];
    std::cout << "\n";
    for (auto &r : records) {
        for (size_t i = 0; i < fields.size(); ++i) {
            auto it = r.find(fields[i]);
            std::cout << std::left << std::setw((int)width[i] + 2) << (it == r.end() ? "" : it->second);
        }
        std::cout << "\n";
    }
}

static void print_error(const ErrorEvent& e) {
    std::cerr << "dockstack: " << to_string(e.kind) << " [" << e.context << "] " << e.message << "\n";
}

// Shared by every command: prints what it is not specifically waiting for.
static void print_event(const Event& ev, bool echo_lines) {
    std::visit(overloaded{
        [&](const ProcessOutputLine& e) { if (echo_lines) std::cout << e.text << "\n"; },
        [&](const ProcessExited& e) { log_info(e.source_id + " exited: " + describe(e.status)); },
        [&](const CommandResult&) {},
        [&](const TerminalOutput&) {},
        [&](const ErrorEvent& e) { print_error(e); },
        [&](const EngineStatus&) {},
    }, ev);
}

static int report_result(const CommandResult& res, const std::vector<std::string>& fields) {
    if (const Failure* f = res.failure()) {
        std::cerr << "dockstack: " << to_string(f->kind) << ": " << f->message << "\n";
        return 1;
    }
    const CommandOutput* out = res.output();
    if (!fields.empty()) print_records(out->records, fields);
    else {
        std::cout << out->stdout_text;
        std::cerr << out->stderr_text;
    }
    for (auto &pe : out->parse_errors)
        std::cerr << "dockstack: line " << pe.line_no << ": " << pe.message << ": " << pe.line << "\n";
    return out->status.success() ? 0 : 1;
}

static void frame_sleep() { std::this_thread::sleep_for(frame_interval); }

// One-shot command: waits, frame by frame, for the CommandResult of `rid`.
static int await_result(Controller& ctl, std::optional<RequestId> rid, const std::vector<std::string>& fields) {
    if (!rid) return 1;
    while (!g_stop) {
        for (auto &ev : ctl.tick()) {
            if (auto r = std::get_if<CommandResult>(&ev); r && r->request_id == *rid) return report_result(*r, fields);
            print_event(ev, false);
        }
        frame_sleep();
    }
    return 130;
}

static int cmd_probe(Controller& ctl) {
    if (!ctl.check_engine()) return 1;
    while (!g_stop) {
        for (auto &ev : ctl.tick()) {
            if (auto st = std::get_if<EngineStatus>(&ev)) {
                std::cout << "engine: " << (st->available ? "available" : "unavailable") << "\n";
                if (!st->api_version.empty()) std::cout << "api version: " << st->api_version << "\n";
                std::cout << "compose: " << (st->compose_plugin ? "plugin" : "standalone") << "\n";
                std::cout << st->detail << "\n";
                return st->available ? 0 : 1;
            }
            print_event(ev, false);
        }
        frame_sleep();
    }
    return 130;
}

static int cmd_logs(Controller& ctl) {
    if (!ctl.follow_logs()) return 1;
    int rc = 0;
    while (!g_stop) {
        bool ended = false;
        for (auto &ev : ctl.tick()) {
            if (auto ex = std::get_if<ProcessExited>(&ev); ex && ex->source_id == ctl.logs_source()) {
                ended = true;
                rc = ex->status.success() ? 0 : 1;
            }
            print_event(ev, true);
        }
        if (ended) return rc;
        frame_sleep();
    }
    return 0;
}

static int cmd_stats(Controller& ctl) {
    auto rid = ctl.start_stats();
    if (!rid) return 1;
    auto fields = EngineCli::stats_schema().fields;
    while (!g_stop) {
        for (auto &ev : ctl.tick()) {
            if (auto r = std::get_if<CommandResult>(&ev); r && r->request_id == *rid) {
                if (isatty(STDOUT_FILENO)) std::cout << "\x1b[H\x1b[2J";
                report_result(*r, fields);
                std::cout.flush();
                continue;
            }
            print_event(ev, false);
        }
        frame_sleep();
    }
    return 0;
}

static int cmd_shell(Controller& ctl) {
    TermSize size = terminal_size(STDIN_FILENO).value_or(TermSize{});
    SessionHandle session = ctl.open_terminal(size);
    const std::string source = terminal_source_id(session.id());
    std::signal(SIGWINCH, winch_handler);
    RawMode raw(STDIN_FILENO);
    int rc = 0;
    bool done = false;
    bool detached = false;
    char buf[1024];
    while (!done) {
        if (g_stop && !detached) {
            detached = true;
            if (auto f = ctl.terminals().close(session.id())) log_debug(f->message);
        }
        if (g_winch) {
            g_winch = 0;
            if (auto sz = terminal_size(STDIN_FILENO)) {
                if (auto f = ctl.terminals().resize(session.id(), *sz)) log_debug(f->message);
            }
        }
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        if (!detached && poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN)) {
            ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) {
                detached = true;
                if (auto f = ctl.terminals().close(session.id())) log_debug(f->message);
            } else {
                std::string bytes(buf, static_cast<size_t>(n));
                auto pos = bytes.find(static_cast<char>(detach_key));
                if (pos != std::string::npos) {
                    bytes.resize(pos);
                    detached = true;
                }
                if (!bytes.empty()) {
                    if (auto f = session.send(std::move(bytes))) log_debug(f->message);
                }
                if (detached) {
                    if (auto f = ctl.terminals().close(session.id())) log_debug(f->message);
                }
            }
        }
        for (auto &ev : ctl.tick()) {
            if (auto out = std::get_if<TerminalOutput>(&ev); out && out->session_id == session.id()) {
                std::cout.write(out->bytes.data(), static_cast<std::streamsize>(out->bytes.size()));
                std::cout.flush();
            } else if (auto ex = std::get_if<ProcessExited>(&ev); ex && ex->source_id == source) {
                done = true;
                rc = (ex->status.success() || detached) ? 0 : 1;
            } else if (auto err = std::get_if<ErrorEvent>(&ev); err && err->context == source
                       && (err->kind == ErrorKind::SpawnFailure || err->kind == ErrorKind::Rejected)) {
                raw.restore();
                print_error(*err);
                done = true;
                rc = 1;
            } else {
                print_event(ev, false);
            }
        }
        if (!done) frame_sleep();
    }
    raw.restore();
    return rc;
}

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);

    std::string config_path;
    std::string command;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (a == "-v" || a == "--verbose") verbose = true;
        else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
        else if (command.empty() && !a.empty() && a[0] != '-') command = a;
        else { usage(std::cerr); return 2; }
    }
    if (command.empty()) { usage(std::cerr); return 2; }

    if (config_path.empty()) config_path = default_config_path();
    ConfigLoad loaded = config_path.empty() ? ConfigLoad{} : load_config(config_path);
    auto env_warnings = apply_environment(loaded.config);
    if (verbose) loaded.config.log_level = LogLevel::Debug;
    set_log_level(loaded.config.log_level);
    for (auto &w : loaded.warnings)
        log_warn(loaded.path + ":" + std::to_string(w.line_no) + ": " + w.message);
    for (auto &w : env_warnings) log_warn(w.message);
    if (loaded.file_found) log_debug("config loaded from " + loaded.path);

    Controller ctl(loaded.config);
    int rc = 2;
    if (command == "probe") rc = cmd_probe(ctl);
    else if (command == "ps") rc = await_result(ctl, ctl.refresh_containers(), EngineCli::container_schema().fields);
    else if (command == "up") rc = await_result(ctl, ctl.compose_up(), {});
    else if (command == "down") rc = await_result(ctl, ctl.compose_down(), {});
    else if (command == "restart") rc = await_result(ctl, ctl.compose_restart(), {});
    else if (command == "logs") rc = cmd_logs(ctl);
    else if (command == "stats") rc = cmd_stats(ctl);
    else if (command == "shell") rc = cmd_shell(ctl);
    else usage(std::cerr);

    ShutdownReport rep = ctl.shutdown();
    if (rep.forced > 0) log_warn("forced termination of " + std::to_string(rep.forced) + " worker(s)");
    for (auto &e : ctl.state().errors) log_debug("error: " + e.context + ": " + e.message);
    return rc;
}
