/*
 * Controller: the consumer-facing command surface - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/app/state.hpp>
#include <dockstack/config/config.hpp>
#include <dockstack/core/event_channel.hpp>
#include <dockstack/engine/engine_cli.hpp>
#include <dockstack/engine/engine_probe.hpp>
#include <dockstack/exec/command_executor.hpp>
#include <dockstack/monitor/stats_sampler.hpp>
#include <dockstack/stream/log_stream.hpp>
#include <dockstack/supervisor/supervisor.hpp>
#include <dockstack/terminal/session_broker.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dockstack {

// Prefix of the compose log followers' source ids: each one gets "compose-logs:<n>".
inline const char* const compose_logs_source = "compose-logs";

// Owns the channel, the supervisor and every worker kind. All methods are
// meant for the single consumer thread and return without waiting on I/O.
class Controller {
public:
    explicit Controller(Config cfg);
    ~Controller();
    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    std::optional<WorkerId> check_engine();
    std::optional<RequestId> refresh_containers();
    std::optional<RequestId> compose_up();
    std::optional<RequestId> compose_down();
    std::optional<RequestId> compose_restart();
    // Replaces a running follower: the old one is stopped first.
    bool follow_logs();
    // Asks the supervisor to stop the follower; it is killed if still
    // running after the grace period.
    void stop_logs();
    // Same request id for every sample; a second call returns the running one.
    std::optional<RequestId> start_stats();
    void stop_stats();
    SessionHandle open_terminal(TermSize size = {});
    // Runs an arbitrary command through the executor (argv only).
    std::optional<RequestId> run(CommandSpec spec, std::optional<RecordSchema> schema = std::nullopt);

    // Drains the channel once, folds every event, collects finished workers.
    std::vector<Event> tick();

    ShutdownReport shutdown();
    bool is_shut_down() const { return m_shut_down; }

    const StateSnapshot& state() const { return m_store.snapshot(); }
    TerminalSessionBroker& terminals() { return m_terminals; }
    Supervisor& supervisor() { return m_sup; }
    const EngineCli& cli() const { return m_cli; }
    const Config& config() const { return m_cfg; }
    bool following_logs() const { return m_logs_active; }
    // Source id of the current (or last) log follower.
    const std::string& logs_source() const { return m_logs_source; }
    bool sampling_stats() const { return m_stats_request.has_value(); }

private:
    CommandSpec with_engine_env(CommandSpec spec) const;
    RequestId next_request(RequestKind kind);
    void observe(const Event& ev);

    Config m_cfg;
    std::string m_project_id;
    EngineCli m_cli;
    EventChannel m_channel;
    Supervisor m_sup;
    CommandExecutor m_exec;
    LogStreamWorker m_logs;
    TerminalSessionBroker m_terminals;
    StatsSampler m_sampler;
    StateStore m_store;
    RequestId m_next_request = 1;
    std::string m_api_version;
    CancellationFlag m_logs_cancel;
    std::optional<WorkerId> m_logs_worker;
    std::string m_logs_source;
    unsigned m_logs_generation = 0;
    bool m_logs_active = false;
    CancellationFlag m_stats_cancel;
    std::optional<WorkerId> m_stats_worker;
    std::optional<RequestId> m_stats_request;
    bool m_shut_down = false;
};

} // namespace dockstack
