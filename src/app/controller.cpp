/*
 * Controller: the consumer-facing command surface - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/app/controller.hpp>
#include <dockstack/util/log.hpp>

namespace dockstack {

static ComposeFlavor initial_flavor(ComposeMode mode) {
    return mode == ComposeMode::Standalone ? ComposeFlavor::Standalone : ComposeFlavor::Plugin;
}

static TerminalOptions terminal_options(const Config& cfg) {
    TerminalOptions opts;
    opts.shell = effective_shell(cfg);
    opts.term = cfg.term;
    opts.working_dir = cfg.project_dir;
    opts.close_grace = cfg.grace_period;
    return opts;
}

Controller::Controller(Config cfg)
    : m_cfg(std::move(cfg)),
      m_project_id(effective_project_id(m_cfg)),
      m_cli(m_cfg.docker_program, m_cfg.compose_program, initial_flavor(m_cfg.compose_mode), m_cfg.project_dir),
      m_sup(m_channel.sender(), m_cfg.grace_period),
      m_exec(m_sup, m_channel.sender()),
      m_logs(m_sup, m_channel.sender()),
      m_terminals(m_sup, m_channel.sender(), terminal_options(m_cfg)),
      m_sampler(m_sup, m_channel.sender()),
      m_store(StateLimits{m_cfg.log_buffer_max, m_cfg.log_buffer_keep, 64 * 1024}) {}

Controller::~Controller() { shutdown(); }

CommandSpec Controller::with_engine_env(CommandSpec spec) const {
    if (!m_api_version.empty()) spec.env.emplace_back("DOCKER_API_VERSION", m_api_version);
    return spec;
}

RequestId Controller::next_request(RequestKind kind) {
    RequestId id = m_next_request++;
    m_store.track(id, kind);
    return id;
}

std::optional<WorkerId> Controller::check_engine() {
    ProbeSettings settings;
    settings.socket_path = m_cfg.engine_socket;
    settings.timeout = m_cfg.probe_timeout;
    settings.compose_mode = m_cfg.compose_mode;
    EngineProbe probe(m_sup, m_channel.sender(), m_cli, settings);
    return probe.start();
}

std::optional<RequestId> Controller::refresh_containers() {
    RequestId id = next_request(RequestKind::ListContainers);
    if (!m_exec.execute(id, with_engine_env(m_cli.list_containers(m_project_id)), EngineCli::container_schema()))
        return std::nullopt;
    return id;
}

std::optional<RequestId> Controller::compose_up() {
    RequestId id = next_request(RequestKind::ComposeUp);
    m_store.set_service_status(ServiceStatus::Starting);
    m_store.append_log("dockstack", "starting services");
    if (!m_exec.execute(id, with_engine_env(m_cli.compose_up()))) return std::nullopt;
    return id;
}

std::optional<RequestId> Controller::compose_down() {
    RequestId id = next_request(RequestKind::ComposeDown);
    m_store.set_service_status(ServiceStatus::Stopping);
    m_store.append_log("dockstack", "stopping services");
    if (!m_exec.execute(id, with_engine_env(m_cli.compose_down()))) return std::nullopt;
    return id;
}

std::optional<RequestId> Controller::compose_restart() {
    RequestId id = next_request(RequestKind::ComposeRestart);
    m_store.set_service_status(ServiceStatus::Stopping);
    m_store.append_log("dockstack", "restarting services");
    std::vector<CommandSpec> steps{with_engine_env(m_cli.compose_down()), with_engine_env(m_cli.compose_up())};
    if (!m_exec.execute_sequence(id, std::move(steps))) return std::nullopt;
    return id;
}

bool Controller::follow_logs() {
    stop_logs();
    m_logs_cancel = CancellationFlag{};
    m_logs_source = std::string(compose_logs_source) + ":" + std::to_string(++m_logs_generation);
    m_logs_worker = m_logs.follow(m_logs_source, with_engine_env(m_cli.compose_logs_follow(m_cfg.log_tail)),
                                  m_logs_cancel);
    if (!m_logs_worker) return false;
    m_logs_active = true;
    return true;
}

void Controller::stop_logs() {
    if (m_logs_worker) m_sup.request_stop(*m_logs_worker, m_cfg.grace_period);
    m_logs_cancel.cancel();
    m_logs_worker.reset();
    m_logs_active = false;
}

std::optional<RequestId> Controller::start_stats() {
    if (m_stats_request) return m_stats_request;
    RequestId id = next_request(RequestKind::Stats);
    m_stats_cancel = CancellationFlag{};
    m_stats_worker = m_sampler.start(id, with_engine_env(m_cli.stats_snapshot()), EngineCli::stats_schema(),
                                     m_cfg.stats_interval, m_stats_cancel);
    if (!m_stats_worker) return std::nullopt;
    m_stats_request = id;
    return id;
}

void Controller::stop_stats() {
    if (!m_stats_request) return;
    if (m_stats_worker) m_sup.request_stop(*m_stats_worker, m_cfg.grace_period);
    m_stats_cancel.cancel();
    m_stats_worker.reset();
    m_stats_request.reset();
}

SessionHandle Controller::open_terminal(TermSize size) {
    SessionHandle h = m_terminals.open(size);
    m_store.note_session(h.id(), h.state());
    return h;
}

std::optional<RequestId> Controller::run(CommandSpec spec, std::optional<RecordSchema> schema) {
    RequestId id = next_request(RequestKind::Other);
    if (!m_exec.execute(id, with_engine_env(std::move(spec)), std::move(schema))) return std::nullopt;
    return id;
}

void Controller::observe(const Event& ev) {
    if (auto st = std::get_if<EngineStatus>(&ev)) {
        if (!st->api_version.empty()) m_api_version = st->api_version;
        if (st->available && m_cfg.compose_mode == ComposeMode::Auto) {
            m_cli.set_flavor(st->compose_plugin ? ComposeFlavor::Plugin : ComposeFlavor::Standalone);
            log_info(std::string("compose flavor: ") + to_string(m_cli.flavor()));
        }
    } else if (auto ex = std::get_if<ProcessExited>(&ev)) {
        // Exits of replaced followers carry an older source id.
        if (m_logs_active && ex->source_id == m_logs_source) {
            m_logs_active = false;
            m_logs_worker.reset();
        }
    } else if (auto err = std::get_if<ErrorEvent>(&ev)) {
        // A follower that could not spawn never emits ProcessExited.
        if (m_logs_active && err->context == m_logs_source && err->kind == ErrorKind::SpawnFailure) {
            m_logs_active = false;
            m_logs_worker.reset();
        }
    }
}

std::vector<Event> Controller::tick() {
    std::vector<Event> events = m_channel.drain();
    for (const auto &ev : events) {
        observe(ev);
        m_store.apply(ev);
    }
    m_sup.collect_finished();
    m_terminals.prune_closed();
    return events;
}

ShutdownReport Controller::shutdown() {
    if (m_shut_down) return ShutdownReport{};
    m_shut_down = true;
    stop_logs();
    stop_stats();
    ShutdownReport rep = m_sup.shutdown_all(m_cfg.grace_period);
    // Fold whatever the workers emitted on their way out.
    for (const auto &ev : m_channel.drain()) m_store.apply(ev);
    return rep;
}

} // namespace dockstack
