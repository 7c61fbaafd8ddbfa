/*
 * Container engine availability probe - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/cancel.hpp>
#include <dockstack/core/event_channel.hpp>
#include <dockstack/engine/engine_cli.hpp>
#include <dockstack/supervisor/supervisor.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace dockstack {

enum class ComposeMode { Auto, Plugin, Standalone };

std::optional<ComposeMode> parse_compose_mode(const std::string& s);

struct SocketProbe {
    bool reachable = false;
    std::string api_version; // from GET /version, may stay empty
    std::string error;
};

// GET /_ping then /version over the engine's Unix socket. Blocking, bounded by `timeout`.
SocketProbe probe_engine_socket(const std::string& socket_path, std::chrono::milliseconds timeout);

// Value of a top-level string field in a JSON object ("" if absent).
std::string json_string_field(const std::string& body, const std::string& key);

struct ProbeSettings {
    std::string socket_path = "/var/run/docker.sock";
    std::chrono::milliseconds timeout{2000};
    ComposeMode compose_mode = ComposeMode::Auto;
};

// Runs the probe on a supervised worker and emits exactly one EngineStatus.
class EngineProbe {
public:
    EngineProbe(Supervisor& sup, EventSender events, EngineCli cli, ProbeSettings settings)
        : m_sup(sup), m_events(std::move(events)), m_cli(std::move(cli)), m_settings(std::move(settings)) {}

    std::optional<WorkerId> start();

    // The probe itself; blocking.
    static EngineStatus run(const EngineCli& cli, const ProbeSettings& settings, WorkerContext* ctx,
                            const CancellationFlag& cancel);

private:
    Supervisor& m_sup;
    EventSender m_events;
    EngineCli m_cli;
    ProbeSettings m_settings;
};

} // namespace dockstack
