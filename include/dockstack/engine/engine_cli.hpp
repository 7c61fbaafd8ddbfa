/*
 * Container engine command line builders - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/exec/record_parser.hpp>
#include <dockstack/exec/spawn.hpp>
#include <string>

namespace dockstack {

enum class ComposeFlavor { Plugin, Standalone };

// Builds argv vectors for the engine CLI. Nothing here runs a process.
class EngineCli {
public:
    EngineCli(std::string docker_program = "docker", std::string compose_program = "docker-compose",
              ComposeFlavor flavor = ComposeFlavor::Plugin, std::string project_dir = {});

    void set_flavor(ComposeFlavor flavor) { m_flavor = flavor; }
    ComposeFlavor flavor() const { return m_flavor; }
    const std::string& project_dir() const { return m_project_dir; }

    CommandSpec info() const;
    // Always the plugin form: it is how the plugin is detected.
    CommandSpec compose_version() const;
    CommandSpec compose_up() const;
    CommandSpec compose_down() const;
    CommandSpec compose_logs_follow(unsigned tail) const;
    CommandSpec list_containers(const std::string& project_id) const;
    CommandSpec stats_snapshot() const;

    static RecordSchema container_schema();
    static RecordSchema stats_schema();

private:
    CommandSpec compose(std::vector<std::string> sub) const;

    std::string m_docker;
    std::string m_compose;
    ComposeFlavor m_flavor;
    std::string m_project_dir;
};

const char* to_string(ComposeFlavor flavor);

} // namespace dockstack
