/*
 * Container engine command line builders - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/engine/engine_cli.hpp>

namespace dockstack {

EngineCli::EngineCli(std::string docker_program, std::string compose_program, ComposeFlavor flavor,
                     std::string project_dir)
    : m_docker(std::move(docker_program)), m_compose(std::move(compose_program)), m_flavor(flavor),
      m_project_dir(std::move(project_dir)) {}

const char* to_string(ComposeFlavor flavor) {
    return flavor == ComposeFlavor::Plugin ? "plugin" : "standalone";
}

CommandSpec EngineCli::compose(std::vector<std::string> sub) const {
    CommandSpec spec;
    spec.working_dir = m_project_dir;
    if (m_flavor == ComposeFlavor::Plugin) {
        spec.program = m_docker;
        spec.args.push_back("compose");
        spec.args.insert(spec.args.end(), sub.begin(), sub.end());
    } else {
        spec.program = m_compose;
        spec.args = std::move(sub);
    }
    return spec;
}

CommandSpec EngineCli::info() const { return CommandSpec{m_docker, {"info"}, {}, {}}; }

CommandSpec EngineCli::compose_version() const { return CommandSpec{m_docker, {"compose", "version"}, {}, {}}; }

CommandSpec EngineCli::compose_up() const { return compose({"up", "-d", "--remove-orphans"}); }

CommandSpec EngineCli::compose_down() const { return compose({"down"}); }

CommandSpec EngineCli::compose_logs_follow(unsigned tail) const {
    return compose({"logs", "-f", "--tail", std::to_string(tail)});
}

CommandSpec EngineCli::list_containers(const std::string& project_id) const {
    return CommandSpec{m_docker,
                       {"ps", "-a", "--filter", "label=com.docker.compose.project=" + project_id,
                        "--format", "{{.ID}}|{{.Names}}|{{.Image}}|{{.Status}}|{{.Ports}}|{{.State}}"},
                       {}, {}};
}

CommandSpec EngineCli::stats_snapshot() const {
    return CommandSpec{m_docker,
                       {"stats", "--no-stream", "--format",
                        "{{.Name}}|{{.CPUPerc}}|{{.MemUsage}}|{{.MemPerc}}|{{.NetIO}}|{{.BlockIO}}"},
                       {}, {}};
}

RecordSchema EngineCli::container_schema() {
    return RecordSchema{{"id", "name", "image", "status", "ports", "state"}, '|'};
}

RecordSchema EngineCli::stats_schema() {
    return RecordSchema{{"name", "cpu_percent", "mem_usage", "mem_percent", "net_io", "block_io"}, '|'};
}

} // namespace dockstack
