/*
 * rc file configuration - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/engine/engine_probe.hpp>
#include <dockstack/util/log.hpp>
#include <chrono>
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace dockstack {

struct Config {
    std::string docker_program = "docker";
    std::string compose_program = "docker-compose";
    ComposeMode compose_mode = ComposeMode::Auto;
    std::string engine_socket = "/var/run/docker.sock";
    std::string project_dir;            // empty: current directory
    std::string project_id;             // empty: basename of project_dir
    std::string shell;                  // empty: $SHELL, then /bin/sh
    std::string term = "xterm-256color";
    unsigned log_tail = 100;
    std::chrono::milliseconds stats_interval{2000};
    std::chrono::milliseconds grace_period{3000};
    std::chrono::milliseconds probe_timeout{2000};
    LogLevel log_level = LogLevel::Warn;
    std::size_t log_buffer_max = 5000;
    std::size_t log_buffer_keep = 3000;
};

struct ConfigWarning {
    std::size_t line_no = 0;
    std::string message;
};

struct ConfigLoad {
    Config config;
    std::vector<ConfigWarning> warnings;
    std::string path;
    bool file_found = false;
};

// key=value lines; '#' comments and blank lines skipped. Bad lines become
// warnings and leave the previous value in place.
ConfigLoad parse_config(std::istream& in, Config base = {});

// A missing file is not an error (file_found stays false).
ConfigLoad load_config(const std::string& path, Config base = {});

// $DOCKSTACK_CONFIG, else ~/.dockstackrc ("" when neither is known).
std::string default_config_path();

// DOCKSTACK_LOG overrides log_level. Returns a warning for a bad value.
std::vector<ConfigWarning> apply_environment(Config& cfg);

std::string effective_project_dir(const Config& cfg);
std::string effective_project_id(const Config& cfg);
std::string effective_shell(const Config& cfg);

} // namespace dockstack
