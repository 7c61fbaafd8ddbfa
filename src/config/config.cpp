/*
 * rc file configuration - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/config/config.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <limits>
#include <type_traits>

namespace fs = std::filesystem;

namespace dockstack {

static std::string getenv_or(const char* k, const std::string& def = {}) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b = s.size(); while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b - a);
}

// Non-negative integer, whole value only.
static bool parse_count(const std::string& val, unsigned long long& out) {
    if (val.empty() || !std::isdigit((unsigned char)val[0])) return false;
    try {
        size_t used = 0;
        out = std::stoull(val, &used);
        return used == val.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

ConfigLoad parse_config(std::istream& in, Config base) {
    ConfigLoad res;
    res.config = std::move(base);
    Config& c = res.config;
    std::string line;
    std::size_t line_no = 0;
    auto warn = [&](const std::string& m) { res.warnings.push_back(ConfigWarning{line_no, m}); };
    while (std::getline(in, line)) {
        ++line_no;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos) { warn("expected key=value: " + t); continue; }
        std::string key = trim(t.substr(0, eq));
        std::string val = trim(t.substr(eq + 1));

        auto bounded = [&](unsigned long long min_value, unsigned long long max_value, unsigned long long& n) {
            if (!parse_count(val, n) || n < min_value) { warn("bad value for " + key + ": '" + val + "'"); return false; }
            if (n > max_value) {
                warn("value for " + key + " out of range (max " + std::to_string(max_value) + "): '" + val + "'");
                return false;
            }
            return true;
        };
        auto count = [&](auto& field, unsigned long long min_value) {
            using Field = std::remove_reference_t<decltype(field)>;
            unsigned long long n = 0;
            if (bounded(min_value, std::numeric_limits<Field>::max(), n)) field = static_cast<Field>(n);
        };
        // Millisecond settings end up in int poll timeouts.
        auto millis = [&](std::chrono::milliseconds& field, unsigned long long min_value) {
            unsigned long long n = 0;
            if (bounded(min_value, static_cast<unsigned long long>(std::numeric_limits<int>::max()), n))
                field = std::chrono::milliseconds(static_cast<long long>(n));
        };

        if (key == "docker_program") c.docker_program = val;
        else if (key == "compose_program") c.compose_program = val;
        else if (key == "compose_mode") {
            if (auto m = parse_compose_mode(val)) c.compose_mode = *m;
            else warn("compose_mode must be auto, plugin or standalone: '" + val + "'");
        }
        else if (key == "engine_socket") c.engine_socket = val;
        else if (key == "project_dir") c.project_dir = val;
        else if (key == "project_id") c.project_id = val;
        else if (key == "shell") c.shell = val;
        else if (key == "term") c.term = val;
        else if (key == "log_tail") count(c.log_tail, 0);
        else if (key == "stats_interval_ms") millis(c.stats_interval, 1);
        else if (key == "grace_period_ms") millis(c.grace_period, 0);
        else if (key == "probe_timeout_ms") millis(c.probe_timeout, 1);
        else if (key == "log_level") {
            if (auto l = parse_log_level(val)) c.log_level = *l;
            else warn("unknown log_level '" + val + "'");
        }
        else if (key == "log_buffer_max") count(c.log_buffer_max, 1);
        else if (key == "log_buffer_keep") count(c.log_buffer_keep, 0);
        else warn("unknown key '" + key + "'");
    }
    if (c.log_buffer_keep > c.log_buffer_max) {
        line_no = 0;
        warn("log_buffer_keep larger than log_buffer_max; using " + std::to_string(c.log_buffer_max));
        c.log_buffer_keep = c.log_buffer_max;
    }
    return res;
}

ConfigLoad load_config(const std::string& path, Config base) {
    std::ifstream in(path);
    if (!in) {
        ConfigLoad res;
        res.config = std::move(base);
        res.path = path;
        return res;
    }
    ConfigLoad res = parse_config(in, std::move(base));
    res.path = path;
    res.file_found = true;
    return res;
}

std::string default_config_path() {
    std::string p = getenv_or("DOCKSTACK_CONFIG");
    if (!p.empty()) return p;
    std::string home = getenv_or("HOME");
    if (home.empty()) return {};
    return home + "/.dockstackrc";
}

std::vector<ConfigWarning> apply_environment(Config& cfg) {
    std::vector<ConfigWarning> out;
    std::string lvl = getenv_or("DOCKSTACK_LOG");
    if (lvl.empty()) return out;
    if (auto l = parse_log_level(lvl)) cfg.log_level = *l;
    else out.push_back(ConfigWarning{0, "DOCKSTACK_LOG: unknown level '" + lvl + "'"});
    return out;
}

std::string effective_project_dir(const Config& cfg) {
    if (!cfg.project_dir.empty()) return cfg.project_dir;
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

std::string effective_project_id(const Config& cfg) {
    if (!cfg.project_id.empty()) return cfg.project_id;
    fs::path p(effective_project_dir(cfg));
    std::string name = p.filename().string();
    if (name.empty() || name == ".") name = p.parent_path().filename().string();
    // Same normalization compose applies to project names.
    std::string id;
    for (char ch : name) {
        unsigned char u = static_cast<unsigned char>(ch);
        if (std::isalnum(u) || ch == '-' || ch == '_') id.push_back(static_cast<char>(std::tolower(u)));
    }
    return id.empty() ? "default" : id;
}

std::string effective_shell(const Config& cfg) {
    if (!cfg.shell.empty()) return cfg.shell;
    return getenv_or("SHELL", "/bin/sh");
}

} // namespace dockstack
