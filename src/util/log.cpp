/*
 * Diagnostics log - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/util/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>

namespace dockstack {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
static std::mutex g_log_mutex;
static std::ostream* g_sink = nullptr; // guarded by g_log_mutex

static const char* level_name(LogLevel l) {
    switch (l) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return std::tolower(c); });
    if (n=="debug") return LogLevel::Debug;
    if (n=="info") return LogLevel::Info;
    if (n=="warn"||n=="warning") return LogLevel::Warn;
    if (n=="error") return LogLevel::Error;
    if (n=="off"||n=="none") return LogLevel::Off;
    return std::nullopt;
}

void set_log_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    g_sink = sink;
}

void log_line(LogLevel level, const std::string& message) {
    if (level == LogLevel::Off || static_cast<int>(level) < g_level.load()) return;
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << secs << " [dockstack] " << level_name(level) << ' ' << message << '\n';
    out.flush();
}

} // namespace dockstack
