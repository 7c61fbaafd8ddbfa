/*
 * Diagnostics log - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <ostream>
#include <string>

namespace dockstack {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

void set_log_level(LogLevel level);
LogLevel log_level();
std::optional<LogLevel> parse_log_level(const std::string& name);

// Redirect output (tests). nullptr restores std::cerr.
void set_log_sink(std::ostream* sink);

// Writes one whole line: "<secs> [dockstack] LEVEL message".
void log_line(LogLevel level, const std::string& message);

inline void log_debug(const std::string& m) { log_line(LogLevel::Debug, m); }
inline void log_info(const std::string& m) { log_line(LogLevel::Info, m); }
inline void log_warn(const std::string& m) { log_line(LogLevel::Warn, m); }
inline void log_error(const std::string& m) { log_line(LogLevel::Error, m); }

} // namespace dockstack
