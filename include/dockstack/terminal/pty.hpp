/*
 * Pseudo-terminal process spawning - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/exec/spawn.hpp>
#include <memory>
#include <optional>
#include <string>

namespace dockstack {

struct TermSize {
    unsigned short rows = 24;
    unsigned short cols = 80;
};

struct PtyProcess {
    std::shared_ptr<ChildProcess> child; // session leader, controlling tty = slave
    UniqueFd master;
};

struct PtySpawnResult {
    PtyProcess pty;
    std::optional<Failure> error;
    explicit operator bool() const { return pty.child != nullptr; }
};

// Allocates a pseudo-terminal pair and runs `spec` on the slave side with
// TERM=`term` and the given initial size.
PtySpawnResult spawn_pty(const CommandSpec& spec, TermSize size, const std::string& term);

// TIOCSWINSZ on the master; the kernel delivers SIGWINCH to the foreground group.
bool set_window_size(int master_fd, TermSize size);

} // namespace dockstack
