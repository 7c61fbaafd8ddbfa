/*
 * Local terminal raw mode - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/terminal/pty.hpp>
#include <optional>
#include <termios.h>

namespace dockstack {

// Puts a local tty in raw mode and restores the saved settings on destruction.
// With pass_signals, ^C and ^Z reach the remote shell instead of us.
class RawMode {
public:
    explicit RawMode(int fd, bool pass_signals = true);
    ~RawMode();
    RawMode(const RawMode&) = delete;
    RawMode& operator=(const RawMode&) = delete;

    bool active() const { return m_active; }
    void restore();

private:
    int m_fd;
    bool m_active = false;
    struct termios m_saved{};
};

// TIOCGWINSZ on a local tty; nullopt when `fd` is not a terminal.
std::optional<TermSize> terminal_size(int fd);

} // namespace dockstack
