/*
 * Local terminal raw mode - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/term/raw_mode.hpp>
#include <dockstack/util/log.hpp>
#include <cerrno>
#include <cstring>
#include <sys/ioctl.h>
#include <unistd.h>

namespace dockstack {

RawMode::RawMode(int fd, bool pass_signals) : m_fd(fd) {
    if (!isatty(fd)) return;
    if (tcgetattr(fd, &m_saved) != 0) {
        log_warn(std::string("tcgetattr: ") + std::strerror(errno));
        return;
    }
    struct termios t = m_saved;
    t.c_lflag &= ~(ICANON | ECHO | IEXTEN);
    if (pass_signals) t.c_lflag &= ~ISIG;
    t.c_iflag &= ~(IXON | ICRNL);
    t.c_cc[VMIN] = 1; t.c_cc[VTIME] = 0;
    if (tcsetattr(fd, TCSAFLUSH, &t) != 0) {
        log_warn(std::string("tcsetattr: ") + std::strerror(errno));
        return;
    }
    m_active = true;
}

RawMode::~RawMode() { restore(); }

void RawMode::restore() {
    if (!m_active) return;
    tcsetattr(m_fd, TCSAFLUSH, &m_saved);
    m_active = false;
}

std::optional<TermSize> terminal_size(int fd) {
    struct winsize ws{};
    if (ioctl(fd, TIOCGWINSZ, &ws) != 0 || ws.ws_row == 0 || ws.ws_col == 0) return std::nullopt;
    return TermSize{ws.ws_row, ws.ws_col};
}

} // namespace dockstack
