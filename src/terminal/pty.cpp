/*
 * Pseudo-terminal process spawning - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/terminal/pty.hpp>
#include <dockstack/util/log.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

namespace dockstack {

bool set_window_size(int master_fd, TermSize size) {
    struct winsize ws{};
    ws.ws_row = size.rows;
    ws.ws_col = size.cols;
    return ioctl(master_fd, TIOCSWINSZ, &ws) == 0;
}

static Failure pty_failure(const char* what) {
    return Failure{ErrorKind::SpawnFailure, std::string(what) + ": " + std::strerror(errno)};
}

PtySpawnResult spawn_pty(const CommandSpec& spec, TermSize size, const std::string& term) {
    CommandSpec with_term = spec;
    if (!term.empty()) with_term.env.emplace_back("TERM", term);
    detail::ExecImage img;
    if (auto f = detail::build_exec_image(with_term, img)) return {{}, f};

    UniqueFd master(posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC));
    if (!master) return {{}, pty_failure("posix_openpt")};
    if (grantpt(master.get()) != 0) return {{}, pty_failure("grantpt")};
    if (unlockpt(master.get()) != 0) return {{}, pty_failure("unlockpt")};
    char slave_name[128];
    if (ptsname_r(master.get(), slave_name, sizeof(slave_name)) != 0) return {{}, pty_failure("ptsname_r")};
    if (!set_window_size(master.get(), size)) log_warn(std::string("initial TIOCSWINSZ failed: ") + std::strerror(errno));

    UniqueFd x_rd, x_wr;
    if (auto f = detail::make_cloexec_pipe(x_rd, x_wr)) return {{}, f};
    const char* cwd = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    pid_t pid = fork();
    if (pid < 0) return {{}, pty_failure("fork")};
    if (pid == 0) {
        master.reset();
        detail::reset_child_signals();
        if (setsid() < 0) detail::child_fail(x_wr.get(), errno);
        int slave = ::open(slave_name, O_RDWR);
        if (slave < 0) detail::child_fail(x_wr.get(), errno);
        if (ioctl(slave, TIOCSCTTY, 0) < 0) detail::child_fail(x_wr.get(), errno);
        if (dup2(slave, STDIN_FILENO) < 0 || dup2(slave, STDOUT_FILENO) < 0 || dup2(slave, STDERR_FILENO) < 0)
            detail::child_fail(x_wr.get(), errno);
        if (slave > STDERR_FILENO) ::close(slave);
        if (cwd && chdir(cwd) != 0) detail::child_fail(x_wr.get(), errno);
        execve(img.path.c_str(), img.argv.data(), img.envp.data());
        detail::child_fail(x_wr.get(), errno);
    }
    x_wr.reset();
    int child_errno = detail::read_exec_errno(x_rd.get());
    if (child_errno != 0) {
        int st = 0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        return {{}, Failure{ErrorKind::SpawnFailure, spec.program + ": " + std::strerror(child_errno)}};
    }
    log_debug("terminal pid " + std::to_string(pid) + " on " + slave_name);
    PtySpawnResult res;
    res.pty.child = std::make_shared<ChildProcess>(pid, UniqueFd{}, UniqueFd{}, UniqueFd{});
    res.pty.master = std::move(master);
    return res;
}

} // namespace dockstack
