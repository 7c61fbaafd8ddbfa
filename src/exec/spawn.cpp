/*
 * Process spawning implementation - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/exec/spawn.hpp>
#include <dockstack/exec/path.hpp>
#include <dockstack/util/log.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace dockstack {

std::string display_command(const CommandSpec& spec) {
    std::string out = spec.program;
    for (auto &a : spec.args) {
        out += ' ';
        if (a.find_first_of(" \t\"'") != std::string::npos) out += '\'' + a + '\'';
        else out += a;
    }
    return out;
}

namespace detail {

std::optional<Failure> build_exec_image(const CommandSpec& spec, ExecImage& out) {
    auto exe = resolve_executable(spec.program);
    if (!exe) {
        std::error_code ec;
        bool exists = spec.program.find('/') != std::string::npos && std::filesystem::exists(spec.program, ec);
        return Failure{ErrorKind::SpawnFailure,
                       spec.program + (exists ? ": permission denied" : ": command not found")};
    }
    out.path = *exe;
    out.argv_storage.clear();
    out.argv_storage.push_back(spec.program);
    for (auto &a : spec.args) out.argv_storage.push_back(a);

    out.env_storage.clear();
    for (char** e = environ; e && *e; ++e) {
        std::string entry = *e;
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        bool overridden = false;
        for (auto &kv : spec.env) if (kv.first == key) { overridden = true; break; }
        if (!overridden) out.env_storage.push_back(std::move(entry));
    }
    for (auto &kv : spec.env) out.env_storage.push_back(kv.first + "=" + kv.second);

    out.argv.clear(); out.envp.clear();
    for (auto &s : out.argv_storage) out.argv.push_back(const_cast<char*>(s.c_str()));
    out.argv.push_back(nullptr);
    for (auto &s : out.env_storage) out.envp.push_back(const_cast<char*>(s.c_str()));
    out.envp.push_back(nullptr);
    return std::nullopt;
}

std::optional<Failure> make_cloexec_pipe(UniqueFd& rd, UniqueFd& wr) {
    int p[2];
    if (pipe2(p, O_CLOEXEC) != 0) return Failure{ErrorKind::SpawnFailure, std::string("pipe: ") + std::strerror(errno)};
    rd.reset(p[0]); wr.reset(p[1]);
    return std::nullopt;
}

void reset_child_signals() {
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGHUP, SIG_DFL);
    signal(SIGCHLD, SIG_DFL);
    sigset_t none; sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
}

void child_fail(int err_fd, int err) {
    ssize_t w; do { w = ::write(err_fd, &err, sizeof(err)); } while (w < 0 && errno == EINTR);
    _exit(127);
}

int read_exec_errno(int rd) {
    int child_errno = 0;
    ssize_t n;
    do { n = ::read(rd, &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

} // namespace detail

SpawnResult spawn_process(const CommandSpec& spec, const SpawnOptions& opts) {
    detail::ExecImage img;
    if (auto f = detail::build_exec_image(spec, img)) return {nullptr, f};

    // All pipes are close-on-exec so concurrent spawns on other threads never
    // inherit them; dup2() below clears the flag on the child's 0/1/2 only.
    UniqueFd in_rd, in_wr, out_rd, out_wr, err_rd, err_wr, x_rd, x_wr;
    if (opts.pipe_stdin) { if (auto f = detail::make_cloexec_pipe(in_rd, in_wr)) return {nullptr, f}; }
    if (auto f = detail::make_cloexec_pipe(out_rd, out_wr)) return {nullptr, f};
    if (!opts.merge_stderr) { if (auto f = detail::make_cloexec_pipe(err_rd, err_wr)) return {nullptr, f}; }
    if (auto f = detail::make_cloexec_pipe(x_rd, x_wr)) return {nullptr, f};

    const char* cwd = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    pid_t pid = fork();
    if (pid < 0) return {nullptr, Failure{ErrorKind::SpawnFailure, std::string("fork: ") + std::strerror(errno)}};
    if (pid == 0) {
        setpgid(0, 0);
        detail::reset_child_signals();
        if (cwd && chdir(cwd) != 0) detail::child_fail(x_wr.get(), errno);
        int null_fd = -1;
        if (opts.pipe_stdin) {
            if (dup2(in_rd.get(), STDIN_FILENO) < 0) detail::child_fail(x_wr.get(), errno);
        } else {
            null_fd = ::open("/dev/null", O_RDONLY);
            if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0) detail::child_fail(x_wr.get(), errno);
        }
        if (dup2(out_wr.get(), STDOUT_FILENO) < 0) detail::child_fail(x_wr.get(), errno);
        int err_target = opts.merge_stderr ? out_wr.get() : err_wr.get();
        if (dup2(err_target, STDERR_FILENO) < 0) detail::child_fail(x_wr.get(), errno);
        execve(img.path.c_str(), img.argv.data(), img.envp.data());
        detail::child_fail(x_wr.get(), errno);
    }
    // Set in both processes; either order gives the same group.
    setpgid(pid, pid);
    in_rd.reset(); out_wr.reset(); err_wr.reset(); x_wr.reset();

    int child_errno = detail::read_exec_errno(x_rd.get());
    if (child_errno != 0) {
        int st = 0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        return {nullptr, Failure{ErrorKind::SpawnFailure, spec.program + ": " + std::strerror(child_errno)}};
    }
    log_debug("spawned pid " + std::to_string(pid) + ": " + display_command(spec));
    return {std::make_shared<ChildProcess>(pid, std::move(in_wr), std::move(out_rd), std::move(err_rd)), std::nullopt};
}

} // namespace dockstack
