/*
 * Process spawning (argv only, never a shell line) - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/error.hpp>
#include <dockstack/exec/child_process.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dockstack {

// One external invocation. Each argument is passed to execve() untouched.
struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    std::string working_dir;                                  // empty: inherit
    std::vector<std::pair<std::string, std::string>> env;     // added/overridden
};

// "docker ps -a" style rendering for logs and messages only.
std::string display_command(const CommandSpec& spec);

struct SpawnOptions {
    bool pipe_stdin = false;
    bool merge_stderr = false; // stderr goes to the stdout pipe
};

struct SpawnResult {
    std::shared_ptr<ChildProcess> child;
    std::optional<Failure> error;
    explicit operator bool() const { return child != nullptr; }
};

SpawnResult spawn_process(const CommandSpec& spec, const SpawnOptions& opts = {});

namespace detail {

// Everything execve() needs, built before fork() so the child only makes
// async-signal-safe calls.
struct ExecImage {
    std::string path;
    std::vector<std::string> argv_storage;
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;
};

// Resolves the program and merges the environment. Fails with SpawnFailure
// when the program is missing or not executable.
std::optional<Failure> build_exec_image(const CommandSpec& spec, ExecImage& out);

// pipe2(O_CLOEXEC). Also used for the exec-errno report pipe.
std::optional<Failure> make_cloexec_pipe(UniqueFd& rd, UniqueFd& wr);

// Child side: restore default signal dispositions and mask.
void reset_child_signals();

// Child side: report errno on the error pipe and _exit(127).
[[noreturn]] void child_fail(int err_fd, int err);

// Parent side: 0 if execve succeeded, otherwise the child's errno.
int read_exec_errno(int rd);

} // namespace detail

} // namespace dockstack
