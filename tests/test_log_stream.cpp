#include <gtest/gtest.h>
#include <dockstack/stream/log_stream.hpp>
#include "test_support.hpp"
#include <csignal>

using namespace dockstack;
using namespace dockstack::test_support;

static std::vector<std::string> lines_for(const std::vector<Event>& seen, const std::string& source) {
    std::vector<std::string> out;
    for (auto &l : events_of<ProcessOutputLine>(seen)) if (l.source_id == source) out.push_back(l.text);
    return out;
}

TEST(LogStream, LinesInOrderThenOneExit) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    LogStreamWorker w(sup, ch.sender());
    ASSERT_TRUE(w.follow("svc", CommandSpec{"/bin/sh", {"-c", "i=1; while [ $i -le 300 ]; do echo line$i; i=$((i+1)); done"}, {}, {}},
                         CancellationFlag{}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_exit_for("svc")));
    auto lines = lines_for(seen, "svc");
    ASSERT_EQ(lines.size(), 300u);
    for (size_t i = 0; i < lines.size(); ++i) EXPECT_EQ(lines[i], "line" + std::to_string(i + 1));
    auto exits = events_of<ProcessExited>(seen);
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_TRUE(exits[0].status.success());
    // Exit comes after the last line.
    EXPECT_TRUE(std::holds_alternative<ProcessExited>(seen.back()));
}

TEST(LogStream, FlushesUnterminatedLastLine) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    LogStreamWorker w(sup, ch.sender());
    ASSERT_TRUE(w.follow("p", CommandSpec{"/bin/sh", {"-c", "printf 'a\\r\\nb\\nc'"}, {}, {}}, CancellationFlag{}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_exit_for("p")));
    EXPECT_EQ(lines_for(seen, "p"), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(LogStream, StderrIsMergedWhenFollowing) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    LogStreamWorker w(sup, ch.sender());
    ASSERT_TRUE(w.follow("m", CommandSpec{"/bin/sh", {"-c", "echo out; echo err 1>&2"}, {}, {}}, CancellationFlag{}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_exit_for("m")));
    EXPECT_EQ(lines_for(seen, "m"), (std::vector<std::string>{"out", "err"}));
}

TEST(LogStream, CancelStopsPromptlyWithExactlyOneExit) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    LogStreamWorker w(sup, ch.sender());
    CancellationFlag cancel;
    ASSERT_TRUE(w.follow("tail", CommandSpec{"/bin/sh", {"-c", "while true; do echo tick; sleep 0.05; done"}, {}, {}}, cancel));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, [](const std::vector<Event>& s) { return count_of<ProcessOutputLine>(s) >= 3; }));
    auto t0 = std::chrono::steady_clock::now();
    cancel.cancel();
    ASSERT_TRUE(drain_until(ch, seen, has_exit_for("tail")));
    // The writer dies of SIGPIPE on its next echo, well inside a second.
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(2));
    std::size_t lines_at_exit = count_of<ProcessOutputLine>(seen);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    for (auto &ev : ch.drain()) seen.push_back(std::move(ev));
    EXPECT_EQ(count_of<ProcessOutputLine>(seen), lines_at_exit);
    EXPECT_EQ(count_of<ProcessExited>(seen), 1u);
    EXPECT_TRUE(std::holds_alternative<ProcessExited>(seen.back()));
}

TEST(LogStream, StopRequestEndsAQuietFollower) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    LogStreamWorker w(sup, ch.sender());
    CancellationFlag cancel;
    auto id = w.follow("quiet", CommandSpec{"/bin/sleep", {"30"}, {}, {}}, cancel);
    ASSERT_TRUE(id);
    ASSERT_TRUE(eventually([&]{ auto p = sup.processes(); return p.size() == 1 && p[0].pid > 0; }));

    auto t0 = std::chrono::steady_clock::now();
    ASSERT_TRUE(sup.request_stop(*id, std::chrono::milliseconds(200)));
    EXPECT_TRUE(cancel.is_cancelled());
    std::vector<Event> seen;
    ASSERT_TRUE(eventually([&]{
        sup.collect_finished();
        for (auto &ev : ch.drain()) seen.push_back(std::move(ev));
        return has_exit_for("quiet")(seen);
    }, std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(2));
    auto exits = events_of<ProcessExited>(seen);
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_EQ(exits[0].status.signal, SIGKILL);
    EXPECT_EQ(count_of<ProcessOutputLine>(seen), 0u);
    ASSERT_TRUE(eventually([&]{ sup.collect_finished(); return sup.live_count() == 0; }));
    EXPECT_TRUE(sup.processes().empty());
}

TEST(LogStream, AttachToSpawnedChild) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    LogStreamWorker w(sup, ch.sender());
    auto sp = spawn_process(CommandSpec{"/bin/echo", {"attached"}, {}, {}});
    ASSERT_TRUE(sp);
    ASSERT_TRUE(w.start("pre", sp.child, CancellationFlag{}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_exit_for("pre")));
    EXPECT_EQ(lines_for(seen, "pre"), (std::vector<std::string>{"attached"}));
    EXPECT_TRUE(sp.child->reaped());
}

TEST(LogStream, SpawnFailureIsAnErrorEvent) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    LogStreamWorker w(sup, ch.sender());
    ASSERT_TRUE(w.follow("bad", CommandSpec{"dockstack-no-such-logger", {}, {}, {}}, CancellationFlag{}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, [](const std::vector<Event>& s) { return count_of<ErrorEvent>(s) > 0; }));
    auto errs = events_of<ErrorEvent>(seen);
    EXPECT_EQ(errs[0].kind, ErrorKind::SpawnFailure);
    EXPECT_EQ(errs[0].context, "bad");
    EXPECT_EQ(count_of<ProcessOutputLine>(seen), 0u);
}

TEST(LogStream, RejectedOnceShuttingDown) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    LogStreamWorker w(sup, ch.sender());
    sup.shutdown_all(std::chrono::milliseconds(50));
    EXPECT_FALSE(w.follow("late", CommandSpec{"/bin/echo", {"x"}, {}, {}}, CancellationFlag{}));
    auto evs = ch.drain();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(std::get<ErrorEvent>(evs[0]).kind, ErrorKind::Rejected);
}
