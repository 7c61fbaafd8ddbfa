#include <gtest/gtest.h>
#include <dockstack/exec/command_executor.hpp>
#include "test_support.hpp"

using namespace dockstack;
using namespace dockstack::test_support;

static CommandSpec sh(const std::string& script) { return CommandSpec{"/bin/sh", {"-c", script}, {}, {}}; }

static CommandResult result_for(const std::vector<Event>& seen, RequestId id) {
    for (auto &r : events_of<CommandResult>(seen)) if (r.request_id == id) return r;
    return CommandResult{};
}

TEST(CommandExecutor, ListWithOneBadLine) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    RecordSchema schema{{"id", "name", "state"}, '|'};
    ASSERT_TRUE(ex.execute(1, "/bin/sh", {"-c", "printf '1|web|running\\n2|db|exited\\nbad-line\\n'"}, schema));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_result_for(1)));
    auto res = result_for(seen, 1);
    ASSERT_TRUE(res.ok());
    const CommandOutput* out = res.output();
    ASSERT_EQ(out->records.size(), 2u);
    EXPECT_EQ(out->records[0], (ParsedRecord{{"id", "1"}, {"name", "web"}, {"state", "running"}}));
    EXPECT_EQ(out->records[1], (ParsedRecord{{"id", "2"}, {"name", "db"}, {"state", "exited"}}));
    ASSERT_EQ(out->parse_errors.size(), 1u);
    EXPECT_EQ(out->parse_errors[0].line, "bad-line");
    EXPECT_TRUE(out->status.success());
    sup.shutdown_all(std::chrono::milliseconds(500));
    EXPECT_EQ(count_of<CommandResult>(seen), 1u);
}

TEST(CommandExecutor, CapturesBothStreams) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    ASSERT_TRUE(ex.execute(5, sh("echo to-out; echo to-err 1>&2")));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_result_for(5)));
    auto res = result_for(seen, 5);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.output()->stdout_text, "to-out\n");
    EXPECT_EQ(res.output()->stderr_text, "to-err\n");
    EXPECT_TRUE(res.output()->records.empty());
}

TEST(CommandExecutor, LargeOutputDoesNotDeadlock) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    // Well past one pipe buffer on each stream.
    ASSERT_TRUE(ex.execute(6, sh("i=0; while [ $i -lt 20000 ]; do echo line-$i; echo err-$i 1>&2; i=$((i+1)); done")));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_result_for(6), std::chrono::seconds(30)));
    auto res = result_for(seen, 6);
    ASSERT_TRUE(res.ok());
    EXPECT_NE(res.output()->stdout_text.find("line-19999\n"), std::string::npos);
    EXPECT_NE(res.output()->stderr_text.find("err-19999\n"), std::string::npos);
}

TEST(CommandExecutor, FailedExitWithoutRecordsIsAnError) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    ASSERT_TRUE(ex.execute(2, sh("echo boom 1>&2; exit 2"), RecordSchema{{"a", "b"}, '|'}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_result_for(2)));
    auto res = result_for(seen, 2);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.failure()->kind, ErrorKind::ExitFailure);
    EXPECT_NE(res.failure()->message.find("boom"), std::string::npos);
}

TEST(CommandExecutor, FailedExitWithoutStderrNamesExitCode) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    ASSERT_TRUE(ex.execute(2, sh("exit 7")));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_result_for(2)));
    auto res = result_for(seen, 2);
    ASSERT_FALSE(res.ok());
    EXPECT_NE(res.failure()->message.find("exit code 7"), std::string::npos);
}

TEST(CommandExecutor, FailedExitWithRecordsIsPartialSuccess) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    ASSERT_TRUE(ex.execute(3, sh("echo 'x|y'; exit 1"), RecordSchema{{"a", "b"}, '|'}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_result_for(3)));
    auto res = result_for(seen, 3);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.output()->records.size(), 1u);
    EXPECT_EQ(res.output()->status.code, 1);
}

TEST(CommandExecutor, MissingProgramIsSpawnFailure) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    ASSERT_TRUE(ex.execute(4, "dockstack-missing-binary", {"ps"}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_result_for(4)));
    auto res = result_for(seen, 4);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.failure()->kind, ErrorKind::SpawnFailure);
}

TEST(CommandExecutor, StopCancelsAndKillsAfterGrace) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    auto id = ex.execute(9, "/bin/sleep", {"30"});
    ASSERT_TRUE(id);
    ASSERT_TRUE(eventually([&]{
        for (auto &p : sup.processes()) if (p.id == *id && p.pid > 0) return true;
        return false;
    }));
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(sup.stop(*id, std::chrono::milliseconds(200)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_result_for(9)));
    auto res = result_for(seen, 9);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.failure()->kind, ErrorKind::Cancelled);
}

TEST(CommandExecutor, SequenceStopsAtFirstFailure) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    ASSERT_TRUE(ex.execute_sequence(11, {sh("echo one"), sh("exit 4"), sh("echo three")}));
    ASSERT_TRUE(ex.execute_sequence(12, {sh("echo one"), sh("echo two")}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, [](const std::vector<Event>& s) {
        return has_result_for(11)(s) && has_result_for(12)(s);
    }));
    auto failed = result_for(seen, 11);
    ASSERT_FALSE(failed.ok());
    EXPECT_NE(failed.failure()->message.find("exit code 4"), std::string::npos);
    auto ok = result_for(seen, 12);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.output()->stdout_text, "two\n");
    EXPECT_EQ(count_of<CommandResult>(seen), 2u);
}

TEST(CommandExecutor, EmptySequenceStillAnswers) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    EXPECT_FALSE(ex.execute_sequence(13, {}));
    auto evs = ch.drain();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_FALSE(std::get<CommandResult>(evs[0]).ok());
}

TEST(CommandExecutor, RejectedAfterShutdown) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    CommandExecutor ex(sup, ch.sender());
    sup.shutdown_all(std::chrono::milliseconds(100));
    EXPECT_FALSE(ex.execute(7, "/bin/echo", {"late"}));
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_result_for(7)));
    auto res = result_for(seen, 7);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.failure()->kind, ErrorKind::Rejected);
}

TEST(CommandResultPolicy, CancelledCaptureMapsToCancelled) {
    CaptureResult cap;
    cap.cancelled = true;
    auto res = make_command_result(1, sh("true"), cap, std::nullopt);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.failure()->kind, ErrorKind::Cancelled);
}
