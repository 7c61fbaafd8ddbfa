#include <gtest/gtest.h>
#include <dockstack/terminal/session_broker.hpp>
#include "test_support.hpp"
#include <csignal>

using namespace dockstack;
using namespace dockstack::test_support;

static Pred output_contains(SessionId id, const std::string& needle) {
    return [id, needle](const std::vector<Event>& seen) {
        return terminal_text(seen, id).find(needle) != std::string::npos;
    };
}

static TerminalOptions plain_sh() {
    TerminalOptions o;
    o.shell = "/bin/sh";
    o.term = "dumb";
    return o;
}

TEST(TerminalSession, EchoThenCloseThenWriteFails) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalSessionBroker broker(sup, ch.sender(), plain_sh());
    SessionHandle h = broker.open(TermSize{24, 80});
    ASSERT_TRUE(h);
    // Queued even if the shell is still starting.
    ASSERT_FALSE(h.send("echo hi\n").has_value());
    ASSERT_FALSE(broker.write(h.id(), "echo $((40+2))\n").has_value());
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, output_contains(h.id(), "42")));
    EXPECT_NE(terminal_text(seen, h.id()).find("hi"), std::string::npos);
    EXPECT_EQ(broker.state(h.id()), SessionState::Running);

    ASSERT_FALSE(broker.close(h.id()).has_value());
    auto st = broker.state(h.id());
    ASSERT_TRUE(st.has_value());
    EXPECT_TRUE(*st == SessionState::Closing || *st == SessionState::Closed);
    ASSERT_TRUE(drain_until(ch, seen, has_exit_for(terminal_source_id(h.id()))));
    EXPECT_EQ(broker.state(h.id()), SessionState::Closed);
    EXPECT_EQ(h.state(), SessionState::Closed);

    auto err = broker.write(h.id(), "echo again\n");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::SessionStateError);
    auto err2 = h.send("x");
    ASSERT_TRUE(err2.has_value());
    EXPECT_EQ(err2->kind, ErrorKind::SessionStateError);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_TRUE(ch.drain().empty());
}

TEST(TerminalSession, ResizeReachesTheShell) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalSessionBroker broker(sup, ch.sender(), plain_sh());
    SessionHandle h = broker.open(TermSize{24, 80});
    std::vector<Event> seen;
    ASSERT_FALSE(h.send("stty size\n").has_value());
    ASSERT_TRUE(drain_until(ch, seen, output_contains(h.id(), "24 80")));
    ASSERT_FALSE(broker.resize(h.id(), TermSize{40, 100}).has_value());
    ASSERT_TRUE(eventually([&]{ auto s = broker.size(h.id()); return s && s->rows == 40 && s->cols == 100; }));
    ASSERT_FALSE(h.send("stty size\n").has_value());
    ASSERT_TRUE(drain_until(ch, seen, output_contains(h.id(), "40 100")));
    auto bad = broker.resize(h.id(), TermSize{0, 10});
    ASSERT_TRUE(bad.has_value());
}

TEST(TerminalSession, SessionsAreIndependent) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalSessionBroker broker(sup, ch.sender(), plain_sh());
    SessionHandle a = broker.open();
    SessionHandle b = broker.open();
    ASSERT_NE(a.id(), b.id());
    EXPECT_EQ(broker.sessions().size(), 2u);
    // Close one right away; the other keeps working.
    ASSERT_FALSE(broker.close(a.id()).has_value());
    ASSERT_FALSE(b.send("echo $((2000+2))\n").has_value());
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, [&](const std::vector<Event>& s) {
        return output_contains(b.id(), "2002")(s) && has_exit_for(terminal_source_id(a.id()))(s);
    }));
    EXPECT_EQ(terminal_text(seen, a.id()).find("2002"), std::string::npos);
    EXPECT_EQ(broker.state(b.id()), SessionState::Running);
    EXPECT_EQ(broker.state(a.id()), SessionState::Closed);
}

TEST(TerminalSession, ShellExitClosesSession) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalSessionBroker broker(sup, ch.sender(), plain_sh());
    SessionHandle h = broker.open();
    ASSERT_FALSE(h.send("exit 3\n").has_value());
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_exit_for(terminal_source_id(h.id()))));
    auto exits = events_of<ProcessExited>(seen);
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_EQ(exits[0].status.code, 3);
    EXPECT_EQ(h.state(), SessionState::Closed);
    EXPECT_TRUE(broker.close(h.id()).has_value());
}

TEST(TerminalSession, MissingShellIsReported) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalOptions o = plain_sh();
    o.shell = "/nonexistent/dockstack-shell";
    TerminalSessionBroker broker(sup, ch.sender(), o);
    SessionHandle h = broker.open();
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, [](const std::vector<Event>& s) { return count_of<ErrorEvent>(s) > 0; }));
    auto e = events_of<ErrorEvent>(seen)[0];
    EXPECT_EQ(e.kind, ErrorKind::SpawnFailure);
    EXPECT_EQ(e.context, terminal_source_id(h.id()));
    ASSERT_TRUE(eventually([&]{ return h.state() == SessionState::Closed; }));
    EXPECT_EQ(count_of<TerminalOutput>(seen), 0u);
}

TEST(TerminalSession, UnknownSessionAndBadSize) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalSessionBroker broker(sup, ch.sender(), plain_sh());
    auto e = broker.write(99, "x");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, ErrorKind::SessionStateError);
    EXPECT_FALSE(broker.state(99).has_value());

    SessionHandle h = broker.open(TermSize{0, 0});
    EXPECT_EQ(h.state(), SessionState::Closed);
    auto evs = ch.drain();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<ErrorEvent>(evs[0]));
}

TEST(TerminalSession, ShutdownHangsUpOpenSessions) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalSessionBroker broker(sup, ch.sender(), plain_sh());
    SessionHandle h = broker.open();
    std::vector<Event> seen;
    ASSERT_FALSE(h.send("echo ready-$((1+1))\n").has_value());
    ASSERT_TRUE(drain_until(ch, seen, output_contains(h.id(), "ready-2")));
    sup.shutdown_all(std::chrono::seconds(2));
    EXPECT_EQ(h.state(), SessionState::Closed);
    for (auto &ev : ch.drain()) seen.push_back(std::move(ev));
    EXPECT_EQ(count_of<ProcessExited>(seen), 1u);
}

TEST(TerminalSession, CloseKillsAShellThatIgnoresHangup) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalOptions o = plain_sh();
    o.args = {"-c", "trap '' HUP; echo armed; while :; do sleep 1; done"};
    o.close_grace = std::chrono::milliseconds(300);
    TerminalSessionBroker broker(sup, ch.sender(), o);
    SessionHandle h = broker.open();
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, output_contains(h.id(), "armed")));

    ASSERT_FALSE(broker.close(h.id()).has_value());
    const std::string source = terminal_source_id(h.id());
    // The consumer's tick drives the escalation.
    ASSERT_TRUE(eventually([&]{
        sup.collect_finished();
        for (auto &ev : ch.drain()) seen.push_back(std::move(ev));
        return has_exit_for(source)(seen);
    }, std::chrono::seconds(5)));
    EXPECT_EQ(h.state(), SessionState::Closed);
    auto exits = events_of<ProcessExited>(seen);
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_EQ(exits[0].status.signal, SIGKILL);
    bool saw_timeout = false;
    for (auto &e : events_of<ErrorEvent>(seen)) if (e.kind == ErrorKind::Timeout) saw_timeout = true;
    EXPECT_TRUE(saw_timeout);
    ASSERT_TRUE(eventually([&]{ sup.collect_finished(); return sup.live_count() == 0; }));
}

TEST(TerminalSession, ResizeKeepsOutputInFlight) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalSessionBroker broker(sup, ch.sender(), plain_sh());
    SessionHandle h = broker.open(TermSize{24, 80});
    ASSERT_FALSE(h.send("i=0; while [ $i -lt 200 ]; do echo row$i; i=$((i+1)); done; echo end-$((5+5))\n").has_value());
    // Resize repeatedly while the shell is still producing output.
    for (unsigned n = 0; n < 10; ++n) {
        ASSERT_FALSE(broker.resize(h.id(), TermSize{static_cast<unsigned short>(30 + n), 100}).has_value());
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, output_contains(h.id(), "end-10")));
    const std::string text = terminal_text(seen, h.id());
    for (int i = 0; i < 200; ++i)
        EXPECT_NE(text.find("row" + std::to_string(i) + "\r\n"), std::string::npos) << "missing row" << i;
    ASSERT_TRUE(eventually([&]{ auto s = broker.size(h.id()); return s && s->rows == 39; }));
}

TEST(TerminalSession, PruneForgetsClosedSessions) {
    EventChannel ch;
    Supervisor sup(ch.sender());
    TerminalSessionBroker broker(sup, ch.sender(), plain_sh());
    SessionHandle done = broker.open();
    SessionHandle live = broker.open();
    ASSERT_FALSE(done.send("exit 0\n").has_value());
    std::vector<Event> seen;
    ASSERT_TRUE(drain_until(ch, seen, has_exit_for(terminal_source_id(done.id()))));
    EXPECT_EQ(broker.prune_closed(), 1u);
    EXPECT_EQ(broker.sessions(), (std::vector<SessionId>{live.id()}));
    auto err = broker.write(done.id(), "x");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::SessionStateError);
    EXPECT_TRUE(broker.state(live.id()).has_value());
}
