#include <gtest/gtest.h>
#include <dockstack/config/config.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace dockstack;

TEST(Config, DefaultsWithoutFile) {
    auto res = load_config("/nonexistent/dir/dockstackrc");
    EXPECT_FALSE(res.file_found);
    EXPECT_TRUE(res.warnings.empty());
    EXPECT_EQ(res.config.docker_program, "docker");
    EXPECT_EQ(res.config.log_buffer_max, 5000u);
    EXPECT_EQ(res.config.log_buffer_keep, 3000u);
    EXPECT_EQ(res.config.grace_period.count(), 3000);
}

TEST(Config, ParsesKnownKeys) {
    std::istringstream in(
        "# comment\n"
        "\n"
        "docker_program=/usr/local/bin/docker\n"
        "compose_mode = standalone\n"
        "project_dir=/srv/app\n"
        "log_tail=250\n"
        "stats_interval_ms=500\n"
        "grace_period_ms=1500\n"
        "log_level=debug\n"
        "log_buffer_max=100\n"
        "log_buffer_keep=40\n");
    auto res = parse_config(in);
    EXPECT_TRUE(res.warnings.empty());
    EXPECT_EQ(res.config.docker_program, "/usr/local/bin/docker");
    EXPECT_EQ(res.config.compose_mode, ComposeMode::Standalone);
    EXPECT_EQ(res.config.project_dir, "/srv/app");
    EXPECT_EQ(res.config.log_tail, 250u);
    EXPECT_EQ(res.config.stats_interval.count(), 500);
    EXPECT_EQ(res.config.grace_period.count(), 1500);
    EXPECT_EQ(res.config.log_level, LogLevel::Debug);
    EXPECT_EQ(res.config.log_buffer_max, 100u);
    EXPECT_EQ(res.config.log_buffer_keep, 40u);
}

TEST(Config, BadLinesBecomeWarnings) {
    std::istringstream in(
        "log_tail=lots\n"
        "colour=blue\n"
        "just words\n"
        "compose_mode=sometimes\n"
        "stats_interval_ms=0\n");
    auto res = parse_config(in);
    ASSERT_EQ(res.warnings.size(), 5u);
    EXPECT_EQ(res.warnings[0].line_no, 1u);
    EXPECT_EQ(res.warnings[1].line_no, 2u);
    EXPECT_NE(res.warnings[1].message.find("colour"), std::string::npos);
    EXPECT_EQ(res.warnings[2].line_no, 3u);
    EXPECT_EQ(res.config.log_tail, 100u);
    EXPECT_EQ(res.config.compose_mode, ComposeMode::Auto);
    EXPECT_EQ(res.config.stats_interval.count(), 2000);
}

TEST(Config, OversizedNumbersAreRejected) {
    std::istringstream in(
        "log_tail=4294967296\n"
        "grace_period_ms=99999999999\n"
        "log_tail=250\n");
    auto res = parse_config(in);
    ASSERT_EQ(res.warnings.size(), 2u);
    EXPECT_EQ(res.warnings[0].line_no, 1u);
    EXPECT_NE(res.warnings[0].message.find("out of range"), std::string::npos);
    EXPECT_EQ(res.warnings[1].line_no, 2u);
    EXPECT_EQ(res.config.log_tail, 250u);
    EXPECT_EQ(res.config.grace_period.count(), 3000);
}

TEST(Config, KeepClampedToMax) {
    std::istringstream in("log_buffer_max=10\nlog_buffer_keep=20\n");
    auto res = parse_config(in);
    ASSERT_EQ(res.warnings.size(), 1u);
    EXPECT_EQ(res.config.log_buffer_keep, 10u);
}

TEST(Config, LoadsFromFile) {
    char path[] = "/tmp/dockstackrcXXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    { std::ofstream out(path); out << "term=vt100\nproject_id=demo\n"; }
    auto res = load_config(path);
    unlink(path);
    EXPECT_TRUE(res.file_found);
    EXPECT_EQ(res.path, path);
    EXPECT_EQ(res.config.term, "vt100");
    EXPECT_EQ(effective_project_id(res.config), "demo");
}

TEST(Config, ProjectIdFromDirectoryName) {
    Config c;
    c.project_dir = "/home/user/My Web_App";
    EXPECT_EQ(effective_project_id(c), "myweb_app");
    c.project_dir = "/home/user/stack/";
    EXPECT_EQ(effective_project_id(c), "stack");
}

TEST(Config, EnvironmentOverridesLogLevel) {
    setenv("DOCKSTACK_LOG", "error", 1);
    Config c;
    auto w = apply_environment(c);
    EXPECT_TRUE(w.empty());
    EXPECT_EQ(c.log_level, LogLevel::Error);
    setenv("DOCKSTACK_LOG", "shouty", 1);
    w = apply_environment(c);
    EXPECT_EQ(w.size(), 1u);
    EXPECT_EQ(c.log_level, LogLevel::Error);
    unsetenv("DOCKSTACK_LOG");
}

TEST(Config, DefaultPathHonoursEnvironment) {
    setenv("DOCKSTACK_CONFIG", "/etc/dockstack.conf", 1);
    EXPECT_EQ(default_config_path(), "/etc/dockstack.conf");
    unsetenv("DOCKSTACK_CONFIG");
    const char* home = std::getenv("HOME");
    if (home) EXPECT_EQ(default_config_path(), std::string(home) + "/.dockstackrc");
}
