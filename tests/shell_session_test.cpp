#include <chrono>

#include <gtest/gtest.h>

#include "shell/shell_session.hpp"
#include "test_support.hpp"

namespace {

using agentbox::shell::ShellError;
using agentbox::shell::ShellSession;
using agentbox::testing::TempWorkspace;
using namespace std::chrono_literals;

class ShellSessionTest : public ::testing::Test {
protected:
    TempWorkspace workspace_{"shell"};
    ShellSession shell_{workspace_.root().string()};
};

TEST_F(ShellSessionTest, ReportsExitCodes) {
    EXPECT_EQ(shell_.Execute("true", 10s).exit_code, 0);
    EXPECT_EQ(shell_.Execute("false", 10s).exit_code, 1);
    EXPECT_EQ(shell_.Execute("(exit 7)", 10s).exit_code, 7);
}

TEST_F(ShellSessionTest, ExitFromShellReportsStatusAndRestarts) {
    const auto result = shell_.Execute("exit 42", 10s);
    EXPECT_EQ(result.exit_code, 42);
    EXPECT_FALSE(result.timed_out);
    const auto next = shell_.Execute("echo back", 10s);
    EXPECT_EQ(next.exit_code, 0);
    EXPECT_EQ(next.output, "back");
}

TEST_F(ShellSessionTest, StartsInWorkingDirectory) {
    const auto result = shell_.Execute("pwd", 10s);
    EXPECT_EQ(result.output, workspace_.root().string());
}

TEST_F(ShellSessionTest, StatePersistsAcrossCommands) {
    shell_.Execute("cd /tmp", 10s);
    EXPECT_EQ(shell_.Execute("pwd", 10s).output, "/tmp");
    shell_.Execute("export AGENTBOX_PROBE=persisted", 10s);
    EXPECT_EQ(shell_.Execute("echo $AGENTBOX_PROBE", 10s).output, "persisted");
}

TEST_F(ShellSessionTest, OutputsDoNotBleedBetweenCommands) {
    EXPECT_EQ(shell_.Execute("echo first", 10s).output, "first");
    const auto second = shell_.Execute("echo second", 10s);
    EXPECT_EQ(second.output, "second");
    EXPECT_EQ(second.output.find("first"), std::string::npos);
}

TEST_F(ShellSessionTest, CapturesStderrAndMultilineOutput) {
    const auto result = shell_.Execute("echo out; echo err 1>&2; printf 'a\\nb\\n'", 10s);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("out"), std::string::npos);
    EXPECT_NE(result.output.find("err"), std::string::npos);
    EXPECT_NE(result.output.find("a\nb"), std::string::npos);
}

TEST_F(ShellSessionTest, TimeoutKillsAndRestartsShell) {
    shell_.Execute("cd /tmp", 10s);
    const auto started = std::chrono::steady_clock::now();
    const auto result = shell_.Execute("sleep 10", 1s);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_LT(elapsed, 6s);

    const auto next = shell_.Execute("pwd", 10s);
    EXPECT_FALSE(next.timed_out);
    EXPECT_EQ(next.output, workspace_.root().string());
}

TEST_F(ShellSessionTest, StartAndStopAreIdempotent) {
    shell_.Start();
    const auto pid = shell_.pid();
    shell_.Start();
    EXPECT_EQ(shell_.pid(), pid);
    EXPECT_TRUE(shell_.IsRunning());
    shell_.Stop();
    shell_.Stop();
    EXPECT_FALSE(shell_.IsRunning());
    EXPECT_EQ(shell_.Execute("echo again", 10s).output, "again");
}

TEST(ShellSessionStartTest, MissingWorkingDirectoryThrows) {
    ShellSession shell("/nonexistent/agentbox/dir");
    EXPECT_THROW(shell.Start(), ShellError);
    EXPECT_FALSE(shell.IsRunning());
}

}  // namespace
