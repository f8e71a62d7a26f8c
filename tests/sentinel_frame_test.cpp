#include <gtest/gtest.h>

#include "shell/sentinel_frame.hpp"

namespace {

using agentbox::shell::SentinelFrame;

const std::string kStart = "__AGENTBOX_START_abc123__";
const std::string kEnd = "__AGENTBOX_END_abc123__";

TEST(SentinelFrameTest, BeginWrapsCommandWithMarkersAndExitProbe) {
    SentinelFrame frame("abc123");
    EXPECT_EQ(frame.state(), SentinelFrame::State::kIdle);
    const auto script = frame.Begin("ls -la");
    EXPECT_EQ(frame.state(), SentinelFrame::State::kAwaitingStart);
    EXPECT_NE(script.find("printf '__AGENTBOX_START_%s__\\n' abc123\n"), std::string::npos);
    EXPECT_NE(script.find("ls -la\n"), std::string::npos);
    EXPECT_NE(script.find("echo \"__EXIT_CODE_$?__\""), std::string::npos);
    // The literal markers never appear in the script itself.
    EXPECT_EQ(script.find(kStart), std::string::npos);
    EXPECT_EQ(script.find(kEnd), std::string::npos);
}

TEST(SentinelFrameTest, ParsesCompleteFrame) {
    SentinelFrame frame("abc123");
    frame.Begin("echo hello");
    frame.Feed("noise\r\n" + kStart + "\r\nhello\r\n__EXIT_CODE_0__\r\n\r\n" + kEnd + "\r\n");
    ASSERT_EQ(frame.state(), SentinelFrame::State::kComplete);
    const auto result = frame.Result();
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello");
}

TEST(SentinelFrameTest, HandlesMarkersSplitAcrossChunks) {
    SentinelFrame frame("abc123");
    frame.Begin("false");
    const std::string stream = kStart + "\n__EXIT_CODE_1__\n\n" + kEnd + "\n";
    for (char c : stream) {
        frame.Feed(std::string(1, c));
    }
    ASSERT_TRUE(frame.Done());
    EXPECT_EQ(frame.Result().exit_code, 1);
    EXPECT_EQ(frame.Result().output, "");
}

TEST(SentinelFrameTest, OutputWithoutTrailingNewlineKeepsExitCode) {
    SentinelFrame frame("abc123");
    frame.Begin("printf partial");
    frame.Feed(kStart + "\npartial__EXIT_CODE_42__\n\n" + kEnd + "\n");
    const auto result = frame.Result();
    EXPECT_EQ(result.exit_code, 42);
    EXPECT_EQ(result.output, "partial");
}

TEST(SentinelFrameTest, StripsAnsiEscapes) {
    SentinelFrame frame("abc123");
    frame.Begin("ls --color");
    frame.Feed(kStart + "\n\x1b[01;34msrc\x1b[0m\n\x1b]0;title\x07" + "done\n__EXIT_CODE_0__\n" + kEnd + "\n");
    EXPECT_EQ(frame.Result().output, "src\ndone");
}

TEST(SentinelFrameTest, IgnoresOtherNonces) {
    SentinelFrame frame("abc123");
    frame.Begin("true");
    frame.Feed("__AGENTBOX_START_ffffff__\nold\n__AGENTBOX_END_ffffff__\n");
    EXPECT_EQ(frame.state(), SentinelFrame::State::kAwaitingStart);
}

TEST(SentinelFrameTest, TimeoutKeepsPartialOutput) {
    SentinelFrame frame("abc123");
    frame.Begin("sleep 10");
    frame.Feed(kStart + "\nstarted\r\n");
    EXPECT_EQ(frame.state(), SentinelFrame::State::kAwaitingEnd);
    frame.MarkTimedOut();
    EXPECT_EQ(frame.state(), SentinelFrame::State::kTimedOut);
    const auto result = frame.Result();
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(result.output, "started");
}

TEST(SentinelFrameTest, MissingProbeDefaultsExitCode) {
    SentinelFrame frame("abc123");
    frame.Begin("true");
    frame.Feed(kStart + "\nno probe here\n" + kEnd + "\n");
    EXPECT_EQ(frame.Result().exit_code, -1);
    EXPECT_EQ(frame.Result().output, "no probe here");
}

TEST(SentinelFrameTest, FeedAfterCompletionIsIgnored) {
    SentinelFrame frame("abc123");
    frame.Begin("true");
    frame.Feed(kStart + "\n__EXIT_CODE_0__\n" + kEnd + "\n");
    frame.Feed("late output");
    EXPECT_EQ(frame.Result().output, "");
    EXPECT_EQ(frame.state(), SentinelFrame::State::kComplete);
}

}  // namespace
