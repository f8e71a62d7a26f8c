#pragma once

#include <string>

namespace agentbox::shell {

struct FrameResult {
    int exit_code = -1;
    std::string output;
};

// Delimits one command's output in a pty byte stream.
//
// The command is written between two printf'd markers carrying a random
// nonce, followed by an exit-code probe. The printf format keeps the literal
// marker out of any echoed input, so only the shell's own output can match.
class SentinelFrame {
public:
    enum class State {
        kIdle,
        kAwaitingStart,
        kAwaitingEnd,
        kComplete,
        kTimedOut
    };

    explicit SentinelFrame(std::string nonce);

    // Script to write to the shell. Moves Idle to AwaitingStart.
    std::string Begin(const std::string& command);

    // Accepts arbitrary chunks, markers may be split across calls.
    State Feed(const std::string& chunk);

    void MarkTimedOut();

    State state() const { return state_; }
    bool Done() const { return state_ == State::kComplete || state_ == State::kTimedOut; }
    const std::string& buffer() const { return buffer_; }

    // Interior between the markers with the exit probe removed, carriage
    // returns and ANSI escapes stripped. Partial output before completion.
    FrameResult Result() const;

    static std::string StripAnsi(const std::string& text);

private:
    std::string nonce_;
    std::string start_marker_;
    std::string end_marker_;
    State state_ = State::kIdle;
    std::string buffer_;
    std::size_t body_begin_ = std::string::npos;
    std::size_t body_end_ = std::string::npos;
};

const char* ToString(SentinelFrame::State state);

}  // namespace agentbox::shell
