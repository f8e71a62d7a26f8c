#include "shell/sentinel_frame.hpp"

#include <cctype>

#include "utils/common.hpp"

namespace agentbox::shell {
namespace {

constexpr const char* kExitProbe = "__EXIT_CODE_";

// Finds the last "__EXIT_CODE_<digits>__" occurrence in `text`.
std::size_t FindExitProbe(const std::string& text, int& code) {
    const std::string probe = kExitProbe;
    auto pos = text.rfind(probe);
    while (pos != std::string::npos) {
        std::size_t cursor = pos + probe.size();
        std::size_t digits_begin = cursor;
        while (cursor < text.size() && std::isdigit(static_cast<unsigned char>(text[cursor]))) {
            ++cursor;
        }
        if (cursor > digits_begin && text.compare(cursor, 2, "__") == 0) {
            try {
                code = std::stoi(text.substr(digits_begin, cursor - digits_begin));
            } catch (const std::exception&) {
                code = -1;
            }
            return pos;
        }
        if (pos == 0) {
            break;
        }
        pos = text.rfind(probe, pos - 1);
    }
    return std::string::npos;
}

std::string RemoveCarriageReturns(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != '\r') {
            out += c;
        }
    }
    return out;
}

}  // namespace

const char* ToString(SentinelFrame::State state) {
    switch (state) {
        case SentinelFrame::State::kIdle: return "idle";
        case SentinelFrame::State::kAwaitingStart: return "awaiting_start";
        case SentinelFrame::State::kAwaitingEnd: return "awaiting_end";
        case SentinelFrame::State::kComplete: return "complete";
        case SentinelFrame::State::kTimedOut: return "timed_out";
    }
    return "unknown";
}

SentinelFrame::SentinelFrame(std::string nonce)
    : nonce_(std::move(nonce)),
      start_marker_("__AGENTBOX_START_" + nonce_ + "__"),
      end_marker_("__AGENTBOX_END_" + nonce_ + "__") {}

std::string SentinelFrame::Begin(const std::string& command) {
    state_ = State::kAwaitingStart;
    buffer_.clear();
    body_begin_ = std::string::npos;
    body_end_ = std::string::npos;

    std::string script;
    script += "printf '__AGENTBOX_START_%s__\\n' " + nonce_ + "\n";
    script += command;
    if (command.empty() || command.back() != '\n') {
        script += "\n";
    }
    script += "echo \"__EXIT_CODE_$?__\"\n";
    script += "printf '\\n__AGENTBOX_END_%s__\\n' " + nonce_ + "\n";
    return script;
}

SentinelFrame::State SentinelFrame::Feed(const std::string& chunk) {
    if (state_ == State::kIdle || Done()) {
        return state_;
    }
    buffer_ += chunk;

    if (state_ == State::kAwaitingStart) {
        const auto pos = buffer_.find(start_marker_);
        if (pos == std::string::npos) {
            return state_;
        }
        auto line_end = buffer_.find('\n', pos + start_marker_.size());
        if (line_end == std::string::npos) {
            return state_;
        }
        body_begin_ = line_end + 1;
        state_ = State::kAwaitingEnd;
    }

    if (state_ == State::kAwaitingEnd) {
        const auto pos = buffer_.find(end_marker_, body_begin_);
        if (pos != std::string::npos) {
            body_end_ = pos;
            state_ = State::kComplete;
        }
    }
    return state_;
}

void SentinelFrame::MarkTimedOut() {
    if (state_ != State::kComplete) {
        state_ = State::kTimedOut;
    }
}

FrameResult SentinelFrame::Result() const {
    FrameResult result{};
    if (body_begin_ == std::string::npos || body_begin_ > buffer_.size()) {
        return result;
    }
    const auto end = body_end_ == std::string::npos ? buffer_.size() : body_end_;
    auto body = StripAnsi(RemoveCarriageReturns(buffer_.substr(body_begin_, end - body_begin_)));

    int code = -1;
    const auto probe = FindExitProbe(body, code);
    if (probe != std::string::npos) {
        body.erase(probe);
        result.exit_code = code;
    }
    result.output = utils::Trim(body);
    return result;
}

std::string SentinelFrame::StripAnsi(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '\x1b') {
            out += text[i++];
            continue;
        }
        ++i;
        if (i >= text.size()) {
            break;
        }
        if (text[i] == '[') {
            // CSI: parameters and intermediates up to a final byte in 0x40-0x7e.
            ++i;
            while (i < text.size() && !(text[i] >= 0x40 && text[i] <= 0x7e)) {
                ++i;
            }
            ++i;
        } else if (text[i] == ']') {
            // OSC: terminated by BEL or ESC backslash.
            ++i;
            while (i < text.size()) {
                if (text[i] == '\a') {
                    ++i;
                    break;
                }
                if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '\\') {
                    i += 2;
                    break;
                }
                ++i;
            }
        } else {
            ++i;
        }
    }
    return out;
}

}  // namespace agentbox::shell
