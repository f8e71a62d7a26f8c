#include "shell/shell_session.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <signal.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include "shell/sentinel_frame.hpp"
#include "utils/common.hpp"
#include "utils/encoding.hpp"

namespace agentbox::shell {
namespace {

constexpr auto kStartupTimeout = std::chrono::seconds(10);
constexpr auto kStopGrace = std::chrono::seconds(2);

bool IsBash(const std::string& shell) {
    return std::filesystem::path(shell).filename().string().find("bash") != std::string::npos;
}

std::string Abbreviate(const std::string& command) {
    if (command.size() <= 80) {
        return command;
    }
    return command.substr(0, 77) + "...";
}

}  // namespace

ShellSession::ShellSession(std::string working_dir, std::string shell)
    : working_dir_(std::move(working_dir)),
      shell_(std::move(shell)) {}

ShellSession::~ShellSession() {
    Stop();
}

void ShellSession::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    StartLocked();
}

void ShellSession::Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    StopLocked();
}

bool ShellSession::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_ > 0;
}

pid_t ShellSession::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

void ShellSession::StartLocked() {
    if (pid_ > 0) {
        return;
    }

    int master = -1;
    const pid_t pid = ::forkpty(&master, nullptr, nullptr, nullptr);
    if (pid < 0) {
        throw ShellError(std::string("forkpty failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        struct termios tio {};
        if (::tcgetattr(STDIN_FILENO, &tio) == 0) {
            tio.c_lflag &= ~(ECHO | ECHONL);
            ::tcsetattr(STDIN_FILENO, TCSANOW, &tio);
        }
        if (!working_dir_.empty() && ::chdir(working_dir_.c_str()) != 0) {
            ::_exit(126);
        }
        ::setenv("TERM", "dumb", 1);
        if (IsBash(shell_)) {
            ::execl(shell_.c_str(), shell_.c_str(), "--noediting", "--login", "-i",
                    static_cast<char*>(nullptr));
        } else {
            ::execl(shell_.c_str(), shell_.c_str(), "-i", static_cast<char*>(nullptr));
        }
        ::_exit(127);
    }

    master_fd_ = master;
    pid_ = pid;
    ::fcntl(master_fd_, F_SETFD, FD_CLOEXEC);
    std::cerr << "[shell] start pid=" << pid_ << " shell=" << shell_
              << " working_dir=" << working_dir_ << std::endl;

    try {
        WriteAll("stty -echo 2>/dev/null; export PS1='' PS2='' PROMPT_COMMAND='' TERM=dumb; unset HISTFILE\n");
        SentinelFrame frame(utils::RandomHex(8));
        WriteAll(frame.Begin("cd " + utils::ShellQuote(working_dir_)));
        const auto deadline = std::chrono::steady_clock::now() + kStartupTimeout;
        std::string chunk;
        while (!frame.Done()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                frame.MarkTimedOut();
                break;
            }
            chunk.clear();
            const auto status = ReadChunk(100, chunk);
            if (status == ReadStatus::kClosed) {
                throw ShellError("shell exited during startup");
            }
            if (status == ReadStatus::kData) {
                frame.Feed(chunk);
            }
        }
        if (frame.state() != SentinelFrame::State::kComplete) {
            throw ShellError("shell did not respond during startup");
        }
        const auto handshake = frame.Result();
        if (handshake.exit_code != 0) {
            throw ShellError("cannot enter working directory: " + working_dir_);
        }
    } catch (const ShellError&) {
        StopLocked();
        throw;
    }
}

void ShellSession::StopLocked() {
    if (pid_ > 0) {
        ::kill(-pid_, SIGTERM);
        ::kill(-pid_, SIGHUP);
        ::kill(pid_, SIGTERM);
        int status = 0;
        bool reaped = false;
        const auto deadline = std::chrono::steady_clock::now() + kStopGrace;
        while (std::chrono::steady_clock::now() < deadline) {
            const auto waited = ::waitpid(pid_, &status, WNOHANG);
            if (waited == pid_ || waited < 0) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!reaped) {
            ::kill(-pid_, SIGKILL);
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, &status, 0);
        }
        std::cerr << "[shell] stop pid=" << pid_ << std::endl;
        pid_ = -1;
    }
    if (master_fd_ >= 0) {
        ::close(master_fd_);
        master_fd_ = -1;
    }
}

ShellResult ShellSession::Execute(const std::string& command, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    StartLocked();
    Drain();

    SentinelFrame frame(utils::RandomHex(8));
    WriteAll(frame.Begin(command));

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string chunk;
    while (!frame.Done()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            frame.MarkTimedOut();
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        chunk.clear();
        const auto status = ReadChunk(static_cast<int>(std::min<long long>(remaining.count(), 100)), chunk);
        if (status == ReadStatus::kData) {
            frame.Feed(chunk);
        } else if (status == ReadStatus::kClosed) {
            // The command ended the shell itself, e.g. `exit 42`.
            ShellResult result{};
            result.output = frame.Result().output;
            result.exit_code = ReapExitCode(kStopGrace);
            std::cerr << "[shell] exited command=" << Abbreviate(command)
                      << " exit=" << result.exit_code << std::endl;
            StopLocked();
            return result;
        }
    }

    ShellResult result{};
    if (frame.state() == SentinelFrame::State::kTimedOut) {
        result.output = frame.Result().output;
        result.exit_code = -1;
        result.timed_out = true;
        std::cerr << "[shell] timeout command=" << Abbreviate(command)
                  << " timeout_ms=" << timeout.count() << std::endl;
        KillForeground();
        StopLocked();
        try {
            StartLocked();
        } catch (const ShellError& ex) {
            std::cerr << "[shell] restart failed: " << ex.what() << std::endl;
        }
        return result;
    }
    const auto parsed = frame.Result();
    result.exit_code = parsed.exit_code;
    result.output = parsed.output;
    return result;
}

ShellSession::ReadStatus ShellSession::ReadChunk(int timeout_ms, std::string& out) {
    if (master_fd_ < 0) {
        return ReadStatus::kClosed;
    }
    struct pollfd pfd {};
    pfd.fd = master_fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready < 0) {
        return errno == EINTR ? ReadStatus::kIdle : ReadStatus::kClosed;
    }
    if (ready == 0) {
        return ReadStatus::kIdle;
    }
    if (pfd.revents & POLLIN) {
        char buffer[4096];
        const auto n = ::read(master_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            return ReadStatus::kData;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            return ReadStatus::kIdle;
        }
        return ReadStatus::kClosed;
    }
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        return ReadStatus::kClosed;
    }
    return ReadStatus::kIdle;
}

void ShellSession::WriteAll(const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const auto n = ::write(master_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            throw ShellError(std::string("write to pty failed: ") + std::strerror(errno));
        }
        written += static_cast<std::size_t>(n);
    }
}

void ShellSession::Drain() {
    std::string discarded;
    while (ReadChunk(0, discarded) == ReadStatus::kData) {
        discarded.clear();
    }
}

int ShellSession::ReapExitCode(std::chrono::milliseconds wait) {
    if (pid_ <= 0) {
        return -1;
    }
    int status = 0;
    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid_, &status, WNOHANG);
        if (waited == pid_) {
            pid_ = -1;
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }
        if (waited < 0) {
            pid_ = -1;
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return -1;
}

void ShellSession::KillForeground() {
    if (master_fd_ < 0) {
        return;
    }
    const pid_t group = ::tcgetpgrp(master_fd_);
    if (group > 0 && group != pid_) {
        ::kill(-group, SIGKILL);
    }
}

}  // namespace agentbox::shell
