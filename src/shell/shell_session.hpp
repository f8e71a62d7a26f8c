#pragma once

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>

#include <sys/types.h>

namespace agentbox::shell {

class ShellError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ShellResult {
    int exit_code = -1;
    std::string output;
    bool timed_out = false;
};

// A long-lived interactive shell on a pseudo-terminal. Working directory,
// exported variables and jobs persist between Execute calls.
class ShellSession {
public:
    explicit ShellSession(std::string working_dir, std::string shell = "/bin/bash");
    ~ShellSession();

    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    // Idempotent. Throws ShellError when the pty or the shell cannot be set up.
    void Start();

    // Serialised per session. A timed out command kills the shell, which is
    // restarted in the configured working directory before returning.
    ShellResult Execute(const std::string& command, std::chrono::milliseconds timeout);

    // Idempotent; also run by the destructor.
    void Stop();

    bool IsRunning() const;
    pid_t pid() const;
    const std::string& working_dir() const { return working_dir_; }

private:
    enum class ReadStatus {
        kData,
        kIdle,
        kClosed
    };

    void StartLocked();
    void StopLocked();
    ReadStatus ReadChunk(int timeout_ms, std::string& out);
    void WriteAll(const std::string& data);
    void Drain();
    int ReapExitCode(std::chrono::milliseconds wait);
    void KillForeground();

    std::string working_dir_;
    std::string shell_;
    mutable std::mutex mutex_;
    int master_fd_ = -1;
    pid_t pid_ = -1;
};

}  // namespace agentbox::shell
