#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace agentbox::sandbox {

struct ProcessOptions {
    std::string working_dir;
    std::map<std::string, std::string> environment;
    std::chrono::milliseconds timeout{30000};
    std::optional<std::string> stdin_data;
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
    std::chrono::milliseconds duration{0};
    pid_t pid = -1;
};

// Spawns host processes in their own process group so a timeout can take
// down everything the command forked.
class ProcessRunner {
public:
    static ProcessResult Run(const std::vector<std::string>& argv, const ProcessOptions& options);
    static ProcessResult RunShell(const std::string& shell,
                                  const std::string& command,
                                  const ProcessOptions& options);

    // Returns the pid (also the process group id) of the detached child.
    // Throws std::runtime_error when the spawn fails.
    static pid_t SpawnBackground(const std::string& shell,
                                 const std::string& command,
                                 const ProcessOptions& options);

    static bool IsAlive(pid_t pid);

    // SIGTERM to the group, then SIGKILL once `grace` elapses. Reaps the pid.
    static void TerminateGroup(pid_t pid, std::chrono::milliseconds grace);
};

}  // namespace agentbox::sandbox
