#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "events/action.hpp"
#include "events/observation.hpp"
#include "nlohmann/json.hpp"

namespace agentbox::runtime {

// Infrastructure failures: container start, image pull, transport.
class RuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PathEscapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FileAccessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct FileInfo {
    std::string name;
    std::string path;
    bool is_directory = false;
    std::uintmax_t size = 0;
    double modified = 0.0;
    std::string permissions;
};

struct SearchMatch {
    std::string path;
    int line = 0;
    std::string text;
};

struct CommandResult {
    std::string command;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string working_dir;
    double execution_time = 0.0;
    bool timed_out = false;
};

nlohmann::json ToJson(const FileInfo& info);

// An isolated execution context bound to one session.
//
// ExecuteAction is the only entry point that never throws: every failure
// raised by a primitive is turned into an Error observation there. Start and
// Stop report infrastructure failures by throwing RuntimeError.
class Runtime {
public:
    explicit Runtime(config::RuntimeConfig config);
    virtual ~Runtime() = default;

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    virtual void Start(const std::string& session_id) = 0;
    virtual void Stop() = 0;

    events::Observation ExecuteAction(const events::Action& action);

    virtual std::string ReadFile(const std::string& path) = 0;
    virtual std::size_t WriteFile(const std::string& path, const std::string& content) = 0;
    virtual std::vector<FileInfo> ListFiles(const std::string& path) = 0;
    virtual CommandResult RunCommand(const std::string& command,
                                     const std::optional<std::string>& working_dir,
                                     std::chrono::seconds timeout) = 0;

    virtual nlohmann::json Status() const;
    virtual const char* type_name() const = 0;

    bool IsRunning() const { return running_; }
    const std::string& session_id() const { return session_id_; }
    const config::RuntimeConfig& config() const { return config_; }
    std::vector<std::string> BackgroundProcesses() const;

protected:
    virtual events::Observation Dispatch(const events::Action& action);

    virtual void DeletePath(const std::string& path) = 0;
    virtual void MakeDirectory(const std::string& path) = 0;
    virtual std::vector<SearchMatch> SearchFiles(const events::SearchAction& search) = 0;
    virtual int SpawnBackground(const std::string& command,
                                const std::optional<std::string>& working_dir) = 0;
    virtual void TerminateProcess(int pid) = 0;

    std::string RegisterBackground(int pid);
    void KillAllBackground();

    config::RuntimeConfig config_;
    std::string session_id_;
    bool running_ = false;

private:
    events::Observation Handle(const events::RunAction& action);
    events::Observation Handle(const events::WriteAction& action);
    events::Observation Handle(const events::ReadAction& action);
    events::Observation Handle(const events::EditAction& action);
    events::Observation Handle(const events::DeleteAction& action);
    events::Observation Handle(const events::CreateDirectoryAction& action);
    events::Observation Handle(const events::SearchAction& action);
    events::Observation Handle(const events::KillAction& action);

    std::map<std::string, int> background_;
    unsigned long background_counter_ = 0;
};

}  // namespace agentbox::runtime
