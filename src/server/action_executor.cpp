#include "server/action_executor.hpp"

#include <filesystem>
#include <iostream>

#include "sandbox/process_runner.hpp"
#include "utils/common.hpp"

namespace agentbox::server {
namespace {

config::RuntimeConfig ToRuntimeConfig(const config::ServerConfig& server) {
    config::RuntimeConfig config{};
    config.runtime_type = config::RuntimeType::kLocal;
    config.workspace_dir = server.working_dir;
    config.timeout_s = server.shell_timeout_s;
    config.max_file_size = server.max_file_size;
    config.allowed_extensions.clear();
    config.shell = server.shell;
    return config;
}

runtime::WorkspaceFs::Policy ToPolicy(const config::ServerConfig& server) {
    runtime::WorkspaceFs::Policy policy{};
    policy.max_file_size = server.max_file_size;
    return policy;
}

}  // namespace

ActionExecutor::ActionExecutor(shell::ShellSession& shell, const config::ServerConfig& config)
    : Runtime(ToRuntimeConfig(config)),
      shell_(shell),
      fs_(config.working_dir, ToPolicy(config)) {}

ActionExecutor::~ActionExecutor() {
    Stop();
}

void ActionExecutor::Start(const std::string& session_id) {
    if (running_) {
        return;
    }
    session_id_ = session_id;
    try {
        shell_.Start();
    } catch (const shell::ShellError& ex) {
        throw runtime::RuntimeError(std::string("shell start failed: ") + ex.what());
    }
    running_ = true;
}

void ActionExecutor::Stop() {
    if (!running_) {
        return;
    }
    KillAllBackground();
    running_ = false;
}

std::string ActionExecutor::ReadFile(const std::string& path) {
    return fs_.Read(path);
}

std::size_t ActionExecutor::WriteFile(const std::string& path, const std::string& content) {
    return fs_.Write(path, content);
}

std::vector<runtime::FileInfo> ActionExecutor::ListFiles(const std::string& path) {
    return fs_.List(path);
}

void ActionExecutor::DeletePath(const std::string& path) {
    fs_.Remove(path);
}

void ActionExecutor::MakeDirectory(const std::string& path) {
    fs_.MakeDirectory(path);
}

std::vector<runtime::SearchMatch> ActionExecutor::SearchFiles(const events::SearchAction& search) {
    return fs_.Search(search);
}

// A working_dir moves the shell there for good, the way `cd` typed by the
// agent would.
runtime::CommandResult ActionExecutor::RunCommand(const std::string& command,
                                                  const std::optional<std::string>& working_dir,
                                                  std::chrono::seconds timeout) {
    std::string script = command;
    std::string cwd = fs_.root().string();
    if (working_dir && !working_dir->empty()) {
        const auto resolved = fs_.Resolve(*working_dir);
        std::error_code ec;
        if (!std::filesystem::is_directory(resolved, ec)) {
            throw runtime::FileAccessError("Working directory not found: " + *working_dir);
        }
        cwd = resolved.string();
        script = "cd " + utils::ShellQuote(cwd) + " && " + command;
    }

    const auto started = std::chrono::steady_clock::now();
    shell::ShellResult shell_result;
    try {
        shell_result = shell_.Execute(script, timeout);
    } catch (const shell::ShellError& ex) {
        throw runtime::RuntimeError(std::string("shell failure: ") + ex.what());
    }

    runtime::CommandResult result{};
    result.command = command;
    result.exit_code = shell_result.exit_code;
    result.stdout_text = shell_result.output;
    result.working_dir = cwd;
    result.execution_time = utils::SecondsSince(started);
    result.timed_out = shell_result.timed_out;
    return result;
}

int ActionExecutor::SpawnBackground(const std::string& command,
                                    const std::optional<std::string>& working_dir) {
    sandbox::ProcessOptions options{};
    options.working_dir = working_dir && !working_dir->empty()
        ? fs_.Resolve(*working_dir).string()
        : fs_.root().string();
    try {
        return sandbox::ProcessRunner::SpawnBackground(config_.shell, command, options);
    } catch (const std::runtime_error& ex) {
        throw runtime::RuntimeError(ex.what());
    }
}

void ActionExecutor::TerminateProcess(int pid) {
    sandbox::ProcessRunner::TerminateGroup(pid, std::chrono::milliseconds(2000));
}

nlohmann::json ActionExecutor::Status() const {
    auto status = Runtime::Status();
    status["working_dir"] = fs_.root().string();
    status["shell_pid"] = shell_.pid();
    return status;
}

}  // namespace agentbox::server
