#pragma once

#include "config/config_schema.hpp"
#include "runtime/runtime.hpp"
#include "runtime/workspace_fs.hpp"
#include "shell/shell_session.hpp"

namespace agentbox::server {

// Runtime that lives inside the sandbox: commands go to the persistent
// shell, file actions to the working directory.
class ActionExecutor : public runtime::Runtime {
public:
    ActionExecutor(shell::ShellSession& shell, const config::ServerConfig& config);
    ~ActionExecutor() override;

    void Start(const std::string& session_id) override;
    void Stop() override;

    std::string ReadFile(const std::string& path) override;
    std::size_t WriteFile(const std::string& path, const std::string& content) override;
    std::vector<runtime::FileInfo> ListFiles(const std::string& path) override;
    runtime::CommandResult RunCommand(const std::string& command,
                                      const std::optional<std::string>& working_dir,
                                      std::chrono::seconds timeout) override;

    nlohmann::json Status() const override;
    const char* type_name() const override { return "sandbox"; }

    const runtime::WorkspaceFs& fs() const { return fs_; }

protected:
    void DeletePath(const std::string& path) override;
    void MakeDirectory(const std::string& path) override;
    std::vector<runtime::SearchMatch> SearchFiles(const events::SearchAction& search) override;
    int SpawnBackground(const std::string& command,
                        const std::optional<std::string>& working_dir) override;
    void TerminateProcess(int pid) override;

private:
    shell::ShellSession& shell_;
    runtime::WorkspaceFs fs_;
};

}  // namespace agentbox::server
