#pragma once

#include <filesystem>
#include <memory>

#include "runtime/runtime.hpp"
#include "runtime/workspace_fs.hpp"

namespace agentbox::runtime {

// Runs commands as host subprocesses inside `<workspace_dir>/<session_id>`.
class LocalRuntime : public Runtime {
public:
    explicit LocalRuntime(config::RuntimeConfig config);
    ~LocalRuntime() override;

    void Start(const std::string& session_id) override;
    void Stop() override;

    std::string ReadFile(const std::string& path) override;
    std::size_t WriteFile(const std::string& path, const std::string& content) override;
    std::vector<FileInfo> ListFiles(const std::string& path) override;
    CommandResult RunCommand(const std::string& command,
                             const std::optional<std::string>& working_dir,
                             std::chrono::seconds timeout) override;

    nlohmann::json Status() const override;
    const char* type_name() const override { return "local"; }

    const std::filesystem::path& workspace() const { return workspace_; }

protected:
    void DeletePath(const std::string& path) override;
    void MakeDirectory(const std::string& path) override;
    std::vector<SearchMatch> SearchFiles(const events::SearchAction& search) override;
    int SpawnBackground(const std::string& command,
                        const std::optional<std::string>& working_dir) override;
    void TerminateProcess(int pid) override;

private:
    const WorkspaceFs& Fs() const;
    std::filesystem::path WorkingDirectory(const std::optional<std::string>& working_dir) const;
    void SeedWorkspace();

    std::filesystem::path workspace_;
    std::unique_ptr<WorkspaceFs> fs_;
};

// Rejects ids that are empty or could address another directory.
void ValidateSessionId(const std::string& session_id);

}  // namespace agentbox::runtime
