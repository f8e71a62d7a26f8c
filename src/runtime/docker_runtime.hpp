#pragma once

#include <memory>

#include "runtime/runtime.hpp"
#include "sandbox/docker_client.hpp"

namespace agentbox::runtime {

// One hardened container per session. Every primitive runs through
// `docker exec` against paths inside the container; the host bind mount is
// never read or written directly.
class DockerRuntime : public Runtime {
public:
    explicit DockerRuntime(config::RuntimeConfig config,
                           std::shared_ptr<sandbox::DockerClient> client = nullptr);
    ~DockerRuntime() override;

    void Start(const std::string& session_id) override;
    void Stop() override;

    std::string ReadFile(const std::string& path) override;
    std::size_t WriteFile(const std::string& path, const std::string& content) override;
    std::vector<FileInfo> ListFiles(const std::string& path) override;
    CommandResult RunCommand(const std::string& command,
                             const std::optional<std::string>& working_dir,
                             std::chrono::seconds timeout) override;

    nlohmann::json Status() const override;
    const char* type_name() const override { return "docker"; }

    const std::string& container_id() const { return container_id_; }
    const std::string& container_name() const { return container_name_; }

    // Arguments of the `docker run` call for the current session.
    std::vector<std::string> BuildRunArgs(const std::string& host_workspace) const;

    // Absolute, normalised path inside the container workspace.
    // Throws PathEscapeError when `path` leaves it.
    std::string ContainerPath(const std::string& path) const;

protected:
    void DeletePath(const std::string& path) override;
    void MakeDirectory(const std::string& path) override;
    std::vector<SearchMatch> SearchFiles(const events::SearchAction& search) override;
    int SpawnBackground(const std::string& command,
                        const std::optional<std::string>& working_dir) override;
    void TerminateProcess(int pid) override;

private:
    sandbox::ProcessResult Exec(const std::string& script,
                                std::chrono::milliseconds timeout,
                                const std::optional<std::string>& stdin_data = std::nullopt,
                                bool as_root = false);
    void EnsureImage();
    void Provision();
    std::string Relative(const std::string& container_path) const;

    std::shared_ptr<sandbox::DockerClient> client_;
    std::string container_id_;
    std::string container_name_;
    std::string host_workspace_;
};

}  // namespace agentbox::runtime
