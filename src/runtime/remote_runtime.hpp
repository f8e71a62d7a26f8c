#pragma once

#include <memory>

#include "runtime/runtime.hpp"

namespace httplib {
class Client;
}

namespace agentbox::runtime {

// Forwards every action to an Execution Server reachable at
// `config.server_url`.
class RemoteRuntime : public Runtime {
public:
    explicit RemoteRuntime(config::RuntimeConfig config);
    ~RemoteRuntime() override;

    void Start(const std::string& session_id) override;
    void Stop() override;

    std::string ReadFile(const std::string& path) override;
    std::size_t WriteFile(const std::string& path, const std::string& content) override;
    std::vector<FileInfo> ListFiles(const std::string& path) override;
    CommandResult RunCommand(const std::string& command,
                             const std::optional<std::string>& working_dir,
                             std::chrono::seconds timeout) override;

    nlohmann::json Status() const override;
    const char* type_name() const override { return "remote"; }

protected:
    events::Observation Dispatch(const events::Action& action) override;

    void DeletePath(const std::string& path) override;
    void MakeDirectory(const std::string& path) override;
    std::vector<SearchMatch> SearchFiles(const events::SearchAction& search) override;
    int SpawnBackground(const std::string& command,
                        const std::optional<std::string>& working_dir) override;
    void TerminateProcess(int pid) override;

private:
    events::Observation Forward(const events::Action& action, int read_timeout_s);
    httplib::Client& Client();

    std::unique_ptr<httplib::Client> client_;
};

}  // namespace agentbox::runtime
