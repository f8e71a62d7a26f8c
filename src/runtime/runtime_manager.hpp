#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "runtime/runtime.hpp"

namespace agentbox::runtime {

// The single place a runtime type is turned into a concrete Runtime.
// Throws RuntimeError for an unknown type.
std::shared_ptr<Runtime> MakeRuntime(const config::RuntimeConfig& config);

// Owns at most one Runtime per session id.
class RuntimeManager {
public:
    using Factory = std::function<std::shared_ptr<Runtime>(const config::RuntimeConfig&)>;

    explicit RuntimeManager(Factory factory = MakeRuntime);
    ~RuntimeManager();

    RuntimeManager(const RuntimeManager&) = delete;
    RuntimeManager& operator=(const RuntimeManager&) = delete;

    // Builds and starts a runtime. Throws RuntimeError when the session
    // already has a live runtime or when Start fails.
    std::shared_ptr<Runtime> CreateRuntime(const std::string& session_id, const config::RuntimeConfig& config);
    std::shared_ptr<Runtime> GetRuntime(const std::string& session_id) const;

    // No-op for unknown sessions.
    void StopRuntime(const std::string& session_id);
    void CleanupAll();

    std::vector<std::string> ActiveSessions() const;

    // Error observation when the session has no runtime.
    events::Observation ExecuteAction(const std::string& session_id, const events::Action& action);

private:
    Factory factory_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Runtime>> runtimes_;
};

}  // namespace agentbox::runtime
