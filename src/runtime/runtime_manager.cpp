#include "runtime/runtime_manager.hpp"

#include <iostream>

#include "runtime/docker_runtime.hpp"
#include "runtime/local_runtime.hpp"
#include "runtime/remote_runtime.hpp"

namespace agentbox::runtime {

std::shared_ptr<Runtime> MakeRuntime(const config::RuntimeConfig& config) {
    switch (config.runtime_type) {
        case config::RuntimeType::kLocal:
            return std::make_shared<LocalRuntime>(config);
        case config::RuntimeType::kDocker:
            return std::make_shared<DockerRuntime>(config);
        case config::RuntimeType::kRemote:
            return std::make_shared<RemoteRuntime>(config);
    }
    throw RuntimeError("unknown runtime type: " + std::to_string(static_cast<int>(config.runtime_type)));
}

RuntimeManager::RuntimeManager(Factory factory)
    : factory_(std::move(factory)) {}

RuntimeManager::~RuntimeManager() {
    CleanupAll();
}

std::shared_ptr<Runtime> RuntimeManager::CreateRuntime(const std::string& session_id,
                                                       const config::RuntimeConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runtimes_.find(session_id);
        if (it != runtimes_.end() && it->second->IsRunning()) {
            throw RuntimeError("runtime already exists for session " + session_id);
        }
    }

    auto runtime = factory_(config);
    if (!runtime) {
        throw RuntimeError("runtime factory returned nothing for type " +
                           std::string(config::ToString(config.runtime_type)));
    }
    runtime->Start(session_id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = runtimes_[session_id];
    if (slot && slot->IsRunning()) {
        runtime->Stop();
        throw RuntimeError("runtime already exists for session " + session_id);
    }
    slot = runtime;
    std::cerr << "[runtime] created session=" << session_id
              << " type=" << runtime->type_name() << std::endl;
    return runtime;
}

std::shared_ptr<Runtime> RuntimeManager::GetRuntime(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runtimes_.find(session_id);
    return it == runtimes_.end() ? nullptr : it->second;
}

void RuntimeManager::StopRuntime(const std::string& session_id) {
    std::shared_ptr<Runtime> runtime;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runtimes_.find(session_id);
        if (it == runtimes_.end()) {
            return;
        }
        runtime = std::move(it->second);
        runtimes_.erase(it);
    }
    try {
        runtime->Stop();
    } catch (const std::exception& ex) {
        std::cerr << "[runtime] stop failed session=" << session_id << " error=" << ex.what() << std::endl;
    }
    std::cerr << "[runtime] removed session=" << session_id << std::endl;
}

void RuntimeManager::CleanupAll() {
    for (const auto& session_id : ActiveSessions()) {
        StopRuntime(session_id);
    }
}

std::vector<std::string> RuntimeManager::ActiveSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> sessions;
    sessions.reserve(runtimes_.size());
    for (const auto& [id, runtime] : runtimes_) {
        sessions.push_back(id);
    }
    return sessions;
}

events::Observation RuntimeManager::ExecuteAction(const std::string& session_id, const events::Action& action) {
    auto runtime = GetRuntime(session_id);
    if (!runtime) {
        return events::MakeError("No runtime found for session " + session_id, "runtime");
    }
    return runtime->ExecuteAction(action);
}

}  // namespace agentbox::runtime
