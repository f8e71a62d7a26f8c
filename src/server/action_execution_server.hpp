#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "config/config_schema.hpp"
#include "events/action.hpp"
#include "events/observation.hpp"
#include "server/action_executor.hpp"
#include "shell/shell_session.hpp"

namespace httplib {
class Server;
}

namespace agentbox::server {

// HTTP front of the sandbox. Owns the one shell session actions run in.
//
// Routes:
//   POST   /execute_action   {"action": {...}} -> observation
//   GET    /files?path=      directory listing
//   GET    /file/<path>      {content, encoding}
//   POST   /file/<path>      body {content, encoding}
//   DELETE /file/<path>
//   GET    /health, GET /
//
// When an API key is configured every route except /health and / requires
// it in X-Session-API-Key.
class ActionExecutionServer {
public:
    explicit ActionExecutionServer(config::ServerConfig config);
    ~ActionExecutionServer();

    ActionExecutionServer(const ActionExecutionServer&) = delete;
    ActionExecutionServer& operator=(const ActionExecutionServer&) = delete;

    // Starts the shell. Throws runtime::RuntimeError on failure.
    void Initialize();

    // Blocks until Stop(). Returns false when the socket cannot be bound.
    bool Listen();

    // Binds an ephemeral port and returns it, or -1.
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();

    void Stop();
    bool IsRunning() const;

    events::Observation Execute(const events::Action& action);

    const config::ServerConfig& config() const { return config_; }

private:
    void RegisterRoutes();
    bool Authorized(const std::string& provided) const;

    config::ServerConfig config_;
    shell::ShellSession shell_;
    ActionExecutor executor_;
    std::unique_ptr<httplib::Server> http_;
    std::mutex action_mutex_;
};

}  // namespace agentbox::server
