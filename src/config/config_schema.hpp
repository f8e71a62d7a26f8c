#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentbox::config {

enum class RuntimeType {
    kLocal,
    kDocker,
    kRemote
};

inline const char* ToString(RuntimeType type) {
    switch (type) {
        case RuntimeType::kLocal: return "local";
        case RuntimeType::kDocker: return "docker";
        case RuntimeType::kRemote: return "remote";
    }
    return "unknown";
}

inline std::optional<RuntimeType> ParseRuntimeType(const std::string& value) {
    if (value == "local") {
        return RuntimeType::kLocal;
    }
    if (value == "docker") {
        return RuntimeType::kDocker;
    }
    if (value == "remote") {
        return RuntimeType::kRemote;
    }
    return std::nullopt;
}

struct RuntimeConfig {
    RuntimeType runtime_type = RuntimeType::kDocker;
    // Local runtime: base directory for per-session workspaces.
    // Docker runtime: mount point of the workspace inside the container.
    std::string workspace_dir = "/workspace";
    int timeout_s = 300;

    // Docker
    std::string docker_binary = "docker";
    std::string container_image = "python:3.12-slim";
    std::string container_name_prefix = "agentbox";
    std::string host_workspace_root = "/tmp/agentbox_workspaces";
    std::string memory_limit = "2g";
    std::string cpu_limit = "1";
    std::vector<std::string> setup_commands;

    // Network
    bool enable_networking = true;
    std::vector<std::string> dns_servers{"8.8.8.8", "8.8.4.4"};

    // Security
    int user_id = 1000;
    int group_id = 1000;
    bool read_only_root = false;

    std::map<std::string, std::string> environment;

    // Files
    std::size_t max_file_size = 100 * 1024 * 1024;
    std::vector<std::string> allowed_extensions{
        ".py", ".js", ".ts", ".html", ".css", ".json", ".md", ".txt", ".sh"};

    std::string shell = "/bin/bash";

    // Remote
    std::string server_url = "http://127.0.0.1:8000";
    std::string api_key;
    int connect_timeout_s = 30;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::string working_dir = "/workspace";
    std::string api_key;
    int shell_timeout_s = 30;
    std::string shell = "/bin/bash";
    std::size_t max_file_size = 100 * 1024 * 1024;
};

struct Config {
    RuntimeConfig runtime;
    ServerConfig server;
};

}  // namespace agentbox::config
