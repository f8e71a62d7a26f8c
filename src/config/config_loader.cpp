#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace agentbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::vector<std::string> ReadStringArray(const nlohmann::json& source) {
    std::vector<std::string> items;
    for (const auto& item : source) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

void ApplyRuntimeConfig(RuntimeConfig& runtime, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("type") && source["type"].is_string()) {
        const auto type = ParseRuntimeType(source["type"].get<std::string>());
        if (type) {
            runtime.runtime_type = *type;
        } else {
            std::cerr << "[config] unknown runtime type: " << source["type"].get<std::string>() << std::endl;
        }
    }
    if (source.contains("workspaceDir") && source["workspaceDir"].is_string()) {
        runtime.workspace_dir = source["workspaceDir"].get<std::string>();
    }
    if (source.contains("timeoutS") && source["timeoutS"].is_number_integer()) {
        runtime.timeout_s = source["timeoutS"].get<int>();
    }
    if (source.contains("dockerBinary") && source["dockerBinary"].is_string()) {
        runtime.docker_binary = source["dockerBinary"].get<std::string>();
    }
    if (source.contains("image") && source["image"].is_string()) {
        runtime.container_image = source["image"].get<std::string>();
    }
    if (source.contains("containerNamePrefix") && source["containerNamePrefix"].is_string()) {
        runtime.container_name_prefix = source["containerNamePrefix"].get<std::string>();
    }
    if (source.contains("hostWorkspaceRoot") && source["hostWorkspaceRoot"].is_string()) {
        runtime.host_workspace_root = source["hostWorkspaceRoot"].get<std::string>();
    }
    if (source.contains("memoryLimit") && source["memoryLimit"].is_string()) {
        runtime.memory_limit = source["memoryLimit"].get<std::string>();
    }
    if (source.contains("cpuLimit") && source["cpuLimit"].is_string()) {
        runtime.cpu_limit = source["cpuLimit"].get<std::string>();
    }
    if (source.contains("setupCommands") && source["setupCommands"].is_array()) {
        runtime.setup_commands = ReadStringArray(source["setupCommands"]);
    }
    if (source.contains("enableNetworking") && source["enableNetworking"].is_boolean()) {
        runtime.enable_networking = source["enableNetworking"].get<bool>();
    }
    if (source.contains("dnsServers") && source["dnsServers"].is_array()) {
        runtime.dns_servers = ReadStringArray(source["dnsServers"]);
    }
    if (source.contains("userId") && source["userId"].is_number_integer()) {
        runtime.user_id = source["userId"].get<int>();
    }
    if (source.contains("groupId") && source["groupId"].is_number_integer()) {
        runtime.group_id = source["groupId"].get<int>();
    }
    if (source.contains("readOnlyRoot") && source["readOnlyRoot"].is_boolean()) {
        runtime.read_only_root = source["readOnlyRoot"].get<bool>();
    }
    if (source.contains("environment") && source["environment"].is_object()) {
        for (const auto& item : source["environment"].items()) {
            if (item.value().is_string()) {
                runtime.environment[item.key()] = item.value().get<std::string>();
            }
        }
    }
    if (source.contains("maxFileSize") && source["maxFileSize"].is_number_unsigned()) {
        runtime.max_file_size = source["maxFileSize"].get<std::size_t>();
    }
    if (source.contains("allowedExtensions") && source["allowedExtensions"].is_array()) {
        runtime.allowed_extensions = ReadStringArray(source["allowedExtensions"]);
    }
    if (source.contains("shell") && source["shell"].is_string()) {
        runtime.shell = source["shell"].get<std::string>();
    }
    if (source.contains("serverUrl") && source["serverUrl"].is_string()) {
        runtime.server_url = source["serverUrl"].get<std::string>();
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        runtime.api_key = source["apiKey"].get<std::string>();
    }
    if (source.contains("connectTimeoutS") && source["connectTimeoutS"].is_number_integer()) {
        runtime.connect_timeout_s = source["connectTimeoutS"].get<int>();
    }
}

void ApplyServerConfig(ServerConfig& server, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("host") && source["host"].is_string()) {
        server.host = source["host"].get<std::string>();
    }
    if (source.contains("port") && source["port"].is_number_integer()) {
        server.port = source["port"].get<int>();
    }
    if (source.contains("workingDir") && source["workingDir"].is_string()) {
        server.working_dir = source["workingDir"].get<std::string>();
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        server.api_key = source["apiKey"].get<std::string>();
    }
    if (source.contains("shellTimeoutS") && source["shellTimeoutS"].is_number_integer()) {
        server.shell_timeout_s = source["shellTimeoutS"].get<int>();
    }
    if (source.contains("shell") && source["shell"].is_string()) {
        server.shell = source["shell"].get<std::string>();
    }
    if (source.contains("maxFileSize") && source["maxFileSize"].is_number_unsigned()) {
        server.max_file_size = source["maxFileSize"].get<std::size_t>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (data.contains("runtime")) {
        ApplyRuntimeConfig(config.runtime, data["runtime"]);
    }
    if (data.contains("server")) {
        ApplyServerConfig(config.server, data["server"]);
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    for (const auto& item : utils::Split(value, ',')) {
        const auto trimmed = utils::Trim(item);
        if (!trimmed.empty()) {
            items.push_back(trimmed);
        }
    }
    return items;
}

void ApplyEnvironment(Config& config) {
    const auto runtime_type = GetEnvFallback("AGENTBOX_RUNTIME__TYPE", "AGENTBOX_RUNTIME_TYPE");
    if (!runtime_type.empty()) {
        const auto type = ParseRuntimeType(utils::ToLower(runtime_type));
        if (type) {
            config.runtime.runtime_type = *type;
        } else {
            std::cerr << "[config] ignoring unknown AGENTBOX_RUNTIME__TYPE=" << runtime_type << std::endl;
        }
    }

    const auto workspace = GetEnvFallback(
        "AGENTBOX_RUNTIME__WORKSPACE_DIR",
        "AGENTBOX_WORKSPACE_DIR");
    if (!workspace.empty()) {
        config.runtime.workspace_dir = workspace;
    }

    const auto timeout = GetEnvFallback("AGENTBOX_RUNTIME__TIMEOUT_S", "AGENTBOX_TIMEOUT_S");
    if (!timeout.empty()) {
        config.runtime.timeout_s = ParseInt(timeout, config.runtime.timeout_s);
    }

    const auto image = GetEnvFallback("AGENTBOX_RUNTIME__IMAGE", "AGENTBOX_IMAGE");
    if (!image.empty()) {
        config.runtime.container_image = image;
    }

    const auto memory_limit = GetEnv("AGENTBOX_RUNTIME__MEMORY_LIMIT");
    if (!memory_limit.empty()) {
        config.runtime.memory_limit = memory_limit;
    }

    const auto cpu_limit = GetEnv("AGENTBOX_RUNTIME__CPU_LIMIT");
    if (!cpu_limit.empty()) {
        config.runtime.cpu_limit = cpu_limit;
    }

    const auto networking = GetEnv("AGENTBOX_RUNTIME__ENABLE_NETWORKING");
    if (!networking.empty()) {
        config.runtime.enable_networking = ParseBool(networking);
    }

    const auto dns = GetEnv("AGENTBOX_RUNTIME__DNS_SERVERS");
    if (!dns.empty()) {
        config.runtime.dns_servers = SplitCsv(dns);
    }

    const auto user_id = GetEnv("AGENTBOX_RUNTIME__USER_ID");
    if (!user_id.empty()) {
        config.runtime.user_id = ParseInt(user_id, config.runtime.user_id);
    }

    const auto group_id = GetEnv("AGENTBOX_RUNTIME__GROUP_ID");
    if (!group_id.empty()) {
        config.runtime.group_id = ParseInt(group_id, config.runtime.group_id);
    }

    const auto server_url = GetEnv("AGENTBOX_RUNTIME__SERVER_URL");
    if (!server_url.empty()) {
        config.runtime.server_url = server_url;
    }

    const auto runtime_key = GetEnv("AGENTBOX_RUNTIME__API_KEY");
    if (!runtime_key.empty()) {
        config.runtime.api_key = runtime_key;
    }

    const auto server_key = GetEnvFallback("AGENTBOX_SERVER__API_KEY", "SESSION_API_KEY");
    if (!server_key.empty()) {
        config.server.api_key = server_key;
    }

    const auto server_port = GetEnv("AGENTBOX_SERVER__PORT");
    if (!server_port.empty()) {
        config.server.port = ParseInt(server_port, config.server.port);
    }

    const auto server_dir = GetEnv("AGENTBOX_SERVER__WORKING_DIR");
    if (!server_dir.empty()) {
        config.server.working_dir = server_dir;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".agentbox" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        const auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            std::cerr << "[config] failed to parse " << config_path.string()
                      << "; keeping defaults" << std::endl;
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvironment(config);
    return config;
}

}  // namespace agentbox::config
