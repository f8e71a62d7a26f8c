#include "runtime/remote_runtime.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

#include "events/serialization.hpp"
#include "httplib.h"
#include "utils/encoding.hpp"

namespace agentbox::runtime {
namespace {

constexpr const char* kApiKeyHeader = "X-Session-API-Key";
constexpr int kReadSlackSeconds = 30;

// Maps an HTTP error from the file endpoints onto the runtime error types.
[[noreturn]] void ThrowForStatus(const httplib::Result& response, const std::string& what) {
    if (!response) {
        throw RuntimeError(what + ": request failed (" + httplib::to_string(response.error()) + ")");
    }
    std::string detail = response->body;
    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("detail") && json["detail"].is_string()) {
        detail = json["detail"].get<std::string>();
    }
    switch (response->status) {
        case 403: throw PathEscapeError(detail);
        case 400:
        case 404:
        case 413: throw FileAccessError(detail);
        default: throw RuntimeError(what + ": HTTP " + std::to_string(response->status) + " " + detail);
    }
}

}  // namespace

RemoteRuntime::RemoteRuntime(config::RuntimeConfig config)
    : Runtime(std::move(config)) {}

RemoteRuntime::~RemoteRuntime() = default;

httplib::Client& RemoteRuntime::Client() {
    if (!client_) {
        client_ = std::make_unique<httplib::Client>(config_.server_url);
        client_->set_connection_timeout(config_.connect_timeout_s);
        client_->set_read_timeout(config_.timeout_s + kReadSlackSeconds);
        if (!config_.api_key.empty()) {
            client_->set_default_headers({{kApiKeyHeader, config_.api_key}});
        }
    }
    return *client_;
}

void RemoteRuntime::Start(const std::string& session_id) {
    if (running_) {
        return;
    }
    if (session_id.empty()) {
        throw RuntimeError("invalid session id: ''");
    }
    session_id_ = session_id;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.connect_timeout_s);
    std::string last_error = "no attempt";
    while (true) {
        auto response = Client().Get("/health");
        if (response && response->status == 200) {
            break;
        }
        last_error = response ? "HTTP " + std::to_string(response->status)
                              : httplib::to_string(response.error());
        if (std::chrono::steady_clock::now() >= deadline) {
            throw RuntimeError("execution server at " + config_.server_url + " not healthy: " + last_error);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    running_ = true;
    std::cerr << "[remote] start session=" << session_id_ << " server=" << config_.server_url << std::endl;
}

void RemoteRuntime::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    client_.reset();
    std::cerr << "[remote] stop session=" << session_id_ << std::endl;
}

events::Observation RemoteRuntime::Dispatch(const events::Action& action) {
    int read_timeout_s = config_.timeout_s;
    if (const auto* run = std::get_if<events::RunAction>(&action)) {
        read_timeout_s = std::max(read_timeout_s, run->timeout_s.value_or(config_.timeout_s));
    }
    return Forward(action, read_timeout_s + kReadSlackSeconds);
}

events::Observation RemoteRuntime::Forward(const events::Action& action, int read_timeout_s) {
    auto& client = Client();
    client.set_read_timeout(read_timeout_s);
    const nlohmann::json body = {{"action", events::ActionToJson(action)}};
    auto response = client.Post("/execute_action", events::DumpJson(body), "application/json");
    if (!response) {
        throw RuntimeError("execute_action request failed: " + httplib::to_string(response.error()));
    }
    if (response->status != 200) {
        throw RuntimeError("execute_action returned HTTP " + std::to_string(response->status) +
                           ": " + response->body);
    }
    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded()) {
        throw RuntimeError("execute_action returned invalid JSON");
    }
    return events::ObservationFromJson(json);
}

std::string RemoteRuntime::ReadFile(const std::string& path) {
    auto response = Client().Get("/file/" + utils::UrlEncodePath(path));
    if (!response || response->status != 200) {
        ThrowForStatus(response, "read " + path);
    }
    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw RuntimeError("invalid file response for " + path);
    }
    const auto content = json.value("content", "");
    if (json.value("encoding", "utf-8") == "base64") {
        return utils::Base64Decode(content);
    }
    return content;
}

std::size_t RemoteRuntime::WriteFile(const std::string& path, const std::string& content) {
    nlohmann::json body;
    if (utils::IsValidUtf8(content)) {
        body = {{"content", content}, {"encoding", "utf-8"}};
    } else {
        body = {{"content", utils::Base64Encode(content)}, {"encoding", "base64"}};
    }
    auto response = Client().Post("/file/" + utils::UrlEncodePath(path), events::DumpJson(body), "application/json");
    if (!response || response->status != 200) {
        ThrowForStatus(response, "write " + path);
    }
    return content.size();
}

std::vector<FileInfo> RemoteRuntime::ListFiles(const std::string& path) {
    httplib::Params params{{"path", path.empty() ? "." : path}};
    auto response = Client().Get("/files", params, httplib::Headers{});
    if (!response || response->status != 200) {
        ThrowForStatus(response, "list " + path);
    }
    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.contains("files") || !json["files"].is_array()) {
        throw RuntimeError("invalid listing response for " + path);
    }
    std::vector<FileInfo> files;
    for (const auto& item : json["files"]) {
        FileInfo info{};
        info.name = item.value("name", "");
        info.path = item.value("path", info.name);
        info.is_directory = item.value("is_directory", false);
        info.size = item.value("size", static_cast<std::uintmax_t>(0));
        info.modified = item.value("modified", 0.0);
        info.permissions = item.value("permissions", "");
        files.push_back(std::move(info));
    }
    return files;
}

void RemoteRuntime::DeletePath(const std::string& path) {
    auto response = Client().Delete("/file/" + utils::UrlEncodePath(path));
    if (!response || response->status != 200) {
        ThrowForStatus(response, "delete " + path);
    }
}

void RemoteRuntime::MakeDirectory(const std::string& path) {
    events::CreateDirectoryAction action{};
    action.path = path;
    const auto observation = Forward(action, config_.timeout_s + kReadSlackSeconds);
    if (!events::IsSuccess(observation)) {
        throw FileAccessError(events::ContentOf(observation));
    }
}

std::vector<SearchMatch> RemoteRuntime::SearchFiles(const events::SearchAction& search) {
    const auto observation = Forward(search, config_.timeout_s + kReadSlackSeconds);
    const auto* success = std::get_if<events::SuccessObservation>(&observation);
    if (!success) {
        throw FileAccessError(events::ContentOf(observation));
    }
    std::vector<SearchMatch> matches;
    if (success->data.contains("results") && success->data["results"].is_array()) {
        for (const auto& item : success->data["results"]) {
            matches.push_back({item.value("path", ""), item.value("line", 0), item.value("text", "")});
        }
    }
    return matches;
}

CommandResult RemoteRuntime::RunCommand(const std::string& command,
                                        const std::optional<std::string>& working_dir,
                                        std::chrono::seconds timeout) {
    events::RunAction action{};
    action.command = command;
    action.working_dir = working_dir;
    action.timeout_s = static_cast<int>(timeout.count());
    const auto observation = Forward(action, static_cast<int>(timeout.count()) + kReadSlackSeconds);
    const auto* output = std::get_if<events::CommandResultObservation>(&observation);
    if (!output) {
        throw RuntimeError(events::ContentOf(observation));
    }
    CommandResult result{};
    result.command = output->command;
    result.exit_code = output->exit_code;
    result.stdout_text = output->stdout_text;
    result.stderr_text = output->stderr_text;
    result.working_dir = output->working_dir;
    result.execution_time = output->execution_time;
    result.timed_out = output->timed_out;
    return result;
}

int RemoteRuntime::SpawnBackground(const std::string& command,
                                   const std::optional<std::string>& working_dir) {
    events::RunAction action{};
    action.command = command;
    action.working_dir = working_dir;
    action.background = true;
    const auto observation = Forward(action, config_.timeout_s + kReadSlackSeconds);
    const auto* success = std::get_if<events::SuccessObservation>(&observation);
    if (!success || !success->data.contains("pid")) {
        throw RuntimeError(events::ContentOf(observation));
    }
    return success->data["pid"].get<int>();
}

void RemoteRuntime::TerminateProcess(int pid) {
    throw RuntimeError("remote process " + std::to_string(pid) + " must be killed by process id");
}

nlohmann::json RemoteRuntime::Status() const {
    auto status = Runtime::Status();
    status["server_url"] = config_.server_url;
    return status;
}

}  // namespace agentbox::runtime
