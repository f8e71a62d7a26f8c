#include "server/action_execution_server.hpp"

#include <filesystem>
#include <iostream>

#include <openssl/crypto.h>

#include "events/serialization.hpp"
#include "httplib.h"
#include "utils/encoding.hpp"

namespace agentbox::server {
namespace {

constexpr const char* kApiKeyHeader = "X-Session-API-Key";
constexpr const char* kJson = "application/json";

config::ServerConfig PrepareWorkingDir(config::ServerConfig config) {
    std::error_code ec;
    std::filesystem::create_directories(config.working_dir, ec);
    if (ec) {
        std::cerr << "[server] cannot create working_dir=" << config.working_dir
                  << " error=" << ec.message() << std::endl;
    }
    return config;
}

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(events::DumpJson(body), kJson);
}

void SendDetail(httplib::Response& res, int status, const std::string& detail) {
    SendJson(res, status, {{"detail", detail}});
}

}  // namespace

ActionExecutionServer::ActionExecutionServer(config::ServerConfig config)
    : config_(PrepareWorkingDir(std::move(config))),
      shell_(config_.working_dir, config_.shell),
      executor_(shell_, config_),
      http_(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

ActionExecutionServer::~ActionExecutionServer() {
    Stop();
    executor_.Stop();
    shell_.Stop();
}

void ActionExecutionServer::Initialize() {
    executor_.Start("sandbox");
    std::cerr << "[server] initialized working_dir=" << config_.working_dir
              << " auth=" << (config_.api_key.empty() ? "off" : "on") << std::endl;
}

bool ActionExecutionServer::Listen() {
    std::cerr << "[server] listening on " << config_.host << ":" << config_.port << std::endl;
    const bool ok = http_->listen(config_.host, config_.port);
    if (!ok) {
        std::cerr << "[server] failed to listen on " << config_.host << ":" << config_.port << std::endl;
    }
    return ok;
}

int ActionExecutionServer::BindToAnyPort(const std::string& host) {
    return http_->bind_to_any_port(host);
}

bool ActionExecutionServer::ListenAfterBind() {
    return http_->listen_after_bind();
}

void ActionExecutionServer::Stop() {
    if (http_) {
        http_->stop();
    }
}

bool ActionExecutionServer::IsRunning() const {
    return http_ && http_->is_running();
}

events::Observation ActionExecutionServer::Execute(const events::Action& action) {
    std::lock_guard<std::mutex> lock(action_mutex_);
    return executor_.ExecuteAction(action);
}

bool ActionExecutionServer::Authorized(const std::string& provided) const {
    if (config_.api_key.empty()) {
        return true;
    }
    if (provided.size() != config_.api_key.size()) {
        return false;
    }
    return CRYPTO_memcmp(provided.data(), config_.api_key.data(), provided.size()) == 0;
}

void ActionExecutionServer::RegisterRoutes() {
    http_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (req.path == "/health" || req.path == "/") {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        if (!Authorized(req.get_header_value(kApiKeyHeader))) {
            std::cerr << "[server] rejected " << req.method << " " << req.path << " reason=api_key" << std::endl;
            SendDetail(res, 403, "Invalid or missing API key");
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    http_->Get("/", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, {{"message", "agentbox action execution server"}, {"version", "1.0.0"}});
    });

    http_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, {{"status", "healthy"}, {"working_dir", config_.working_dir}});
    });

    http_->Post("/execute_action", [this](const httplib::Request& req, httplib::Response& res) {
        const auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            SendDetail(res, 400, "Invalid JSON body");
            return;
        }
        if (!body.contains("action") || !body["action"].is_object()) {
            SendDetail(res, 400, "Missing action object");
            return;
        }
        events::Action action;
        try {
            action = events::ActionFromJson(body["action"]);
        } catch (const std::exception& ex) {
            SendDetail(res, 400, std::string("Invalid action: ") + ex.what());
            return;
        }
        std::cerr << "[server] POST /execute_action type="
                  << events::ToString(events::TypeOf(action)) << std::endl;
        const auto observation = Execute(action);
        SendJson(res, 200, events::ObservationToJson(observation));
    });

    http_->Get("/files", [this](const httplib::Request& req, httplib::Response& res) {
        const auto path = req.has_param("path") ? req.get_param_value("path") : std::string(".");
        try {
            nlohmann::json files = nlohmann::json::array();
            for (const auto& info : executor_.fs().List(path)) {
                files.push_back(runtime::ToJson(info));
            }
            SendJson(res, 200, {{"path", path}, {"files", files}});
        } catch (const runtime::PathEscapeError& ex) {
            SendDetail(res, 403, ex.what());
        } catch (const runtime::FileAccessError& ex) {
            SendDetail(res, 404, ex.what());
        }
    });

    http_->Get(R"(/file/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string path = req.matches[1];
        try {
            const auto bytes = executor_.fs().Read(path);
            const bool text = utils::IsValidUtf8(bytes);
            SendJson(res, 200, {
                {"path", path},
                {"content", text ? bytes : utils::Base64Encode(bytes)},
                {"encoding", text ? "utf-8" : "base64"},
                {"size", bytes.size()}
            });
        } catch (const runtime::PathEscapeError& ex) {
            SendDetail(res, 403, ex.what());
        } catch (const runtime::FileAccessError& ex) {
            SendDetail(res, 404, ex.what());
        }
    });

    http_->Post(R"(/file/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string path = req.matches[1];
        const auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object() || !body.contains("content") || !body["content"].is_string()) {
            SendDetail(res, 400, "Body must be {\"content\": string, \"encoding\": string}");
            return;
        }
        const auto encoding = body.value("encoding", "utf-8");
        std::string bytes;
        try {
            if (encoding == "base64") {
                bytes = utils::Base64Decode(body["content"].get<std::string>());
            } else if (encoding == "utf-8" || encoding == "utf8") {
                bytes = body["content"].get<std::string>();
            } else {
                SendDetail(res, 400, "Unsupported encoding: " + encoding);
                return;
            }
        } catch (const std::invalid_argument& ex) {
            SendDetail(res, 400, ex.what());
            return;
        }
        try {
            const auto size = executor_.fs().Write(path, bytes);
            SendJson(res, 200, {{"success", true}, {"path", path}, {"size", size}});
        } catch (const runtime::PathEscapeError& ex) {
            SendDetail(res, 403, ex.what());
        } catch (const runtime::FileAccessError& ex) {
            SendDetail(res, 400, ex.what());
        }
    });

    http_->Delete(R"(/file/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string path = req.matches[1];
        try {
            executor_.fs().Remove(path);
            SendJson(res, 200, {{"success", true}, {"path", path}});
        } catch (const runtime::PathEscapeError& ex) {
            SendDetail(res, 403, ex.what());
        } catch (const runtime::FileAccessError& ex) {
            SendDetail(res, 404, ex.what());
        }
    });
}

}  // namespace agentbox::server
