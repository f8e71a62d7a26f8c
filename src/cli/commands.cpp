#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "events/serialization.hpp"
#include "nlohmann/json.hpp"
#include "runtime/runtime_manager.hpp"
#include "server/action_execution_server.hpp"
#include "utils/common.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  agentbox server [--host H] [--port N] [--working-dir D] [--api-key K]\n"
              << "  agentbox exec <session> '<action-json>'\n"
              << "  agentbox run <session> <command...>\n"
              << "  agentbox status <session>" << std::endl;
}

std::optional<int> ParsePort(const std::string& value) {
    try {
        const int port = std::stoi(value);
        if (port > 0 && port < 65536) {
            return port;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

int RunServer(int argc, char** argv) {
    auto config = agentbox::config::LoadConfig().server;
    for (int i = 2; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cout << "Missing value for " << flag << std::endl;
            return 1;
        }
        const std::string value = argv[++i];
        if (flag == "--host") {
            config.host = value;
        } else if (flag == "--port") {
            const auto port = ParsePort(value);
            if (!port) {
                std::cout << "Invalid port: " << value << std::endl;
                return 1;
            }
            config.port = *port;
        } else if (flag == "--working-dir") {
            config.working_dir = value;
        } else if (flag == "--api-key") {
            config.api_key = value;
        } else {
            std::cout << "Unknown flag: " << flag << std::endl;
            PrintUsage();
            return 1;
        }
    }

    agentbox::server::ActionExecutionServer server(config);
    try {
        server.Initialize();
    } catch (const std::exception& ex) {
        std::cout << "Failed to start execution server: " << ex.what() << std::endl;
        return 1;
    }

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&server, &listen_failed]() {
        if (!server.Listen()) {
            listen_failed.store(true);
        }
    });

    std::cout << "agentbox execution server on " << config.host << ":" << config.port
              << " working_dir=" << config.working_dir << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_signal != 0) {
        std::thread([] {
            std::this_thread::sleep_for(std::chrono::seconds(5));
            std::_Exit(130);
        }).detach();
    }

    server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int ExecuteOne(const std::string& session_id, const agentbox::events::Action& action) {
    const auto config = agentbox::config::LoadConfig();
    agentbox::runtime::RuntimeManager manager;
    try {
        manager.CreateRuntime(session_id, config.runtime);
    } catch (const std::exception& ex) {
        std::cout << "Failed to start runtime: " << ex.what() << std::endl;
        return 1;
    }
    const auto observation = manager.ExecuteAction(session_id, action);
    std::cout << agentbox::events::DumpJson(agentbox::events::ObservationToJson(observation), 2) << std::endl;
    manager.CleanupAll();
    return agentbox::events::IsSuccess(observation) ? 0 : 2;
}

int RunExec(int argc, char** argv) {
    if (argc < 4) {
        PrintUsage();
        return 1;
    }
    const auto json = nlohmann::json::parse(argv[3], nullptr, false);
    if (json.is_discarded()) {
        std::cout << "Invalid action JSON." << std::endl;
        return 1;
    }
    try {
        return ExecuteOne(argv[2], agentbox::events::ActionFromJson(json));
    } catch (const std::invalid_argument& ex) {
        std::cout << "Invalid action: " << ex.what() << std::endl;
        return 1;
    }
}

int RunCommand(int argc, char** argv) {
    if (argc < 4) {
        PrintUsage();
        return 1;
    }
    agentbox::events::RunAction run{};
    run.command = agentbox::utils::Join(std::vector<std::string>(argv + 3, argv + argc), " ");
    return ExecuteOne(argv[2], run);
}

int RunStatus(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return 1;
    }
    const auto config = agentbox::config::LoadConfig();
    agentbox::runtime::RuntimeManager manager;
    try {
        auto runtime = manager.CreateRuntime(argv[2], config.runtime);
        std::cout << agentbox::events::DumpJson(runtime->Status(), 2) << std::endl;
    } catch (const std::exception& ex) {
        std::cout << "Failed to start runtime: " << ex.what() << std::endl;
        return 1;
    }
    manager.CleanupAll();
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "server") {
        return RunServer(argc, argv);
    }
    if (command == "exec") {
        return RunExec(argc, argv);
    }
    if (command == "run") {
        return RunCommand(argc, argv);
    }
    if (command == "status") {
        return RunStatus(argc, argv);
    }
    PrintUsage();
    return 1;
}
