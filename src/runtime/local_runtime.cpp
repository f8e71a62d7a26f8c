#include "runtime/local_runtime.hpp"

#include <fstream>
#include <iostream>

#include "sandbox/process_runner.hpp"
#include "utils/common.hpp"

namespace agentbox::runtime {
namespace fs = std::filesystem;

namespace {

constexpr auto kTerminateGrace = std::chrono::milliseconds(2000);

constexpr const char* kReadme =
    "# Agent workspace\n"
    "\n"
    "- `src/` source code\n"
    "- `tests/` tests\n"
    "- `docs/` documentation\n"
    "- `tmp/` scratch files\n";

}  // namespace

void ValidateSessionId(const std::string& session_id) {
    if (session_id.empty() || session_id == "." || session_id == ".." ||
        session_id.find('/') != std::string::npos || session_id.find('\0') != std::string::npos) {
        throw RuntimeError("invalid session id: '" + session_id + "'");
    }
}

LocalRuntime::LocalRuntime(config::RuntimeConfig config)
    : Runtime(std::move(config)) {}

LocalRuntime::~LocalRuntime() {
    try {
        Stop();
    } catch (const std::exception& ex) {
        std::cerr << "[local] stop failed session=" << session_id_ << " error=" << ex.what() << std::endl;
    }
}

void LocalRuntime::Start(const std::string& session_id) {
    if (running_) {
        return;
    }
    ValidateSessionId(session_id);
    session_id_ = session_id;
    workspace_ = fs::absolute(fs::path(config_.workspace_dir) / session_id);

    std::error_code ec;
    fs::create_directories(workspace_, ec);
    if (ec) {
        throw RuntimeError("cannot create workspace " + workspace_.string() + ": " + ec.message());
    }
    fs::permissions(workspace_, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec, ec);
    SeedWorkspace();

    WorkspaceFs::Policy policy{};
    policy.max_file_size = config_.max_file_size;
    policy.allowed_extensions = config_.allowed_extensions;
    fs_ = std::make_unique<WorkspaceFs>(workspace_, policy);
    running_ = true;
    std::cerr << "[local] start session=" << session_id_ << " workspace=" << workspace_.string() << std::endl;
}

void LocalRuntime::Stop() {
    if (!running_) {
        return;
    }
    KillAllBackground();
    running_ = false;
    std::cerr << "[local] stop session=" << session_id_ << std::endl;
}

void LocalRuntime::SeedWorkspace() {
    std::error_code ec;
    for (const char* dir : {"src", "tests", "docs", "tmp"}) {
        fs::create_directories(workspace_ / dir, ec);
    }
    const auto readme = workspace_ / "README.md";
    if (!fs::exists(readme, ec)) {
        std::ofstream out(readme);
        out << kReadme;
    }
}

const WorkspaceFs& LocalRuntime::Fs() const {
    if (!fs_) {
        throw RuntimeError("Runtime not running");
    }
    return *fs_;
}

fs::path LocalRuntime::WorkingDirectory(const std::optional<std::string>& working_dir) const {
    if (!working_dir || working_dir->empty()) {
        return Fs().root();
    }
    const auto resolved = Fs().Resolve(*working_dir);
    std::error_code ec;
    if (!fs::is_directory(resolved, ec)) {
        throw FileAccessError("Working directory not found: " + *working_dir);
    }
    return resolved;
}

std::string LocalRuntime::ReadFile(const std::string& path) {
    return Fs().Read(path);
}

std::size_t LocalRuntime::WriteFile(const std::string& path, const std::string& content) {
    return Fs().Write(path, content);
}

std::vector<FileInfo> LocalRuntime::ListFiles(const std::string& path) {
    return Fs().List(path);
}

void LocalRuntime::DeletePath(const std::string& path) {
    Fs().Remove(path);
}

void LocalRuntime::MakeDirectory(const std::string& path) {
    Fs().MakeDirectory(path);
}

std::vector<SearchMatch> LocalRuntime::SearchFiles(const events::SearchAction& search) {
    return Fs().Search(search);
}

CommandResult LocalRuntime::RunCommand(const std::string& command,
                                       const std::optional<std::string>& working_dir,
                                       std::chrono::seconds timeout) {
    const auto cwd = WorkingDirectory(working_dir);
    sandbox::ProcessOptions options{};
    options.working_dir = cwd.string();
    options.environment = config_.environment;
    options.timeout = timeout;

    const auto started = std::chrono::steady_clock::now();
    const auto process = sandbox::ProcessRunner::RunShell(config_.shell, command, options);

    CommandResult result{};
    result.command = command;
    result.exit_code = process.timed_out ? -1 : process.exit_code;
    result.stdout_text = process.output;
    result.stderr_text = process.error;
    result.working_dir = cwd.string();
    result.execution_time = utils::SecondsSince(started);
    result.timed_out = process.timed_out;
    if (process.timed_out) {
        std::cerr << "[local] timeout session=" << session_id_ << " timeout_s=" << timeout.count() << std::endl;
    }
    return result;
}

int LocalRuntime::SpawnBackground(const std::string& command,
                                  const std::optional<std::string>& working_dir) {
    sandbox::ProcessOptions options{};
    options.working_dir = WorkingDirectory(working_dir).string();
    options.environment = config_.environment;
    try {
        return sandbox::ProcessRunner::SpawnBackground(config_.shell, command, options);
    } catch (const std::runtime_error& ex) {
        throw RuntimeError(ex.what());
    }
}

void LocalRuntime::TerminateProcess(int pid) {
    sandbox::ProcessRunner::TerminateGroup(pid, kTerminateGrace);
}

nlohmann::json LocalRuntime::Status() const {
    auto status = Runtime::Status();
    status["workspace"] = workspace_.string();
    return status;
}

}  // namespace agentbox::runtime
