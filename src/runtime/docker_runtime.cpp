#include "runtime/docker_runtime.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include "runtime/local_runtime.hpp"
#include "runtime/workspace_fs.hpp"
#include "utils/common.hpp"
#include "utils/encoding.hpp"

namespace agentbox::runtime {
namespace fs = std::filesystem;

namespace {

constexpr auto kDockerTimeout = std::chrono::seconds(60);
constexpr auto kPullTimeout = std::chrono::seconds(600);
constexpr auto kFileTimeout = std::chrono::seconds(30);
constexpr int kStopGraceSeconds = 10;

const std::vector<std::string> kAllowedCapabilities = {
    "CHOWN", "DAC_OVERRIDE", "FOWNER", "SETGID", "SETUID"};

std::string FirstLine(const std::string& text) {
    const auto trimmed = utils::Trim(text);
    const auto pos = trimmed.find('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(0, pos);
}

}  // namespace

DockerRuntime::DockerRuntime(config::RuntimeConfig config, std::shared_ptr<sandbox::DockerClient> client)
    : Runtime(std::move(config)),
      client_(std::move(client)) {
    if (!client_) {
        client_ = std::make_shared<sandbox::CliDockerClient>(config_.docker_binary);
    }
}

DockerRuntime::~DockerRuntime() {
    try {
        Stop();
    } catch (const std::exception& ex) {
        std::cerr << "[docker] stop failed session=" << session_id_ << " error=" << ex.what() << std::endl;
    }
}

std::vector<std::string> DockerRuntime::BuildRunArgs(const std::string& host_workspace) const {
    std::vector<std::string> args = {
        "run", "-d", "-it", "--rm",
        "--name", container_name_,
        "-v", host_workspace + ":" + config_.workspace_dir,
        "-w", config_.workspace_dir,
        "--user", std::to_string(config_.user_id) + ":" + std::to_string(config_.group_id),
        "--cap-drop", "ALL"
    };
    for (const auto& capability : kAllowedCapabilities) {
        args.push_back("--cap-add");
        args.push_back(capability);
    }
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");
    if (config_.enable_networking) {
        for (const auto& dns : config_.dns_servers) {
            args.push_back("--dns");
            args.push_back(dns);
        }
    } else {
        args.push_back("--network");
        args.push_back("none");
    }
    if (!config_.memory_limit.empty()) {
        args.push_back("--memory");
        args.push_back(config_.memory_limit);
    }
    if (!config_.cpu_limit.empty()) {
        args.push_back("--cpus");
        args.push_back(config_.cpu_limit);
    }
    if (config_.read_only_root) {
        args.push_back("--read-only");
        args.push_back("--tmpfs");
        args.push_back("/tmp");
    }
    for (const auto& [key, value] : config_.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    args.push_back(config_.container_image);
    args.push_back("sleep");
    args.push_back("infinity");
    return args;
}

void DockerRuntime::EnsureImage() {
    sandbox::DockerCommandOptions options{};
    options.timeout = kDockerTimeout;
    const auto inspect = client_->Run({"image", "inspect", config_.container_image}, options);
    if (inspect.exit_code == 0) {
        return;
    }
    std::cerr << "[docker] pulling image=" << config_.container_image << std::endl;
    options.timeout = kPullTimeout;
    const auto pull = client_->Run({"pull", config_.container_image}, options);
    if (pull.exit_code != 0) {
        throw RuntimeError("failed to pull image " + config_.container_image + ": " + FirstLine(pull.error));
    }
}

void DockerRuntime::Start(const std::string& session_id) {
    if (running_) {
        return;
    }
    ValidateSessionId(session_id);
    session_id_ = session_id;
    container_name_ = config_.container_name_prefix + "_" + session_id;
    host_workspace_ = (fs::absolute(config_.host_workspace_root) / session_id).string();

    std::error_code ec;
    fs::create_directories(host_workspace_, ec);
    if (ec) {
        throw RuntimeError("cannot create host workspace " + host_workspace_ + ": " + ec.message());
    }

    EnsureImage();

    sandbox::DockerCommandOptions options{};
    options.timeout = kDockerTimeout;
    const auto run = client_->Run(BuildRunArgs(host_workspace_), options);
    if (run.exit_code != 0) {
        throw RuntimeError("failed to start container " + container_name_ + ": " + FirstLine(run.error));
    }
    container_id_ = FirstLine(run.output);
    running_ = true;
    std::cerr << "[docker] start session=" << session_id_ << " container=" << container_name_
              << " id=" << container_id_.substr(0, 12) << std::endl;
    Provision();
}

void DockerRuntime::Provision() {
    const auto owner = std::to_string(config_.user_id) + ":" + std::to_string(config_.group_id);
    const auto chown = Exec("chown -R " + owner + " " + utils::ShellQuote(config_.workspace_dir),
                            kDockerTimeout, std::nullopt, true);
    if (chown.exit_code != 0) {
        std::cerr << "[docker] chown failed container=" << container_name_
                  << " error=" << FirstLine(chown.error) << std::endl;
    }
    for (const auto& command : config_.setup_commands) {
        const auto result = Exec(command, std::chrono::seconds(config_.timeout_s), std::nullopt, true);
        if (result.exit_code != 0) {
            std::cerr << "[docker] setup command failed command=" << command
                      << " exit=" << result.exit_code << std::endl;
        }
    }
}

void DockerRuntime::Stop() {
    if (!running_) {
        return;
    }
    KillAllBackground();

    sandbox::DockerCommandOptions options{};
    options.timeout = std::chrono::seconds(kStopGraceSeconds + 20);
    const auto stop = client_->Run({"stop", "-t", std::to_string(kStopGraceSeconds), container_name_}, options);
    if (stop.exit_code != 0) {
        options.timeout = kDockerTimeout;
        const auto kill = client_->Run({"kill", container_name_}, options);
        if (kill.exit_code != 0) {
            std::cerr << "[docker] kill failed container=" << container_name_
                      << " error=" << FirstLine(kill.error) << std::endl;
        }
    }
    running_ = false;
    std::cerr << "[docker] stop session=" << session_id_ << " container=" << container_name_ << std::endl;
    container_id_.clear();
}

sandbox::ProcessResult DockerRuntime::Exec(const std::string& script,
                                           std::chrono::milliseconds timeout,
                                           const std::optional<std::string>& stdin_data,
                                           bool as_root) {
    if (!running_) {
        throw RuntimeError("Runtime not running");
    }
    std::vector<std::string> args = {"exec"};
    if (stdin_data) {
        args.push_back("-i");
    }
    if (as_root) {
        args.push_back("-u");
        args.push_back("0");
    }
    args.push_back(container_name_);
    args.push_back("bash");
    args.push_back("-c");
    args.push_back(script);

    sandbox::DockerCommandOptions options{};
    options.timeout = timeout;
    options.stdin_data = stdin_data;
    return client_->Run(args, options);
}

std::string DockerRuntime::ContainerPath(const std::string& path) const {
    const fs::path root = fs::path(config_.workspace_dir).lexically_normal();
    fs::path candidate = path.empty() ? root : fs::path(path);
    if (candidate.is_relative()) {
        candidate = root / candidate;
    }
    candidate = candidate.lexically_normal();
    auto relative = candidate.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        throw PathEscapeError("Path escapes workspace: " + path);
    }
    auto normalized = candidate.string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::string DockerRuntime::Relative(const std::string& container_path) const {
    const auto relative = fs::path(container_path).lexically_relative(
        fs::path(config_.workspace_dir).lexically_normal()).generic_string();
    return relative.empty() ? "." : relative;
}

std::string DockerRuntime::ReadFile(const std::string& path) {
    const auto target = utils::ShellQuote(ContainerPath(path));
    const auto script =
        "if [ ! -e " + target + " ]; then echo 'File not found' >&2; exit 2; fi; "
        "if [ -d " + target + " ]; then echo 'Path is a directory' >&2; exit 2; fi; "
        "size=$(stat -c %s " + target + ") || exit 1; "
        "if [ \"$size\" -gt " + std::to_string(config_.max_file_size) + " ]; then "
        "echo 'File too large' >&2; exit 3; fi; "
        "cat -- " + target;
    const auto result = Exec(script, kFileTimeout);
    if (result.exit_code != 0) {
        throw FileAccessError(FirstLine(result.error) + ": " + path);
    }
    return result.output;
}

std::size_t DockerRuntime::WriteFile(const std::string& path, const std::string& content) {
    const auto container_path = ContainerPath(path);
    CheckAllowedExtension(container_path, config_.allowed_extensions);
    if (content.size() > config_.max_file_size) {
        throw FileAccessError("Content too large: " + std::to_string(content.size()) + " bytes");
    }
    const auto target = utils::ShellQuote(container_path);
    const auto parent = utils::ShellQuote(fs::path(container_path).parent_path().string());
    const auto result = Exec("mkdir -p -- " + parent + " && tee -- " + target + " > /dev/null",
                             kFileTimeout, content);
    if (result.exit_code != 0) {
        throw FileAccessError("Failed to write " + path + ": " + FirstLine(result.error));
    }
    return content.size();
}

std::vector<FileInfo> DockerRuntime::ListFiles(const std::string& path) {
    const auto container_path = ContainerPath(path);
    const auto target = utils::ShellQuote(container_path);
    const auto script =
        "if [ ! -d " + target + " ]; then echo 'Directory not found' >&2; exit 2; fi; "
        "find " + target + " -mindepth 1 -maxdepth 1 -exec stat --format='%n|%s|%Y|%A|%F' {} +";
    const auto result = Exec(script, kFileTimeout);
    if (result.exit_code != 0) {
        throw FileAccessError(FirstLine(result.error) + ": " + path);
    }
    std::vector<FileInfo> files;
    for (const auto& line : utils::Split(result.output, '\n')) {
        const auto fields = utils::Split(line, '|');
        if (fields.size() < 5) {
            continue;
        }
        FileInfo info{};
        info.path = Relative(fields[0]);
        info.name = fs::path(fields[0]).filename().string();
        info.is_directory = fields[4] == "directory";
        try {
            info.size = info.is_directory ? 0 : std::stoull(fields[1]);
            info.modified = std::stod(fields[2]);
        } catch (const std::exception&) {
            info.size = 0;
        }
        info.permissions = fields[3].size() > 1 ? fields[3].substr(1) : fields[3];
        files.push_back(std::move(info));
    }
    std::sort(files.begin(), files.end(), [](const FileInfo& a, const FileInfo& b) {
        return a.name < b.name;
    });
    return files;
}

void DockerRuntime::DeletePath(const std::string& path) {
    const auto container_path = ContainerPath(path);
    if (container_path == fs::path(config_.workspace_dir).lexically_normal().string()) {
        throw PathEscapeError("Refusing to delete the workspace root");
    }
    const auto target = utils::ShellQuote(container_path);
    const auto result = Exec("if [ ! -e " + target + " ] && [ ! -L " + target + " ]; then "
                             "echo 'Path not found' >&2; exit 2; fi; rm -rf -- " + target,
                             kFileTimeout);
    if (result.exit_code != 0) {
        throw FileAccessError(FirstLine(result.error) + ": " + path);
    }
}

void DockerRuntime::MakeDirectory(const std::string& path) {
    const auto result = Exec("mkdir -p -- " + utils::ShellQuote(ContainerPath(path)), kFileTimeout);
    if (result.exit_code != 0) {
        throw FileAccessError("Failed to create directory " + path + ": " + FirstLine(result.error));
    }
}

std::vector<SearchMatch> DockerRuntime::SearchFiles(const events::SearchAction& search) {
    std::string script = "grep -rnHIF";
    if (!search.case_sensitive) {
        script += "i";
    }
    if (search.file_pattern) {
        script += " --include=" + utils::ShellQuote(*search.file_pattern);
    }
    script += " -e " + utils::ShellQuote(search.query) + " -- " +
              utils::ShellQuote(ContainerPath(search.path.value_or("."))) + " | head -n 500";
    script = "set -o pipefail; " + script;
    const auto result = Exec(script, kFileTimeout);
    // grep exits 1 on no match; head may close the pipe early (141).
    if (result.exit_code != 0 && result.exit_code != 1 && result.exit_code != 141) {
        throw FileAccessError("Search failed: " + FirstLine(result.error));
    }
    std::vector<SearchMatch> matches;
    for (const auto& line : utils::Split(result.output, '\n')) {
        const auto first = line.find(':');
        if (first == std::string::npos) {
            continue;
        }
        const auto second = line.find(':', first + 1);
        if (second == std::string::npos) {
            continue;
        }
        SearchMatch match{};
        match.path = Relative(line.substr(0, first));
        try {
            match.line = std::stoi(line.substr(first + 1, second - first - 1));
        } catch (const std::exception&) {
            continue;
        }
        match.text = line.substr(second + 1);
        matches.push_back(std::move(match));
    }
    return matches;
}

CommandResult DockerRuntime::RunCommand(const std::string& command,
                                        const std::optional<std::string>& working_dir,
                                        std::chrono::seconds timeout) {
    const auto cwd = ContainerPath(working_dir.value_or("."));
    const auto pidfile = "/tmp/.agentbox_" + utils::RandomHex(6) + ".pid";
    const auto script =
        "echo $$ > " + pidfile + "; cd " + utils::ShellQuote(cwd) + " || exit 1\n" +
        command + "\nrc=$?; rm -f " + pidfile + "; exit $rc";

    const auto started = std::chrono::steady_clock::now();
    const auto process = Exec("exec setsid -w bash -c " + utils::ShellQuote(script), timeout);

    CommandResult result{};
    result.command = command;
    result.working_dir = cwd;
    result.stdout_text = process.output;
    result.stderr_text = process.error;
    result.timed_out = process.timed_out;
    result.exit_code = process.timed_out ? -1 : process.exit_code;
    if (process.timed_out) {
        std::cerr << "[docker] timeout container=" << container_name_
                  << " timeout_s=" << timeout.count() << std::endl;
        const auto kill = Exec("if [ -f " + pidfile + " ]; then kill -9 -- -$(cat " + pidfile +
                               ") 2>/dev/null; rm -f " + pidfile + "; fi",
                               kFileTimeout, std::nullopt, true);
        if (kill.exit_code != 0) {
            std::cerr << "[docker] timeout cleanup failed container=" << container_name_ << std::endl;
        }
    }
    result.execution_time = utils::SecondsSince(started);
    return result;
}

int DockerRuntime::SpawnBackground(const std::string& command,
                                   const std::optional<std::string>& working_dir) {
    const auto cwd = ContainerPath(working_dir.value_or("."));
    const auto result = Exec("cd " + utils::ShellQuote(cwd) + " && nohup setsid sh -c " +
                             utils::ShellQuote(command) + " > /dev/null 2>&1 & echo $!",
                             kFileTimeout);
    if (result.exit_code != 0) {
        throw RuntimeError("failed to start background process: " + FirstLine(result.error));
    }
    try {
        return std::stoi(utils::Trim(result.output));
    } catch (const std::exception&) {
        throw RuntimeError("unexpected pid from container: " + FirstLine(result.output));
    }
}

void DockerRuntime::TerminateProcess(int pid) {
    const auto id = std::to_string(pid);
    const auto result = Exec("kill -9 -- -" + id + " 2>/dev/null; kill -9 " + id + " 2>/dev/null; true",
                             kFileTimeout);
    if (result.exit_code != 0) {
        throw RuntimeError("failed to kill pid " + id + " in " + container_name_);
    }
}

nlohmann::json DockerRuntime::Status() const {
    auto status = Runtime::Status();
    status["container_id"] = container_id_;
    status["container_name"] = container_name_;
    status["image"] = config_.container_image;
    status["workspace"] = config_.workspace_dir;
    status["host_workspace"] = host_workspace_;
    return status;
}

}  // namespace agentbox::runtime
