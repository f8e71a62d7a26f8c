#include "sandbox/process_runner.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agentbox::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

std::filesystem::path TempPath(const std::string& kind) {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return std::filesystem::temp_directory_path()
        / ("agentbox_" + kind + "_" + std::to_string(::getpid()) + "_" + stamp + "_"
           + std::to_string(counter.fetch_add(1)) + ".log");
}

std::string Slurp(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

bp::environment BuildEnvironment(const ProcessOptions& options) {
    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : options.environment) {
        env[key] = value;
    }
    return env;
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Polls until the pid is reaped or the deadline passes.
bool WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

template <typename... Args>
ProcessResult Execute(const ProcessOptions& options, Args&&... args) {
    ProcessResult result{};
    const auto stdout_path = TempPath("stdout");
    const auto stderr_path = TempPath("stderr");
    std::filesystem::path stdin_path;
    if (options.stdin_data) {
        stdin_path = TempPath("stdin");
        std::ofstream out(stdin_path, std::ios::binary);
        out << *options.stdin_data;
    } else {
        stdin_path = "/dev/null";
    }

    const auto started = std::chrono::steady_clock::now();
    try {
        auto env = BuildEnvironment(options);
        const std::string start_dir = options.working_dir.empty()
            ? std::filesystem::current_path().string()
            : options.working_dir;
        bp::child child_process(
            std::forward<Args>(args)...,
            env,
            bp::start_dir = start_dir,
            bp::std_in < stdin_path.string(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });

        const pid_t pid = child_process.id();
        result.pid = pid;
        int status = 0;
        bool finished = WaitUntil(pid, started + options.timeout, status);
        if (!finished) {
            result.timed_out = true;
            ::kill(-pid, SIGTERM);
            finished = WaitUntil(pid, std::chrono::steady_clock::now() + std::chrono::seconds(2), status);
            if (!finished) {
                ::kill(-pid, SIGKILL);
                finished = WaitUntil(pid, std::chrono::steady_clock::now() + std::chrono::seconds(1), status);
            }
        }
        child_process.detach();
        if (result.timed_out) {
            result.exit_code = 124;
        } else if (finished) {
            result.exit_code = DecodeStatus(status);
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
        std::cerr << "[process] spawn failed: " << ex.what() << std::endl;
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    result.output = Slurp(stdout_path);
    if (result.error.empty()) {
        result.error = Slurp(stderr_path);
    }
    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    if (options.stdin_data) {
        std::filesystem::remove(stdin_path, ec);
    }
    return result;
}

}  // namespace

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        ProcessResult result{};
        result.error = "empty argv";
        return result;
    }
    auto exe = bp::search_path(argv.front());
    if (exe.empty()) {
        exe = argv.front();
    }
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    return Execute(options, bp::exe = exe.string(), bp::args = args);
}

ProcessResult ProcessRunner::RunShell(const std::string& shell,
                                      const std::string& command,
                                      const ProcessOptions& options) {
    return Execute(options, bp::exe = shell, bp::args = std::vector<std::string>{"-c", command});
}

pid_t ProcessRunner::SpawnBackground(const std::string& shell,
                                     const std::string& command,
                                     const ProcessOptions& options) {
    try {
        auto env = BuildEnvironment(options);
        const std::string start_dir = options.working_dir.empty()
            ? std::filesystem::current_path().string()
            : options.working_dir;
        bp::child child_process(
            bp::exe = shell,
            bp::args = std::vector<std::string>{"-c", command},
            env,
            bp::start_dir = start_dir,
            bp::std_in < bp::null,
            bp::std_out > bp::null,
            bp::std_err > bp::null,
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });
        const pid_t pid = child_process.id();
        child_process.detach();
        std::cerr << "[process] background pid=" << pid << std::endl;
        return pid;
    } catch (const bp::process_error& ex) {
        throw std::runtime_error(std::string("background spawn failed: ") + ex.what());
    }
}

bool ProcessRunner::IsAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    int status = 0;
    const auto waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
        return false;
    }
    return ::kill(pid, 0) == 0;
}

void ProcessRunner::TerminateGroup(pid_t pid, std::chrono::milliseconds grace) {
    if (pid <= 0) {
        return;
    }
    ::kill(-pid, SIGTERM);
    ::kill(pid, SIGTERM);
    int status = 0;
    if (WaitUntil(pid, std::chrono::steady_clock::now() + grace, status)) {
        ::kill(-pid, SIGKILL);
        return;
    }
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    WaitUntil(pid, std::chrono::steady_clock::now() + std::chrono::seconds(1), status);
}

}  // namespace agentbox::sandbox
