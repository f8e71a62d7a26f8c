#include <chrono>
#include <filesystem>

#include <gtest/gtest.h>

#include "runtime/local_runtime.hpp"
#include "test_support.hpp"

namespace {

using namespace agentbox::events;
using agentbox::config::RuntimeConfig;
using agentbox::config::RuntimeType;
using agentbox::runtime::LocalRuntime;
using agentbox::runtime::RuntimeError;
using agentbox::testing::TempWorkspace;

class LocalRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        RuntimeConfig config{};
        config.runtime_type = RuntimeType::kLocal;
        config.workspace_dir = base_.root().string();
        config.timeout_s = 10;
        config.environment["AGENTBOX_ENV_PROBE"] = "from-config";
        runtime_ = std::make_unique<LocalRuntime>(config);
        runtime_->Start("session1");
    }

    Observation Run(const std::string& command, std::optional<int> timeout_s = 10) {
        RunAction run{};
        run.command = command;
        run.timeout_s = timeout_s;
        return runtime_->ExecuteAction(run);
    }

    TempWorkspace base_{"local"};
    std::unique_ptr<LocalRuntime> runtime_;
};

TEST_F(LocalRuntimeTest, StartCreatesSeededWorkspace) {
    const auto workspace = base_.root() / "session1";
    EXPECT_EQ(runtime_->workspace(), workspace);
    for (const char* dir : {"src", "tests", "docs", "tmp"}) {
        EXPECT_TRUE(std::filesystem::is_directory(workspace / dir)) << dir;
    }
    EXPECT_TRUE(std::filesystem::exists(workspace / "README.md"));
    const auto perms = std::filesystem::status(workspace).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::all,
              std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
              std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
              std::filesystem::perms::others_exec);
}

TEST_F(LocalRuntimeTest, RunReportsExitCodesAndStreams) {
    auto observation = Run("echo out; echo err >&2");
    auto result = std::get<CommandResultObservation>(observation);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_EQ(result.working_dir, runtime_->workspace().string());

    result = std::get<CommandResultObservation>(Run("false"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);

    result = std::get<CommandResultObservation>(Run("exit 42"));
    EXPECT_EQ(result.exit_code, 42);
}

TEST_F(LocalRuntimeTest, RunMergesConfiguredEnvironment) {
    const auto result = std::get<CommandResultObservation>(Run("echo $AGENTBOX_ENV_PROBE"));
    EXPECT_EQ(result.stdout_text, "from-config\n");
}

TEST_F(LocalRuntimeTest, RunHonoursWorkingDirInsideWorkspace) {
    RunAction run{};
    run.command = "pwd";
    run.working_dir = "src";
    const auto result = std::get<CommandResultObservation>(runtime_->ExecuteAction(run));
    EXPECT_EQ(result.stdout_text, (runtime_->workspace() / "src").string() + "\n");

    run.working_dir = "../../";
    const auto escaped = runtime_->ExecuteAction(run);
    ASSERT_TRUE(std::holds_alternative<ErrorObservation>(escaped));
    EXPECT_EQ(std::get<ErrorObservation>(escaped).error_type, "path_escape");
}

TEST_F(LocalRuntimeTest, RunTimeoutIsBounded) {
    const auto started = std::chrono::steady_clock::now();
    const auto result = std::get<CommandResultObservation>(Run("sleep 10", 1));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_NE(result.content.find("timed out"), std::string::npos);
}

TEST_F(LocalRuntimeTest, RunRejectsNonPositiveTimeout) {
    for (const int timeout_s : {0, -5}) {
        const auto observation = Run("echo never", timeout_s);
        ASSERT_TRUE(std::holds_alternative<ErrorObservation>(observation)) << timeout_s;
        EXPECT_EQ(std::get<ErrorObservation>(observation).error_type, "invalid_action");
    }
    EXPECT_TRUE(IsSuccess(Run("true", std::nullopt)));
}

TEST_F(LocalRuntimeTest, FileActionsRoundTrip) {
    WriteAction write{};
    write.path = "src/app.py";
    write.content = "line1\nline2\nline3\n";
    const auto written = runtime_->ExecuteAction(write);
    ASSERT_TRUE(std::holds_alternative<FileWrittenObservation>(written));
    EXPECT_EQ(std::get<FileWrittenObservation>(written).size, write.content.size());

    ReadAction read{};
    read.path = "src/app.py";
    auto observation = std::get<FileReadObservation>(runtime_->ExecuteAction(read));
    EXPECT_EQ(observation.content, write.content);
    EXPECT_EQ(observation.encoding, "utf-8");

    read.start_line = 2;
    read.end_line = 3;
    observation = std::get<FileReadObservation>(runtime_->ExecuteAction(read));
    EXPECT_EQ(observation.content, "line2\nline3");
}

TEST_F(LocalRuntimeTest, WriteAndReadBinaryThroughBase64) {
    WriteAction write{};
    write.path = "tmp/blob.txt";
    write.content = "AP8Q";  // 00 ff 10
    write.encoding = "base64";
    ASSERT_TRUE(IsSuccess(runtime_->ExecuteAction(write)));

    ReadAction read{};
    read.path = "tmp/blob.txt";
    const auto observation = std::get<FileReadObservation>(runtime_->ExecuteAction(read));
    EXPECT_EQ(observation.encoding, "base64");
    EXPECT_EQ(observation.content, "AP8Q");
    EXPECT_EQ(observation.size, 3u);
}

TEST_F(LocalRuntimeTest, EditReplacesEveryOccurrence) {
    WriteAction write{};
    write.path = "a.py";
    write.content = "foo = foo + 1\n";
    runtime_->ExecuteAction(write);

    EditAction edit{};
    edit.path = "a.py";
    edit.old_str = "foo";
    edit.new_str = "bar";
    const auto edited = runtime_->ExecuteAction(edit);
    ASSERT_TRUE(std::holds_alternative<FileEditedObservation>(edited));
    EXPECT_EQ(std::get<FileEditedObservation>(edited).replacements, 2);
    EXPECT_EQ(runtime_->ReadFile("a.py"), "bar = bar + 1\n");

    edit.old_str = "missing";
    const auto failed = runtime_->ExecuteAction(edit);
    EXPECT_FALSE(IsSuccess(failed));
    EXPECT_EQ(runtime_->ReadFile("a.py"), "bar = bar + 1\n");
}

TEST_F(LocalRuntimeTest, FileErrorsBecomeObservations) {
    ReadAction read{};
    read.path = "../../etc/passwd";
    auto observation = runtime_->ExecuteAction(read);
    ASSERT_TRUE(std::holds_alternative<ErrorObservation>(observation));
    EXPECT_EQ(std::get<ErrorObservation>(observation).error_type, "path_escape");

    read.path = "missing.txt";
    observation = runtime_->ExecuteAction(read);
    ASSERT_TRUE(std::holds_alternative<ErrorObservation>(observation));
    EXPECT_EQ(std::get<ErrorObservation>(observation).error_type, "file_access");

    WriteAction write{};
    write.path = "tool.exe";
    write.content = "x";
    EXPECT_FALSE(IsSuccess(runtime_->ExecuteAction(write)));
}

TEST_F(LocalRuntimeTest, DeleteCreateDirectoryAndSearch) {
    CreateDirectoryAction mkdir{};
    mkdir.path = "pkg/sub";
    EXPECT_TRUE(IsSuccess(runtime_->ExecuteAction(mkdir)));
    EXPECT_TRUE(std::filesystem::is_directory(runtime_->workspace() / "pkg" / "sub"));

    runtime_->WriteFile("pkg/sub/mod.py", "def handler():\n    return 'Needle'\n");
    SearchAction search{};
    search.query = "needle";
    const auto found = runtime_->ExecuteAction(search);
    ASSERT_TRUE(std::holds_alternative<SuccessObservation>(found));
    const auto& success = std::get<SuccessObservation>(found);
    EXPECT_EQ(success.data["count"], 1);
    EXPECT_EQ(success.data["results"][0]["path"], "pkg/sub/mod.py");
    EXPECT_NE(success.content.find("pkg/sub/mod.py:2:"), std::string::npos);

    DeleteAction remove{};
    remove.path = "pkg";
    EXPECT_TRUE(IsSuccess(runtime_->ExecuteAction(remove)));
    EXPECT_FALSE(std::filesystem::exists(runtime_->workspace() / "pkg"));
}

TEST_F(LocalRuntimeTest, BackgroundProcessIsTrackedAndKilled) {
    RunAction run{};
    run.command = "sleep 30";
    run.background = true;
    const auto started = runtime_->ExecuteAction(run);
    ASSERT_TRUE(std::holds_alternative<SuccessObservation>(started));
    const auto id = std::get<SuccessObservation>(started).data["process_id"].get<std::string>();
    EXPECT_EQ(runtime_->BackgroundProcesses(), std::vector<std::string>{id});

    KillAction kill{};
    kill.process_id = id;
    EXPECT_TRUE(IsSuccess(runtime_->ExecuteAction(kill)));
    EXPECT_TRUE(runtime_->BackgroundProcesses().empty());
    EXPECT_FALSE(IsSuccess(runtime_->ExecuteAction(kill)));
}

TEST_F(LocalRuntimeTest, LifecycleIsIdempotent) {
    runtime_->Start("session1");
    EXPECT_TRUE(runtime_->IsRunning());
    runtime_->Stop();
    runtime_->Stop();
    EXPECT_FALSE(runtime_->IsRunning());
    const auto observation = Run("true");
    ASSERT_TRUE(std::holds_alternative<ErrorObservation>(observation));
    EXPECT_EQ(ContentOf(observation), "Runtime not running");
}

TEST_F(LocalRuntimeTest, StatusDescribesRuntime) {
    const auto status = runtime_->Status();
    EXPECT_EQ(status["runtime_type"], "local");
    EXPECT_EQ(status["session_id"], "session1");
    EXPECT_EQ(status["running"], true);
    EXPECT_EQ(status["workspace"], runtime_->workspace().string());
}

TEST(LocalRuntimeStartTest, RejectsSessionIdsThatAddressOtherDirectories) {
    TempWorkspace base("local_ids");
    RuntimeConfig config{};
    config.workspace_dir = base.root().string();
    LocalRuntime runtime(config);
    EXPECT_THROW(runtime.Start("../escape"), RuntimeError);
    EXPECT_THROW(runtime.Start(""), RuntimeError);
    EXPECT_FALSE(runtime.IsRunning());
}

}  // namespace
