#include <gtest/gtest.h>

#include "runtime/docker_runtime.hpp"
#include "runtime/local_runtime.hpp"
#include "runtime/remote_runtime.hpp"
#include "runtime/runtime_manager.hpp"
#include "test_support.hpp"

namespace {

using namespace agentbox::events;
using agentbox::config::RuntimeConfig;
using agentbox::config::RuntimeType;
using agentbox::runtime::CommandResult;
using agentbox::runtime::FileInfo;
using agentbox::runtime::MakeRuntime;
using agentbox::runtime::Runtime;
using agentbox::runtime::RuntimeError;
using agentbox::runtime::RuntimeManager;
using agentbox::runtime::SearchMatch;

// Records lifecycle calls; every primitive answers from memory.
class FakeRuntime : public Runtime {
public:
    explicit FakeRuntime(RuntimeConfig config, bool fail_start = false)
        : Runtime(std::move(config)),
          fail_start_(fail_start) {}

    void Start(const std::string& session_id) override {
        ++starts;
        if (fail_start_) {
            throw RuntimeError("container refused to start");
        }
        session_id_ = session_id;
        running_ = true;
    }

    void Stop() override {
        ++stops;
        running_ = false;
    }

    std::string ReadFile(const std::string& path) override { return "contents of " + path; }
    std::size_t WriteFile(const std::string&, const std::string& content) override { return content.size(); }
    std::vector<FileInfo> ListFiles(const std::string&) override { return {}; }

    CommandResult RunCommand(const std::string& command,
                             const std::optional<std::string>&,
                             std::chrono::seconds) override {
        CommandResult result{};
        result.command = command;
        result.exit_code = 0;
        result.stdout_text = "ran " + command;
        return result;
    }

    const char* type_name() const override { return "fake"; }

    int starts = 0;
    int stops = 0;

protected:
    void DeletePath(const std::string&) override {}
    void MakeDirectory(const std::string&) override {}
    std::vector<SearchMatch> SearchFiles(const SearchAction&) override { return {}; }
    int SpawnBackground(const std::string&, const std::optional<std::string>&) override { return 1; }
    void TerminateProcess(int) override {}

private:
    bool fail_start_;
};

class RuntimeManagerTest : public ::testing::Test {
protected:
    RuntimeManagerTest()
        : manager_([this](const RuntimeConfig& config) {
              auto runtime = std::make_shared<FakeRuntime>(config, fail_start_);
              created_.push_back(runtime);
              return runtime;
          }) {}

    bool fail_start_ = false;
    std::vector<std::shared_ptr<FakeRuntime>> created_;
    RuntimeManager manager_;
};

TEST_F(RuntimeManagerTest, CreateStartsRuntime) {
    auto runtime = manager_.CreateRuntime("alpha", RuntimeConfig{});
    ASSERT_NE(runtime, nullptr);
    EXPECT_TRUE(runtime->IsRunning());
    EXPECT_EQ(runtime->session_id(), "alpha");
    EXPECT_EQ(manager_.GetRuntime("alpha"), runtime);
    EXPECT_EQ(manager_.GetRuntime("beta"), nullptr);
    EXPECT_EQ(created_.at(0)->starts, 1);
}

TEST_F(RuntimeManagerTest, DuplicateLiveSessionIsRejected) {
    manager_.CreateRuntime("alpha", RuntimeConfig{});
    EXPECT_THROW(manager_.CreateRuntime("alpha", RuntimeConfig{}), RuntimeError);
    EXPECT_EQ(manager_.ActiveSessions(), std::vector<std::string>{"alpha"});
}

TEST_F(RuntimeManagerTest, SessionCanBeRecreatedAfterStop) {
    manager_.CreateRuntime("alpha", RuntimeConfig{});
    manager_.StopRuntime("alpha");
    EXPECT_EQ(created_.at(0)->stops, 1);
    EXPECT_TRUE(manager_.ActiveSessions().empty());

    auto again = manager_.CreateRuntime("alpha", RuntimeConfig{});
    EXPECT_TRUE(again->IsRunning());
    EXPECT_EQ(created_.size(), 2u);
}

TEST_F(RuntimeManagerTest, FailedStartIsNotRegistered) {
    fail_start_ = true;
    EXPECT_THROW(manager_.CreateRuntime("alpha", RuntimeConfig{}), RuntimeError);
    EXPECT_EQ(manager_.GetRuntime("alpha"), nullptr);
}

TEST_F(RuntimeManagerTest, ExecuteRoutesToSessionRuntime) {
    manager_.CreateRuntime("alpha", RuntimeConfig{});
    RunAction run{};
    run.command = "ls";
    const auto observation = manager_.ExecuteAction("alpha", run);
    ASSERT_TRUE(std::holds_alternative<CommandResultObservation>(observation));
    EXPECT_EQ(std::get<CommandResultObservation>(observation).stdout_text, "ran ls");
}

TEST_F(RuntimeManagerTest, ExecuteOnUnknownSessionIsAnError) {
    const auto observation = manager_.ExecuteAction("ghost", RunAction{});
    ASSERT_TRUE(std::holds_alternative<ErrorObservation>(observation));
    const auto& error = std::get<ErrorObservation>(observation);
    EXPECT_EQ(error.error_type, "runtime");
    EXPECT_EQ(error.content, "No runtime found for session ghost");
}

TEST_F(RuntimeManagerTest, StopUnknownSessionIsNoOp) {
    manager_.StopRuntime("ghost");
    EXPECT_TRUE(manager_.ActiveSessions().empty());
}

TEST_F(RuntimeManagerTest, CleanupAllStopsEverySession) {
    manager_.CreateRuntime("alpha", RuntimeConfig{});
    manager_.CreateRuntime("beta", RuntimeConfig{});
    EXPECT_EQ(manager_.ActiveSessions(), (std::vector<std::string>{"alpha", "beta"}));

    manager_.CleanupAll();
    EXPECT_TRUE(manager_.ActiveSessions().empty());
    for (const auto& runtime : created_) {
        EXPECT_FALSE(runtime->IsRunning());
        EXPECT_EQ(runtime->stops, 1);
    }
    manager_.CleanupAll();
}

TEST(MakeRuntimeTest, BuildsRuntimeForEachType) {
    RuntimeConfig config{};
    config.runtime_type = RuntimeType::kLocal;
    EXPECT_NE(dynamic_cast<agentbox::runtime::LocalRuntime*>(MakeRuntime(config).get()), nullptr);

    config.runtime_type = RuntimeType::kDocker;
    EXPECT_NE(dynamic_cast<agentbox::runtime::DockerRuntime*>(MakeRuntime(config).get()), nullptr);

    config.runtime_type = RuntimeType::kRemote;
    EXPECT_NE(dynamic_cast<agentbox::runtime::RemoteRuntime*>(MakeRuntime(config).get()), nullptr);

    config.runtime_type = static_cast<RuntimeType>(42);
    EXPECT_THROW(MakeRuntime(config), RuntimeError);
}

TEST(RuntimeManagerLocalTest, ManagesLocalWorkspaces) {
    agentbox::testing::TempWorkspace base("manager");
    RuntimeConfig config{};
    config.runtime_type = RuntimeType::kLocal;
    config.workspace_dir = base.root().string();

    RuntimeManager manager;
    manager.CreateRuntime("s1", config);

    WriteAction write{};
    write.path = "notes.txt";
    write.content = "hello";
    EXPECT_TRUE(IsSuccess(manager.ExecuteAction("s1", write)));
    EXPECT_EQ(base.Read("s1/notes.txt"), "hello");

    manager.StopRuntime("s1");
    EXPECT_FALSE(IsSuccess(manager.ExecuteAction("s1", ReadAction{"notes.txt"})));
}

}  // namespace
