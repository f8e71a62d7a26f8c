#include <gtest/gtest.h>

#include "events/serialization.hpp"
#include "utils/encoding.hpp"

namespace {

using namespace agentbox::events;

TEST(SerializationTest, RunActionDefaultsTimeoutWhenAbsent) {
    const auto action = ActionFromJson({{"action_type", "run"}, {"command", "ls -la"}});
    const auto& run = std::get<RunAction>(action);
    EXPECT_EQ(run.command, "ls -la");
    EXPECT_EQ(run.timeout_s, 30);
    EXPECT_FALSE(run.background);
    EXPECT_FALSE(run.working_dir.has_value());
}

TEST(SerializationTest, RunActionNullTimeoutMeansRuntimeDefault) {
    const auto action = ActionFromJson({{"action_type", "run"}, {"command", "true"}, {"timeout", nullptr}});
    EXPECT_FALSE(std::get<RunAction>(action).timeout_s.has_value());
}

TEST(SerializationTest, EveryActionRoundTrips) {
    RunAction run{};
    run.command = "echo hi";
    run.working_dir = "src";
    run.timeout_s = 5;
    run.background = true;
    run.thought = "check output";

    WriteAction write{};
    write.path = "a.txt";
    write.content = "aGk=";
    write.encoding = "base64";

    ReadAction read{};
    read.path = "a.txt";
    read.start_line = 2;
    read.end_line = 4;

    EditAction edit{};
    edit.path = "a.py";
    edit.old_str = "foo";
    edit.new_str = "bar";

    DeleteAction remove{};
    remove.path = "tmp";

    CreateDirectoryAction mkdir{};
    mkdir.path = "src/pkg";

    SearchAction search{};
    search.query = "TODO";
    search.path = "src";
    search.file_pattern = "*.py";
    search.case_sensitive = true;

    KillAction kill{};
    kill.process_id = "bg_1_1700000000";

    const std::vector<Action> actions = {run, write, read, edit, remove, mkdir, search, kill};
    for (const auto& action : actions) {
        const auto json = ActionToJson(action);
        EXPECT_EQ(json["action_type"], ToString(TypeOf(action)));
        EXPECT_EQ(ActionFromJson(json), action) << json.dump();
    }
}

TEST(SerializationTest, ActionWireShapeUsesSnakeCaseDiscriminator) {
    CreateDirectoryAction mkdir{};
    mkdir.path = "docs";
    const auto json = ActionToJson(mkdir);
    EXPECT_EQ(json["action_type"], "create_directory");
    EXPECT_EQ(json["path"], "docs");
    EXPECT_TRUE(json["thought"].is_null());
}

TEST(SerializationTest, RejectsUnknownActionType) {
    EXPECT_THROW(ActionFromJson({{"action_type", "browse"}, {"url", "x"}}), std::invalid_argument);
}

TEST(SerializationTest, RejectsMissingRequiredField) {
    EXPECT_THROW(ActionFromJson({{"action_type", "write"}, {"path", "a.txt"}}), std::invalid_argument);
    EXPECT_THROW(ActionFromJson({{"action_type", "run"}, {"command", 42}}), std::invalid_argument);
    EXPECT_THROW(ActionFromJson(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(ActionFromJson({{"command", "ls"}}), std::invalid_argument);
}

TEST(SerializationTest, EveryObservationRoundTrips) {
    CommandResultObservation command{};
    command.content = "hi\n";
    command.success = true;
    command.command = "echo hi";
    command.exit_code = 0;
    command.stdout_text = "hi\n";
    command.working_dir = "/workspace";
    command.execution_time = 0.25;

    FileReadObservation read{};
    read.content = "print(1)";
    read.path = "a.py";
    read.size = 8;

    FileWrittenObservation written{};
    written.content = "File written successfully: a.py";
    written.path = "a.py";
    written.size = 8;

    FileEditedObservation edited{};
    edited.content = "File edited successfully: a.py";
    edited.path = "a.py";
    edited.replacements = 3;

    const auto error = MakeError("File not found: x", "file_access");
    const auto success = MakeSuccess("Started", {{"process_id", "bg_1"}, {"pid", 42}});
    const NullObservation null{};

    const std::vector<Observation> observations = {command, read, written, edited, error, success, null};
    for (const auto& observation : observations) {
        const auto json = ObservationToJson(observation);
        EXPECT_EQ(json["observation_type"], ToString(TypeOf(observation)));
        EXPECT_EQ(json["success"], IsSuccess(observation));
        EXPECT_EQ(json["content"], ContentOf(observation));
        EXPECT_EQ(ObservationFromJson(json), observation) << json.dump();
    }
}

TEST(SerializationTest, CommandResultUsesStdoutStderrKeys) {
    CommandResultObservation command{};
    command.stdout_text = "out";
    command.stderr_text = "err";
    command.exit_code = 1;
    const auto json = ObservationToJson(command);
    EXPECT_EQ(json["stdout"], "out");
    EXPECT_EQ(json["stderr"], "err");
    EXPECT_EQ(json["exit_code"], 1);
    EXPECT_EQ(json["success"], false);
}

TEST(SerializationTest, DumpReplacesInvalidUtf8InCommandOutput) {
    CommandResultObservation command{};
    command.exit_code = 0;
    command.success = true;
    command.stdout_text = "caf\xe9\n\xff\xfe";
    command.content = command.stdout_text;

    std::string wire;
    ASSERT_NO_THROW(wire = DumpJson(ObservationToJson(command)));
    const auto parsed = nlohmann::json::parse(wire);
    EXPECT_EQ(parsed["observation_type"], "command_result");
    const auto stdout_text = parsed["stdout"].get<std::string>();
    EXPECT_EQ(stdout_text.rfind("caf\xEF\xBF\xBD", 0), 0u);
    EXPECT_TRUE(agentbox::utils::IsValidUtf8(stdout_text));
    EXPECT_EQ(parsed["exit_code"], 0);
}

TEST(SerializationTest, DumpKeepsValidUtf8Untouched) {
    const nlohmann::json json = {{"content", "h\xC3\xA9llo"}};
    EXPECT_EQ(DumpJson(json), json.dump());
    EXPECT_EQ(DumpJson(json, 2), json.dump(2));
}

TEST(SerializationTest, NullObservationHasDefaultContent) {
    const auto json = ObservationToJson(NullObservation{});
    EXPECT_EQ(json["observation_type"], "null");
    EXPECT_EQ(json["content"], "No action taken");
    EXPECT_EQ(json["success"], true);
}

TEST(SerializationTest, ErrorObservationIsNeverSuccessful) {
    const Observation error = MakeError("boom");
    EXPECT_FALSE(IsSuccess(error));
    EXPECT_EQ(std::get<ErrorObservation>(error).error_type, "internal");
}

}  // namespace
