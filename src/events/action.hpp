#pragma once

#include <optional>
#include <string>
#include <variant>

namespace agentbox::events {

enum class ActionType {
    kRun,
    kWrite,
    kRead,
    kEdit,
    kDelete,
    kCreateDirectory,
    kSearch,
    kKill
};

const char* ToString(ActionType type);
std::optional<ActionType> ParseActionType(const std::string& value);

struct RunAction {
    std::string command;
    std::optional<std::string> working_dir;
    std::optional<int> timeout_s = 30;
    bool background = false;
    std::string thought;

    bool operator==(const RunAction&) const = default;
};

struct WriteAction {
    std::string path;
    std::string content;
    std::string encoding = "utf-8";
    std::string thought;

    bool operator==(const WriteAction&) const = default;
};

// Lines are 1-indexed and inclusive.
struct ReadAction {
    std::string path;
    std::optional<int> start_line;
    std::optional<int> end_line;
    std::string thought;

    bool operator==(const ReadAction&) const = default;
};

struct EditAction {
    std::string path;
    std::string old_str;
    std::string new_str;
    std::string thought;

    bool operator==(const EditAction&) const = default;
};

struct DeleteAction {
    std::string path;
    std::string thought;

    bool operator==(const DeleteAction&) const = default;
};

struct CreateDirectoryAction {
    std::string path;
    std::string thought;

    bool operator==(const CreateDirectoryAction&) const = default;
};

struct SearchAction {
    std::string query;
    std::optional<std::string> path;
    std::optional<std::string> file_pattern;
    bool case_sensitive = false;
    std::string thought;

    bool operator==(const SearchAction&) const = default;
};

struct KillAction {
    std::string process_id;
    std::string thought;

    bool operator==(const KillAction&) const = default;
};

using Action = std::variant<
    RunAction,
    WriteAction,
    ReadAction,
    EditAction,
    DeleteAction,
    CreateDirectoryAction,
    SearchAction,
    KillAction>;

ActionType TypeOf(const Action& action);

}  // namespace agentbox::events
