#include "events/serialization.hpp"

#include <stdexcept>
#include <type_traits>

namespace agentbox::events {
namespace {

nlohmann::json OptionalToJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json OptionalToJson(const std::optional<int>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::string RequireString(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_string()) {
        throw std::invalid_argument(std::string("missing or non-string field: ") + key);
    }
    return json[key].get<std::string>();
}

std::string OptionalString(const nlohmann::json& json, const char* key, const std::string& fallback = {}) {
    if (json.contains(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return fallback;
}

std::optional<std::string> NullableString(const nlohmann::json& json, const char* key) {
    if (json.contains(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<int> NullableInt(const nlohmann::json& json,
                               const char* key,
                               std::optional<int> missing = std::nullopt) {
    if (!json.contains(key)) {
        return missing;
    }
    if (json[key].is_number_integer()) {
        return json[key].get<int>();
    }
    if (json[key].is_null()) {
        return std::nullopt;
    }
    throw std::invalid_argument(std::string("non-integer field: ") + key);
}

bool OptionalBool(const nlohmann::json& json, const char* key, bool fallback) {
    if (json.contains(key) && json[key].is_boolean()) {
        return json[key].get<bool>();
    }
    return fallback;
}

}  // namespace

nlohmann::json ActionToJson(const Action& action) {
    nlohmann::json json = std::visit([](const auto& a) -> nlohmann::json {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, RunAction>) {
            return {
                {"command", a.command},
                {"working_dir", OptionalToJson(a.working_dir)},
                {"timeout", OptionalToJson(a.timeout_s)},
                {"background", a.background}
            };
        } else if constexpr (std::is_same_v<T, WriteAction>) {
            return {{"path", a.path}, {"content", a.content}, {"encoding", a.encoding}};
        } else if constexpr (std::is_same_v<T, ReadAction>) {
            return {
                {"path", a.path},
                {"start_line", OptionalToJson(a.start_line)},
                {"end_line", OptionalToJson(a.end_line)}
            };
        } else if constexpr (std::is_same_v<T, EditAction>) {
            return {{"path", a.path}, {"old_str", a.old_str}, {"new_str", a.new_str}};
        } else if constexpr (std::is_same_v<T, DeleteAction>) {
            return {{"path", a.path}};
        } else if constexpr (std::is_same_v<T, CreateDirectoryAction>) {
            return {{"path", a.path}};
        } else if constexpr (std::is_same_v<T, SearchAction>) {
            return {
                {"query", a.query},
                {"path", OptionalToJson(a.path)},
                {"file_pattern", OptionalToJson(a.file_pattern)},
                {"case_sensitive", a.case_sensitive}
            };
        } else {
            static_assert(std::is_same_v<T, KillAction>, "unhandled action alternative");
            return {{"process_id", a.process_id}};
        }
    }, action);
    json["action_type"] = ToString(TypeOf(action));
    const auto& thought = std::visit([](const auto& a) -> const std::string& { return a.thought; }, action);
    json["thought"] = thought.empty() ? nlohmann::json(nullptr) : nlohmann::json(thought);
    return json;
}

Action ActionFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("action must be a JSON object");
    }
    const auto type_name = RequireString(json, "action_type");
    const auto type = ParseActionType(type_name);
    if (!type) {
        throw std::invalid_argument("unknown action_type: " + type_name);
    }
    const auto thought = OptionalString(json, "thought");

    switch (*type) {
        case ActionType::kRun: {
            RunAction run{};
            run.command = RequireString(json, "command");
            run.working_dir = NullableString(json, "working_dir");
            run.timeout_s = NullableInt(json, "timeout", 30);
            run.background = OptionalBool(json, "background", false);
            run.thought = thought;
            return run;
        }
        case ActionType::kWrite: {
            WriteAction write{};
            write.path = RequireString(json, "path");
            write.content = RequireString(json, "content");
            write.encoding = OptionalString(json, "encoding", "utf-8");
            write.thought = thought;
            return write;
        }
        case ActionType::kRead: {
            ReadAction read{};
            read.path = RequireString(json, "path");
            read.start_line = NullableInt(json, "start_line");
            read.end_line = NullableInt(json, "end_line");
            read.thought = thought;
            return read;
        }
        case ActionType::kEdit: {
            EditAction edit{};
            edit.path = RequireString(json, "path");
            edit.old_str = RequireString(json, "old_str");
            edit.new_str = RequireString(json, "new_str");
            edit.thought = thought;
            return edit;
        }
        case ActionType::kDelete: {
            DeleteAction remove{};
            remove.path = RequireString(json, "path");
            remove.thought = thought;
            return remove;
        }
        case ActionType::kCreateDirectory: {
            CreateDirectoryAction mkdir{};
            mkdir.path = RequireString(json, "path");
            mkdir.thought = thought;
            return mkdir;
        }
        case ActionType::kSearch: {
            SearchAction search{};
            search.query = RequireString(json, "query");
            search.path = NullableString(json, "path");
            search.file_pattern = NullableString(json, "file_pattern");
            search.case_sensitive = OptionalBool(json, "case_sensitive", false);
            search.thought = thought;
            return search;
        }
        case ActionType::kKill: {
            KillAction kill{};
            kill.process_id = RequireString(json, "process_id");
            kill.thought = thought;
            return kill;
        }
    }
    throw std::invalid_argument("unhandled action_type: " + type_name);
}

nlohmann::json ObservationToJson(const Observation& observation) {
    nlohmann::json json = std::visit([](const auto& o) -> nlohmann::json {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, CommandResultObservation>) {
            return {
                {"command", o.command},
                {"exit_code", o.exit_code},
                {"stdout", o.stdout_text},
                {"stderr", o.stderr_text},
                {"working_dir", o.working_dir},
                {"execution_time", o.execution_time},
                {"timed_out", o.timed_out}
            };
        } else if constexpr (std::is_same_v<T, FileReadObservation>) {
            return {{"path", o.path}, {"encoding", o.encoding}, {"size", o.size}};
        } else if constexpr (std::is_same_v<T, FileWrittenObservation>) {
            return {{"path", o.path}, {"size", o.size}};
        } else if constexpr (std::is_same_v<T, FileEditedObservation>) {
            return {{"path", o.path}, {"replacements", o.replacements}};
        } else if constexpr (std::is_same_v<T, ErrorObservation>) {
            return {{"error_message", o.error_message}, {"error_type", o.error_type}};
        } else if constexpr (std::is_same_v<T, SuccessObservation>) {
            return {{"message", o.message}, {"data", o.data}};
        } else {
            static_assert(std::is_same_v<T, NullObservation>, "unhandled observation alternative");
            return nlohmann::json::object();
        }
    }, observation);
    json["observation_type"] = ToString(TypeOf(observation));
    json["success"] = IsSuccess(observation);
    json["content"] = ContentOf(observation);
    return json;
}

Observation ObservationFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("observation must be a JSON object");
    }
    const auto type_name = RequireString(json, "observation_type");
    const auto type = ParseObservationType(type_name);
    if (!type) {
        throw std::invalid_argument("unknown observation_type: " + type_name);
    }
    const auto content = OptionalString(json, "content");

    switch (*type) {
        case ObservationType::kCommandResult: {
            CommandResultObservation result{};
            result.content = content;
            result.success = OptionalBool(json, "success", false);
            result.command = OptionalString(json, "command");
            result.exit_code = json.value("exit_code", -1);
            result.stdout_text = OptionalString(json, "stdout");
            result.stderr_text = OptionalString(json, "stderr");
            result.working_dir = OptionalString(json, "working_dir");
            result.execution_time = json.value("execution_time", 0.0);
            result.timed_out = OptionalBool(json, "timed_out", false);
            return result;
        }
        case ObservationType::kFileRead: {
            FileReadObservation read{};
            read.content = content;
            read.success = OptionalBool(json, "success", true);
            read.path = OptionalString(json, "path");
            read.encoding = OptionalString(json, "encoding", "utf-8");
            read.size = json.value("size", static_cast<std::size_t>(0));
            return read;
        }
        case ObservationType::kFileWritten: {
            FileWrittenObservation written{};
            written.content = content;
            written.success = OptionalBool(json, "success", true);
            written.path = OptionalString(json, "path");
            written.size = json.value("size", static_cast<std::size_t>(0));
            return written;
        }
        case ObservationType::kFileEdited: {
            FileEditedObservation edited{};
            edited.content = content;
            edited.success = OptionalBool(json, "success", true);
            edited.path = OptionalString(json, "path");
            edited.replacements = json.value("replacements", 0);
            return edited;
        }
        case ObservationType::kError: {
            ErrorObservation error{};
            error.content = content;
            error.success = OptionalBool(json, "success", false);
            error.error_message = OptionalString(json, "error_message", content);
            error.error_type = OptionalString(json, "error_type");
            return error;
        }
        case ObservationType::kSuccess: {
            SuccessObservation success{};
            success.content = content;
            success.success = OptionalBool(json, "success", true);
            success.message = OptionalString(json, "message", content);
            if (json.contains("data") && json["data"].is_object()) {
                success.data = json["data"];
            }
            return success;
        }
        case ObservationType::kNull: {
            NullObservation null{};
            if (json.contains("content") && json["content"].is_string()) {
                null.content = content;
            }
            null.success = OptionalBool(json, "success", true);
            return null;
        }
    }
    throw std::invalid_argument("unhandled observation_type: " + type_name);
}

std::string DumpJson(const nlohmann::json& json, int indent) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace agentbox::events
