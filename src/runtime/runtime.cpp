#include "runtime/runtime.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>

#include "utils/common.hpp"
#include "utils/encoding.hpp"

namespace agentbox::runtime {
namespace {

std::string CommandContent(const CommandResult& result, int timeout_s) {
    std::string content = result.stdout_text;
    if (!result.stderr_text.empty()) {
        if (!content.empty() && content.back() != '\n') {
            content += "\n";
        }
        content += result.stderr_text;
    }
    if (result.timed_out) {
        if (!content.empty() && content.back() != '\n') {
            content += "\n";
        }
        content += "[Command timed out after " + std::to_string(timeout_s) + " seconds]";
    }
    return content;
}

std::string SliceLines(const std::string& content, std::optional<int> start_line, std::optional<int> end_line) {
    if (!start_line && !end_line) {
        return content;
    }
    const int first = std::max(1, start_line.value_or(1));
    const int last = end_line.value_or(-1);
    std::istringstream stream(content);
    std::ostringstream out;
    std::string line;
    int number = 0;
    bool first_out = true;
    while (std::getline(stream, line)) {
        ++number;
        if (number < first) {
            continue;
        }
        if (last >= 0 && number > last) {
            break;
        }
        if (!first_out) {
            out << '\n';
        }
        out << line;
        first_out = false;
    }
    return out.str();
}

}  // namespace

nlohmann::json ToJson(const FileInfo& info) {
    return {
        {"name", info.name},
        {"path", info.path},
        {"is_directory", info.is_directory},
        {"size", info.size},
        {"modified", info.modified},
        {"permissions", info.permissions}
    };
}

Runtime::Runtime(config::RuntimeConfig config)
    : config_(std::move(config)) {}

events::Observation Runtime::ExecuteAction(const events::Action& action) {
    if (!running_) {
        return events::MakeError("Runtime not running", "runtime");
    }
    const auto type = events::ToString(events::TypeOf(action));
    try {
        if (const auto* run = std::get_if<events::RunAction>(&action)) {
            if (run->timeout_s && *run->timeout_s <= 0) {
                throw std::invalid_argument("timeout must be positive, got " + std::to_string(*run->timeout_s));
            }
        }
        return Dispatch(action);
    } catch (const PathEscapeError& ex) {
        std::cerr << "[runtime] path escape action=" << type << " error=" << ex.what() << std::endl;
        return events::MakeError(ex.what(), "path_escape");
    } catch (const FileAccessError& ex) {
        return events::MakeError(ex.what(), "file_access");
    } catch (const RuntimeError& ex) {
        std::cerr << "[runtime] action failed action=" << type << " error=" << ex.what() << std::endl;
        return events::MakeError(ex.what(), "runtime");
    } catch (const std::invalid_argument& ex) {
        return events::MakeError(ex.what(), "invalid_action");
    } catch (const std::exception& ex) {
        std::cerr << "[runtime] action failed action=" << type << " error=" << ex.what() << std::endl;
        return events::MakeError(std::string("Error executing action: ") + ex.what(), "internal");
    }
}

events::Observation Runtime::Dispatch(const events::Action& action) {
    return std::visit([this](const auto& a) { return Handle(a); }, action);
}

nlohmann::json Runtime::Status() const {
    return {
        {"runtime_type", type_name()},
        {"session_id", session_id_},
        {"running", running_},
        {"background_processes", BackgroundProcesses()}
    };
}

std::vector<std::string> Runtime::BackgroundProcesses() const {
    std::vector<std::string> ids;
    ids.reserve(background_.size());
    for (const auto& [id, pid] : background_) {
        ids.push_back(id);
    }
    return ids;
}

std::string Runtime::RegisterBackground(int pid) {
    const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        utils::Now().time_since_epoch()).count();
    const auto id = "bg_" + std::to_string(++background_counter_) + "_" + std::to_string(epoch);
    background_[id] = pid;
    return id;
}

void Runtime::KillAllBackground() {
    for (const auto& [id, pid] : background_) {
        try {
            TerminateProcess(pid);
        } catch (const std::exception& ex) {
            std::cerr << "[runtime] kill failed process_id=" << id << " error=" << ex.what() << std::endl;
        }
    }
    background_.clear();
}

events::Observation Runtime::Handle(const events::RunAction& action) {
    if (action.background) {
        const int pid = SpawnBackground(action.command, action.working_dir);
        const auto id = RegisterBackground(pid);
        std::cerr << "[runtime] background session=" << session_id_ << " process_id=" << id
                  << " pid=" << pid << std::endl;
        return events::MakeSuccess("Started background process " + id,
                                   {{"process_id", id}, {"pid", pid}, {"command", action.command}});
    }

    const int timeout_s = action.timeout_s.value_or(config_.timeout_s);
    const auto result = RunCommand(action.command, action.working_dir, std::chrono::seconds(timeout_s));
    events::CommandResultObservation observation{};
    observation.command = result.command;
    observation.exit_code = result.exit_code;
    observation.stdout_text = result.stdout_text;
    observation.stderr_text = result.stderr_text;
    observation.working_dir = result.working_dir;
    observation.execution_time = result.execution_time;
    observation.timed_out = result.timed_out;
    observation.success = result.exit_code == 0 && !result.timed_out;
    observation.content = CommandContent(result, timeout_s);
    return observation;
}

events::Observation Runtime::Handle(const events::WriteAction& action) {
    std::string bytes;
    if (action.encoding == "base64") {
        bytes = utils::Base64Decode(action.content);
    } else if (action.encoding == "utf-8" || action.encoding == "utf8") {
        bytes = action.content;
    } else {
        throw std::invalid_argument("unsupported encoding: " + action.encoding);
    }
    const auto size = WriteFile(action.path, bytes);
    events::FileWrittenObservation observation{};
    observation.path = action.path;
    observation.size = size;
    observation.content = "File written successfully: " + action.path;
    return observation;
}

events::Observation Runtime::Handle(const events::ReadAction& action) {
    const auto bytes = ReadFile(action.path);
    events::FileReadObservation observation{};
    observation.path = action.path;
    observation.size = bytes.size();
    if (utils::IsValidUtf8(bytes)) {
        observation.encoding = "utf-8";
        observation.content = SliceLines(bytes, action.start_line, action.end_line);
    } else {
        observation.encoding = "base64";
        observation.content = utils::Base64Encode(bytes);
    }
    return observation;
}

events::Observation Runtime::Handle(const events::EditAction& action) {
    if (action.old_str.empty()) {
        throw std::invalid_argument("old_str must not be empty");
    }
    auto content = ReadFile(action.path);
    int replacements = 0;
    std::size_t pos = 0;
    while ((pos = content.find(action.old_str, pos)) != std::string::npos) {
        content.replace(pos, action.old_str.size(), action.new_str);
        pos += action.new_str.size();
        ++replacements;
    }
    if (replacements == 0) {
        throw FileAccessError("String not found in file: " + action.old_str);
    }
    WriteFile(action.path, content);
    events::FileEditedObservation observation{};
    observation.path = action.path;
    observation.replacements = replacements;
    observation.content = "File edited successfully: " + action.path + " (" +
        std::to_string(replacements) + " replacement" + (replacements == 1 ? "" : "s") + ")";
    return observation;
}

events::Observation Runtime::Handle(const events::DeleteAction& action) {
    DeletePath(action.path);
    return events::MakeSuccess("Deleted " + action.path, {{"path", action.path}});
}

events::Observation Runtime::Handle(const events::CreateDirectoryAction& action) {
    MakeDirectory(action.path);
    return events::MakeSuccess("Created directory " + action.path, {{"path", action.path}});
}

events::Observation Runtime::Handle(const events::SearchAction& action) {
    if (action.query.empty()) {
        throw std::invalid_argument("search query must not be empty");
    }
    const auto matches = SearchFiles(action);
    nlohmann::json results = nlohmann::json::array();
    std::vector<std::string> lines;
    for (const auto& match : matches) {
        results.push_back({{"path", match.path}, {"line", match.line}, {"text", match.text}});
        lines.push_back(match.path + ":" + std::to_string(match.line) + ": " + match.text);
    }
    auto observation = events::MakeSuccess(
        matches.empty() ? "No matches found for: " + action.query : utils::Join(lines, "\n"),
        {{"query", action.query}, {"count", matches.size()}, {"results", results}});
    return observation;
}

events::Observation Runtime::Handle(const events::KillAction& action) {
    auto it = background_.find(action.process_id);
    if (it == background_.end()) {
        return events::MakeError("Unknown process id: " + action.process_id, "invalid_action");
    }
    const int pid = it->second;
    background_.erase(it);
    TerminateProcess(pid);
    return events::MakeSuccess("Killed process " + action.process_id,
                               {{"process_id", action.process_id}, {"pid", pid}});
}

}  // namespace agentbox::runtime
