#pragma once

#include <optional>
#include <string>
#include <variant>

#include "nlohmann/json.hpp"

namespace agentbox::events {

enum class ObservationType {
    kCommandResult,
    kFileRead,
    kFileWritten,
    kFileEdited,
    kError,
    kSuccess,
    kNull
};

const char* ToString(ObservationType type);
std::optional<ObservationType> ParseObservationType(const std::string& value);

struct CommandResultObservation {
    std::string content;
    bool success = false;
    std::string command;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string working_dir;
    double execution_time = 0.0;
    bool timed_out = false;

    bool operator==(const CommandResultObservation&) const = default;
};

struct FileReadObservation {
    std::string content;
    bool success = true;
    std::string path;
    std::string encoding = "utf-8";
    std::size_t size = 0;

    bool operator==(const FileReadObservation&) const = default;
};

struct FileWrittenObservation {
    std::string content;
    bool success = true;
    std::string path;
    std::size_t size = 0;

    bool operator==(const FileWrittenObservation&) const = default;
};

struct FileEditedObservation {
    std::string content;
    bool success = true;
    std::string path;
    int replacements = 0;

    bool operator==(const FileEditedObservation&) const = default;
};

struct ErrorObservation {
    std::string content;
    bool success = false;
    std::string error_message;
    std::string error_type;

    bool operator==(const ErrorObservation&) const = default;
};

struct SuccessObservation {
    std::string content;
    bool success = true;
    std::string message;
    nlohmann::json data = nlohmann::json::object();

    bool operator==(const SuccessObservation&) const = default;
};

struct NullObservation {
    std::string content = "No action taken";
    bool success = true;

    bool operator==(const NullObservation&) const = default;
};

using Observation = std::variant<
    CommandResultObservation,
    FileReadObservation,
    FileWrittenObservation,
    FileEditedObservation,
    ErrorObservation,
    SuccessObservation,
    NullObservation>;

ObservationType TypeOf(const Observation& observation);
const std::string& ContentOf(const Observation& observation);
bool IsSuccess(const Observation& observation);

ErrorObservation MakeError(const std::string& message, const std::string& error_type = "internal");
SuccessObservation MakeSuccess(const std::string& message,
                               nlohmann::json data = nlohmann::json::object());

}  // namespace agentbox::events
