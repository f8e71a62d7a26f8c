#include "events/observation.hpp"

#include <type_traits>

namespace agentbox::events {

const char* ToString(ObservationType type) {
    switch (type) {
        case ObservationType::kCommandResult: return "command_result";
        case ObservationType::kFileRead: return "file_read";
        case ObservationType::kFileWritten: return "file_written";
        case ObservationType::kFileEdited: return "file_edited";
        case ObservationType::kError: return "error";
        case ObservationType::kSuccess: return "success";
        case ObservationType::kNull: return "null";
    }
    return "unknown";
}

std::optional<ObservationType> ParseObservationType(const std::string& value) {
    static const ObservationType kAll[] = {
        ObservationType::kCommandResult,
        ObservationType::kFileRead,
        ObservationType::kFileWritten,
        ObservationType::kFileEdited,
        ObservationType::kError,
        ObservationType::kSuccess,
        ObservationType::kNull
    };
    for (auto type : kAll) {
        if (value == ToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

ObservationType TypeOf(const Observation& observation) {
    return std::visit([](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, CommandResultObservation>) {
            return ObservationType::kCommandResult;
        } else if constexpr (std::is_same_v<T, FileReadObservation>) {
            return ObservationType::kFileRead;
        } else if constexpr (std::is_same_v<T, FileWrittenObservation>) {
            return ObservationType::kFileWritten;
        } else if constexpr (std::is_same_v<T, FileEditedObservation>) {
            return ObservationType::kFileEdited;
        } else if constexpr (std::is_same_v<T, ErrorObservation>) {
            return ObservationType::kError;
        } else if constexpr (std::is_same_v<T, SuccessObservation>) {
            return ObservationType::kSuccess;
        } else {
            static_assert(std::is_same_v<T, NullObservation>, "unhandled observation alternative");
            return ObservationType::kNull;
        }
    }, observation);
}

const std::string& ContentOf(const Observation& observation) {
    return std::visit([](const auto& o) -> const std::string& { return o.content; }, observation);
}

bool IsSuccess(const Observation& observation) {
    return std::visit([](const auto& o) { return o.success; }, observation);
}

ErrorObservation MakeError(const std::string& message, const std::string& error_type) {
    ErrorObservation error{};
    error.content = message;
    error.success = false;
    error.error_message = message;
    error.error_type = error_type;
    return error;
}

SuccessObservation MakeSuccess(const std::string& message, nlohmann::json data) {
    SuccessObservation success{};
    success.content = message;
    success.success = true;
    success.message = message;
    success.data = std::move(data);
    return success;
}

}  // namespace agentbox::events
