#include "events/action.hpp"

#include <type_traits>

namespace agentbox::events {

const char* ToString(ActionType type) {
    switch (type) {
        case ActionType::kRun: return "run";
        case ActionType::kWrite: return "write";
        case ActionType::kRead: return "read";
        case ActionType::kEdit: return "edit";
        case ActionType::kDelete: return "delete";
        case ActionType::kCreateDirectory: return "create_directory";
        case ActionType::kSearch: return "search";
        case ActionType::kKill: return "kill";
    }
    return "unknown";
}

std::optional<ActionType> ParseActionType(const std::string& value) {
    static const ActionType kAll[] = {
        ActionType::kRun,
        ActionType::kWrite,
        ActionType::kRead,
        ActionType::kEdit,
        ActionType::kDelete,
        ActionType::kCreateDirectory,
        ActionType::kSearch,
        ActionType::kKill
    };
    for (auto type : kAll) {
        if (value == ToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

ActionType TypeOf(const Action& action) {
    return std::visit([](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, RunAction>) {
            return ActionType::kRun;
        } else if constexpr (std::is_same_v<T, WriteAction>) {
            return ActionType::kWrite;
        } else if constexpr (std::is_same_v<T, ReadAction>) {
            return ActionType::kRead;
        } else if constexpr (std::is_same_v<T, EditAction>) {
            return ActionType::kEdit;
        } else if constexpr (std::is_same_v<T, DeleteAction>) {
            return ActionType::kDelete;
        } else if constexpr (std::is_same_v<T, CreateDirectoryAction>) {
            return ActionType::kCreateDirectory;
        } else if constexpr (std::is_same_v<T, SearchAction>) {
            return ActionType::kSearch;
        } else {
            static_assert(std::is_same_v<T, KillAction>, "unhandled action alternative");
            return ActionType::kKill;
        }
    }, action);
}

}  // namespace agentbox::events
