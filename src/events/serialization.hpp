#pragma once

#include "events/action.hpp"
#include "events/observation.hpp"
#include "nlohmann/json.hpp"

namespace agentbox::events {

nlohmann::json ActionToJson(const Action& action);

// Throws std::invalid_argument when the discriminator is unknown or a
// required field is missing or mistyped.
Action ActionFromJson(const nlohmann::json& json);

nlohmann::json ObservationToJson(const Observation& observation);
Observation ObservationFromJson(const nlohmann::json& json);

// Serializes for the wire. Invalid UTF-8 (raw command output, odd file
// names) is written as U+FFFD instead of throwing.
std::string DumpJson(const nlohmann::json& json, int indent = -1);

}  // namespace agentbox::events
