#pragma once

#include "../include/cookie/events.hpp"
#include "../include/cookie/flow_state.hpp"
#include "../include/cookie/presentation.hpp"
#include "../include/cookie/types.hpp"

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cookie::bridge {

// Accepts integers and floats (rounded). Throws std::invalid_argument for
// other types or values outside the int range.
int json_to_int(const nlohmann::json& value, std::string_view key);

// {"type": "<EventName>", ...camelCase payload}
nlohmann::json to_json(const Event& event);

nlohmann::json to_json(const Question& question);

// Expects [{"dividend": n, "divisor": m}, ...]. Throws std::invalid_argument
// on a malformed document; range checks are left to QuestionGenerator.
std::vector<QuestionRequest> question_requests_from_json(const nlohmann::json& json_requests);

nlohmann::json to_json(const ResultsView& results);

// {"name": "<StateName>", ...payload}
nlohmann::json to_json(const flow::State& state);

} // namespace cookie::bridge
