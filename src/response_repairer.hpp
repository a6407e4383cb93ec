#pragma once

#include "request_model.hpp"

#include <nlohmann/json.hpp>

namespace relay {

// A string that starts with '[' or '{' and parses as JSON is returned parsed;
// every other value, and any string that fails to parse, comes back as-is.
nlohmann::ordered_json DecodeEmbeddedJson(const nlohmann::ordered_json& value);

// Undoes double-encoded tool arguments: each top-level member of a tool_use
// block's `input` object goes through DecodeEmbeddedJson.
ResponseEnvelope RepairToolUseInputs(ResponseEnvelope resp);

}  // namespace relay
