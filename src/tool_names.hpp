#pragma once

#include "request_model.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace relay {

// Maps a client tool name to the casing the upstream's tool convention uses:
// a fixed table for known names, otherwise the first character uppercased.
std::string NormalizeToolName(const std::string& name);

// Same as above for a raw JSON value; anything that is not a non-empty string
// comes back unchanged.
nlohmann::ordered_json NormalizeToolNameValue(const nlohmann::ordered_json& name);

// Server-executed tools (web search, computer use, ...) are identified by the
// prefix of their `type` and keep their name untouched.
bool IsBuiltinToolType(const std::optional<std::string>& type);
bool IsBuiltinTool(const ToolDescriptor& tool);

// Normalizes every non-builtin tool declaration and every tool_use block in
// the conversation history.
RequestEnvelope NormalizeRequestToolNames(RequestEnvelope req);

}  // namespace relay
