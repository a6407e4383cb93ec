#include "tool_names.hpp"

#include <array>
#include <cctype>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace relay {
namespace {

struct NameMapping {
  const char* from;
  const char* to;
};

constexpr std::array<NameMapping, 3> kToolNameMap = {{
    {"todowrite", "TodoWrite"},
    {"webfetch", "WebFetch"},
    {"google_search", "Google_Search"},
}};

constexpr std::array<const char*, 8> kBuiltinToolTypePrefixes = {
    "web_search", "computer", "text_editor", "bash", "code_execution", "memory", "web_fetch", "tool_search",
};

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

std::string NormalizeToolName(const std::string& name) {
  if (name.empty()) return name;
  for (const auto& m : kToolNameMap) {
    if (name == m.from) return m.to;
  }
  std::string out = name;
  out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  return out;
}

nlohmann::ordered_json NormalizeToolNameValue(const nlohmann::ordered_json& name) {
  if (!name.is_string()) return name;
  return NormalizeToolName(name.get<std::string>());
}

bool IsBuiltinToolType(const std::optional<std::string>& type) {
  if (!type || type->empty()) return false;
  for (const auto* prefix : kBuiltinToolTypePrefixes) {
    if (StartsWith(*type, prefix)) return true;
  }
  return false;
}

bool IsBuiltinTool(const ToolDescriptor& tool) {
  return IsBuiltinToolType(tool.type);
}

RequestEnvelope NormalizeRequestToolNames(RequestEnvelope req) {
  if (req.tools) {
    for (auto& tool : *req.tools) {
      if (IsBuiltinTool(tool)) continue;
      if (tool.name) tool.name = NormalizeToolName(*tool.name);
    }
  }

  if (req.messages) {
    for (auto& message : *req.messages) {
      auto* blocks = std::get_if<std::vector<ContentBlock>>(&message.content);
      if (!blocks) continue;
      for (auto& block : *blocks) {
        auto* tool_use = std::get_if<ToolUseBlock>(&block);
        if (tool_use && tool_use->name) tool_use->name = NormalizeToolName(*tool_use->name);
      }
    }
  }

  return req;
}

}  // namespace relay
