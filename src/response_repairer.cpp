#include "response_repairer.hpp"

#include <string>
#include <variant>

namespace relay {

nlohmann::ordered_json DecodeEmbeddedJson(const nlohmann::ordered_json& value) {
  if (!value.is_string()) return value;
  const auto& s = value.get_ref<const std::string&>();
  if (s.empty() || (s.front() != '[' && s.front() != '{')) return value;
  auto parsed = nlohmann::ordered_json::parse(s, nullptr, false);
  if (parsed.is_discarded()) return value;
  return parsed;
}

ResponseEnvelope RepairToolUseInputs(ResponseEnvelope resp) {
  if (!resp.content) return resp;
  for (auto& block : *resp.content) {
    auto* tool_use = std::get_if<ToolUseBlock>(&block);
    if (!tool_use || !tool_use->input || !tool_use->input->is_object()) continue;
    for (auto it = tool_use->input->begin(); it != tool_use->input->end(); ++it) {
      it.value() = DecodeEmbeddedJson(it.value());
    }
  }
  return resp;
}

}  // namespace relay
