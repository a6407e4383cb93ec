#include "request_model.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace relay {
namespace {

static nlohmann::ordered_json ObjectOrEmpty(const nlohmann::ordered_json& rest) {
  return rest.is_object() ? rest : nlohmann::ordered_json::object();
}

// Typed members the block did not carry before lead the output, in the order
// given; members already present keep their position.
static nlohmann::ordered_json MergeBlockFields(const nlohmann::ordered_json& rest,
                                               const nlohmann::ordered_json& typed) {
  const auto base = ObjectOrEmpty(rest);
  nlohmann::ordered_json out = nlohmann::ordered_json::object();
  for (auto it = typed.begin(); it != typed.end(); ++it) {
    if (!base.contains(it.key())) out[it.key()] = it.value();
  }
  for (auto it = base.begin(); it != base.end(); ++it) {
    out[it.key()] = typed.contains(it.key()) ? typed[it.key()] : it.value();
  }
  return out;
}

static bool IsTruthy(const nlohmann::ordered_json& v) {
  if (v.is_null()) return false;
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_number_unsigned()) return v.get<uint64_t>() != 0;
  if (v.is_number_integer()) return v.get<int64_t>() != 0;
  if (v.is_number_float()) return v.get<double>() != 0.0;
  if (v.is_string()) return !v.get_ref<const std::string&>().empty();
  return true;
}

static std::variant<NoContent, std::string, std::vector<ContentBlock>> ParseTextOrBlocks(
    const nlohmann::ordered_json& j) {
  if (j.is_string()) return j.get<std::string>();
  if (j.is_array()) {
    std::vector<ContentBlock> blocks;
    blocks.reserve(j.size());
    for (const auto& b : j) blocks.push_back(ParseContentBlock(b));
    return blocks;
  }
  return NoContent{};
}

static std::optional<nlohmann::ordered_json> TextOrBlocksToJson(
    const std::variant<NoContent, std::string, std::vector<ContentBlock>>& v) {
  if (const auto* text = std::get_if<std::string>(&v)) return nlohmann::ordered_json(*text);
  if (const auto* blocks = std::get_if<std::vector<ContentBlock>>(&v)) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& b : *blocks) arr.push_back(ToJson(b));
    return arr;
  }
  return std::nullopt;
}

// `content` and `system` of an unexpected shape stay untyped.
static bool IsTextOrBlocks(const nlohmann::ordered_json& j) {
  return j.is_string() || j.is_array();
}

static Message ParseMessage(const nlohmann::ordered_json& j) {
  Message m;
  m.rest = j;
  if (!j.is_object()) return m;
  if (j.contains("role") && j["role"].is_string()) m.role = j["role"].get<std::string>();
  if (j.contains("content") && IsTextOrBlocks(j["content"])) m.content = ParseTextOrBlocks(j["content"]);
  return m;
}

static nlohmann::ordered_json ToJson(const Message& m) {
  if (!m.rest.is_object()) return m.rest;
  nlohmann::ordered_json out = m.rest;
  if (m.role) out["role"] = *m.role;
  if (auto content = TextOrBlocksToJson(m.content)) out["content"] = std::move(*content);
  return out;
}

static ToolDescriptor ParseToolDescriptor(const nlohmann::ordered_json& j) {
  ToolDescriptor t;
  t.rest = j;
  if (!j.is_object()) return t;
  if (j.contains("name") && j["name"].is_string()) t.name = j["name"].get<std::string>();
  if (j.contains("type") && j["type"].is_string()) t.type = j["type"].get<std::string>();
  return t;
}

static nlohmann::ordered_json ToJson(const ToolDescriptor& t) {
  if (!t.rest.is_object()) return t.rest;
  nlohmann::ordered_json out = t.rest;
  if (t.name) out["name"] = *t.name;
  if (t.type) out["type"] = *t.type;
  return out;
}

}  // namespace

ContentBlock ParseContentBlock(const nlohmann::ordered_json& j) {
  if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
    return ContentBlock(std::in_place_type<nlohmann::ordered_json>, j);
  }
  const auto type = j["type"].get<std::string>();
  if (type == "text" && j.contains("text") && j["text"].is_string()) {
    TextBlock b;
    b.text = j["text"].get<std::string>();
    b.rest = j;
    return ContentBlock(std::in_place_type<TextBlock>, std::move(b));
  }
  if (type == "tool_use") {
    ToolUseBlock b;
    b.rest = j;
    if (j.contains("name") && j["name"].is_string()) b.name = j["name"].get<std::string>();
    if (j.contains("input")) b.input = j["input"];
    return ContentBlock(std::in_place_type<ToolUseBlock>, std::move(b));
  }
  return ContentBlock(std::in_place_type<nlohmann::ordered_json>, j);
}

nlohmann::ordered_json ToJson(const ContentBlock& block) {
  if (const auto* text = std::get_if<TextBlock>(&block)) {
    nlohmann::ordered_json typed = nlohmann::ordered_json::object();
    typed["type"] = "text";
    typed["text"] = text->text;
    return MergeBlockFields(text->rest, typed);
  }
  if (const auto* tool = std::get_if<ToolUseBlock>(&block)) {
    nlohmann::ordered_json typed = nlohmann::ordered_json::object();
    typed["type"] = "tool_use";
    if (tool->name) typed["name"] = *tool->name;
    if (tool->input) typed["input"] = *tool->input;
    return MergeBlockFields(tool->rest, typed);
  }
  return std::get<nlohmann::ordered_json>(block);
}

std::optional<RequestEnvelope> ParseRequestEnvelope(const nlohmann::ordered_json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "request body is not a json object";
    return std::nullopt;
  }
  RequestEnvelope req;
  req.rest = j;

  if (j.contains("model") && j["model"].is_string()) req.model = j["model"].get<std::string>();
  if (j.contains("system") && IsTextOrBlocks(j["system"])) req.system = ParseTextOrBlocks(j["system"]);
  if (j.contains("messages") && j["messages"].is_array()) {
    std::vector<Message> messages;
    messages.reserve(j["messages"].size());
    for (const auto& m : j["messages"]) messages.push_back(ParseMessage(m));
    req.messages = std::move(messages);
  }
  if (j.contains("tools") && j["tools"].is_array()) {
    std::vector<ToolDescriptor> tools;
    tools.reserve(j["tools"].size());
    for (const auto& t : j["tools"]) tools.push_back(ParseToolDescriptor(t));
    req.tools = std::move(tools);
  }
  if (j.contains("thinking")) req.thinking = j["thinking"];
  if (j.contains("max_tokens") && j["max_tokens"].is_number()) req.max_tokens = j["max_tokens"];
  if (j.contains("stream") && j["stream"].is_boolean()) req.stream = j["stream"].get<bool>();
  return req;
}

nlohmann::ordered_json ToJson(const RequestEnvelope& req) {
  nlohmann::ordered_json out = ObjectOrEmpty(req.rest);
  if (req.model) out["model"] = *req.model;
  if (auto system = TextOrBlocksToJson(req.system)) out["system"] = std::move(*system);
  if (req.messages) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& m : *req.messages) arr.push_back(ToJson(m));
    out["messages"] = std::move(arr);
  }
  if (req.tools) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& t : *req.tools) arr.push_back(ToJson(t));
    out["tools"] = std::move(arr);
  }
  if (req.thinking) out["thinking"] = *req.thinking;
  if (req.max_tokens) out["max_tokens"] = *req.max_tokens;
  if (req.stream) out["stream"] = *req.stream;
  return out;
}

bool StreamRequested(const RequestEnvelope& req) {
  if (req.stream) return *req.stream;
  if (req.rest.is_object() && req.rest.contains("stream")) return IsTruthy(req.rest["stream"]);
  return false;
}

std::optional<ResponseEnvelope> ParseResponseEnvelope(const nlohmann::ordered_json& j) {
  if (!j.is_object()) return std::nullopt;
  ResponseEnvelope resp;
  resp.rest = j;
  if (j.contains("content") && j["content"].is_array()) {
    std::vector<ContentBlock> blocks;
    blocks.reserve(j["content"].size());
    for (const auto& b : j["content"]) blocks.push_back(ParseContentBlock(b));
    resp.content = std::move(blocks);
  }
  return resp;
}

nlohmann::ordered_json ToJson(const ResponseEnvelope& resp) {
  nlohmann::ordered_json out = ObjectOrEmpty(resp.rest);
  if (resp.content) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& b : *resp.content) arr.push_back(ToJson(b));
    out["content"] = std::move(arr);
  }
  return out;
}

}  // namespace relay
