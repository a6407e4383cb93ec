#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relay {

// `rest` holds each object as received. Serialization writes the typed fields
// back over it, so every member keeps its original position and members the
// typed fields do not cover survive unchanged. A `rest` that is not an object
// holds an element of unexpected shape, which is emitted as-is.

struct TextBlock {
  std::string text;
  nlohmann::ordered_json rest = nlohmann::ordered_json::object();
};

struct ToolUseBlock {
  std::optional<std::string> name;
  std::optional<nlohmann::ordered_json> input;
  nlohmann::ordered_json rest = nlohmann::ordered_json::object();
};

using ContentBlock = std::variant<TextBlock, ToolUseBlock, nlohmann::ordered_json>;

struct NoContent {};

using SystemPrompt = std::variant<NoContent, std::string, std::vector<ContentBlock>>;
using MessageContent = std::variant<NoContent, std::string, std::vector<ContentBlock>>;

struct Message {
  std::optional<std::string> role;
  MessageContent content;
  nlohmann::ordered_json rest = nlohmann::ordered_json::object();
};

struct ToolDescriptor {
  std::optional<std::string> name;
  std::optional<std::string> type;
  nlohmann::ordered_json rest = nlohmann::ordered_json::object();
};

struct RequestEnvelope {
  std::optional<std::string> model;
  SystemPrompt system;
  std::optional<std::vector<Message>> messages;
  std::optional<std::vector<ToolDescriptor>> tools;
  std::optional<nlohmann::ordered_json> thinking;
  // Any JSON number; integer, unsigned and floating values are all kept.
  std::optional<nlohmann::ordered_json> max_tokens;
  // Set only for a boolean `stream`; other values stay in rest.
  std::optional<bool> stream;
  nlohmann::ordered_json rest = nlohmann::ordered_json::object();
};

struct ResponseEnvelope {
  std::optional<std::vector<ContentBlock>> content;
  nlohmann::ordered_json rest = nlohmann::ordered_json::object();
};

ContentBlock ParseContentBlock(const nlohmann::ordered_json& j);
nlohmann::ordered_json ToJson(const ContentBlock& block);

std::optional<RequestEnvelope> ParseRequestEnvelope(const nlohmann::ordered_json& j, std::string* err);
nlohmann::ordered_json ToJson(const RequestEnvelope& req);

// True when the client asked for a streamed reply. A non-boolean `stream`
// counts when it is truthy: non-zero numbers, non-empty strings, objects and
// arrays.
bool StreamRequested(const RequestEnvelope& req);

std::optional<ResponseEnvelope> ParseResponseEnvelope(const nlohmann::ordered_json& j);
nlohmann::ordered_json ToJson(const ResponseEnvelope& resp);

}  // namespace relay
