#pragma once

#include "request_model.hpp"

#include <optional>
#include <string>

namespace relay {

struct PreparedRequest {
  std::string body;
  bool stream = false;
  std::string model;
};

// Only Messages API calls have their bodies rewritten.
bool IsMessagesPath(const std::string& path);

// sanitize -> tool names -> system prompt -> reasoning mode, on typed values.
RequestEnvelope TransformRequest(RequestEnvelope req);

// Full request-side pass over raw body bytes. Fails only when the body is not
// a JSON object.
std::optional<PreparedRequest> TransformRequestBody(const std::string& raw, std::string* err);

// Non-streaming response repair over raw body bytes. Bodies that are not a
// JSON object are returned unchanged.
std::string RepairResponseBody(const std::string& raw);

}  // namespace relay
