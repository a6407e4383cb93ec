#include "transform_pipeline.hpp"

#include "field_sanitizer.hpp"
#include "request_augmenter.hpp"
#include "response_repairer.hpp"
#include "tool_names.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace relay {
namespace {

static std::string DumpJson(const nlohmann::ordered_json& j) {
  return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

}  // namespace

bool IsMessagesPath(const std::string& path) {
  return path.find("/v1/messages") != std::string::npos;
}

RequestEnvelope TransformRequest(RequestEnvelope req) {
  req = NormalizeRequestToolNames(std::move(req));
  req = SubstituteSystemPrompt(std::move(req));
  req = InjectReasoningMode(std::move(req));
  return req;
}

std::optional<PreparedRequest> TransformRequestBody(const std::string& raw, std::string* err) {
  auto j = nlohmann::ordered_json::parse(raw, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "invalid json body";
    return std::nullopt;
  }

  auto envelope = ParseRequestEnvelope(StripUndefinedSentinels(j), err);
  if (!envelope) return std::nullopt;

  auto transformed = TransformRequest(std::move(*envelope));

  PreparedRequest out;
  out.stream = StreamRequested(transformed);
  out.model = transformed.model.value_or("");
  out.body = DumpJson(ToJson(transformed));
  return out;
}

std::string RepairResponseBody(const std::string& raw) {
  if (raw.empty()) return raw;
  auto j = nlohmann::ordered_json::parse(raw, nullptr, false);
  if (j.is_discarded()) return raw;
  auto envelope = ParseResponseEnvelope(j);
  if (!envelope) return raw;
  return DumpJson(ToJson(RepairToolUseInputs(std::move(*envelope))));
}

}  // namespace relay
