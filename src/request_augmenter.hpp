#pragma once

#include "request_model.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace relay {

inline constexpr int64_t kDefaultThinkingBudget = 10000;
inline constexpr int64_t kThinkingMaxTokensMargin = 4096;

// The two cache-flagged text segments the upstream requires as `system`.
const std::vector<ContentBlock>& CanonicalSystemPrompt();

// Plain text as-is; segment lists contribute the non-empty text of their
// text segments joined by a blank line.
std::string FlattenSystemPrompt(const SystemPrompt& system);

// Wraps relocated client instructions so they read as a distinct preamble.
std::string WrapSystemInstructions(const std::string& text);

// Replaces `system` with the canonical prompt and moves the client's own
// system text to the front of the first user message. When there is no user
// message the client text is dropped.
RequestEnvelope SubstituteSystemPrompt(RequestEnvelope req);

enum class ReasoningFamily {
  kNone,
  kAdaptive,
  kBudgeted,
};

ReasoningFamily ClassifyReasoningModel(const std::string& model);

// Adds a `thinking` block for reasoning-capable models when the client sent
// none, raising `max_tokens` above the budget where the upstream needs it.
RequestEnvelope InjectReasoningMode(RequestEnvelope req);

}  // namespace relay
