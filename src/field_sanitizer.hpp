#pragma once

#include <nlohmann/json.hpp>

namespace relay {

// Placeholder some clients serialize in place of an undefined value.
inline constexpr const char* kUndefinedSentinel = "[undefined]";

// Returns a copy of `value` with every array element and object member equal
// to the sentinel string removed, at any depth. Scalars come back unchanged.
nlohmann::ordered_json StripUndefinedSentinels(const nlohmann::ordered_json& value);

}  // namespace relay
