#include "field_sanitizer.hpp"

#include <string>

namespace relay {
namespace {

static bool IsSentinel(const nlohmann::ordered_json& v) {
  return v.is_string() && v.get_ref<const std::string&>() == kUndefinedSentinel;
}

}  // namespace

nlohmann::ordered_json StripUndefinedSentinels(const nlohmann::ordered_json& value) {
  if (value.is_array()) {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto& item : value) {
      if (IsSentinel(item)) continue;
      out.push_back(StripUndefinedSentinels(item));
    }
    return out;
  }
  if (value.is_object()) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
      if (IsSentinel(it.value())) continue;
      out[it.key()] = StripUndefinedSentinels(it.value());
    }
    return out;
  }
  return value;
}

}  // namespace relay
