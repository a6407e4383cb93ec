#include "stream_relay.hpp"

#include "tool_names.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace relay {
namespace {

constexpr const char* kDataPrefix = "data:";
constexpr size_t kDataPrefixLen = 5;
constexpr const char* kEventDelimiter = "\n\n";
constexpr const char* kDoneSentinel = "[DONE]";

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string TrimAscii(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\r' || s[start] == '\n')) start++;
  size_t end = s.size();
  while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r' || s[end - 1] == '\n')) end--;
  return s.substr(start, end - start);
}

}  // namespace

std::string RewriteSseLine(const std::string& line) {
  if (!StartsWith(line, kDataPrefix)) return line;

  const auto payload = TrimAscii(line.substr(kDataPrefixLen));
  if (payload.empty() || payload == kDoneSentinel) return line;

  // ordered_json keeps the upstream's member order when re-serializing.
  auto event = nlohmann::ordered_json::parse(payload, nullptr, false);
  if (event.is_discarded() || !event.is_object()) return line;

  if (!event.contains("type") || event["type"] != "content_block_start") return line;
  if (!event.contains("content_block") || !event["content_block"].is_object()) return line;
  auto& block = event["content_block"];
  if (!block.contains("type") || block["type"] != "tool_use") return line;
  if (!block.contains("name") || !block["name"].is_string()) return line;
  const auto name = block["name"].get<std::string>();
  if (name.empty()) return line;

  block["name"] = NormalizeToolName(name);
  return std::string("data: ") + event.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string RewriteSseEvent(const std::string& event) {
  std::string out;
  out.reserve(event.size());
  size_t pos = 0;
  while (true) {
    const auto nl = event.find('\n', pos);
    if (nl == std::string::npos) {
      out += RewriteSseLine(event.substr(pos));
      break;
    }
    out += RewriteSseLine(event.substr(pos, nl - pos));
    out += '\n';
    pos = nl + 1;
  }
  return out;
}

SseStreamRelay::SseStreamRelay(EventSink sink) : sink_(std::move(sink)) {}

bool SseStreamRelay::Emit(const std::string& event_body) {
  if (stopped_) return false;
  std::string framed = RewriteSseEvent(event_body);
  framed += kEventDelimiter;
  if (!sink_ || !sink_(framed)) {
    stopped_ = true;
    return false;
  }
  events_forwarded_++;
  return true;
}

bool SseStreamRelay::Feed(const char* data, size_t size) {
  if (stopped_) return false;
  if (size == 0) return true;
  buffer_.append(data, size);

  size_t consumed = 0;
  size_t search = scan_from_;
  while (true) {
    const auto delim = buffer_.find(kEventDelimiter, search);
    if (delim == std::string::npos) break;
    if (!Emit(buffer_.substr(consumed, delim - consumed))) return false;
    consumed = delim + 2;
    search = consumed;
  }
  buffer_.erase(0, consumed);
  // A delimiter may straddle the next chunk boundary by one byte.
  scan_from_ = buffer_.empty() ? 0 : buffer_.size() - 1;
  return true;
}

bool SseStreamRelay::Finish() {
  if (stopped_) return false;
  std::string rest;
  rest.swap(buffer_);
  scan_from_ = 0;
  if (TrimAscii(rest).empty()) return true;
  return Emit(rest);
}

}  // namespace relay
