#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace relay {

// Rewrites one SSE line. Only `data:` lines carrying a content_block_start
// event for a named tool_use block change: the block name is normalized and
// the line re-serialized. Everything else, including `[DONE]` and payloads
// that are not JSON, is returned untouched.
std::string RewriteSseLine(const std::string& line);

// Applies RewriteSseLine to every '\n'-separated line of one event body.
std::string RewriteSseEvent(const std::string& event);

// Incremental SSE rewriter. Bytes arrive in arbitrary chunks; every complete
// event (terminated by a blank line) is rewritten and handed to the sink with
// its "\n\n" terminator, in arrival order. Output does not depend on how the
// input was split into chunks.
class SseStreamRelay {
 public:
  // Returning false from the sink stops the relay; later calls are no-ops.
  using EventSink = std::function<bool(const std::string& event)>;

  explicit SseStreamRelay(EventSink sink);

  bool Feed(const char* data, size_t size);
  bool Feed(const std::string& chunk) { return Feed(chunk.data(), chunk.size()); }

  // Flushes a trailing event that never saw its blank-line terminator.
  bool Finish();

  size_t BufferedBytes() const { return buffer_.size(); }
  size_t EventsForwarded() const { return events_forwarded_; }

 private:
  bool Emit(const std::string& event_body);

  EventSink sink_;
  std::string buffer_;
  size_t scan_from_ = 0;
  size_t events_forwarded_ = 0;
  bool stopped_ = false;
};

}  // namespace relay
