#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace relay {

// Bounded byte queue between the thread reading the upstream response and the
// thread writing to the client. Push blocks while more than `capacity_bytes`
// are queued, so a slow client stalls the upstream read instead of growing
// memory.
class StreamChannel {
 public:
  explicit StreamChannel(size_t capacity_bytes);

  // Returns false once the consumer cancelled; the producer should stop.
  bool Push(std::string chunk);

  // Producer side: normal end of body.
  void Close();
  // Producer side: the transfer failed after it started.
  void Fail(std::string message);
  // Consumer side: the client went away.
  void Cancel();

  // Blocks until a chunk is available. Returns nullopt once the channel is
  // drained and closed, failed or cancelled.
  std::optional<std::string> Pop();

  bool Cancelled() const;
  std::optional<std::string> Failure() const;
  size_t QueuedBytes() const;

 private:
  const size_t capacity_bytes_;
  mutable std::mutex mu_;
  std::condition_variable can_push_;
  std::condition_variable can_pop_;
  std::deque<std::string> chunks_;
  size_t queued_bytes_ = 0;
  bool closed_ = false;
  bool cancelled_ = false;
  std::optional<std::string> failure_;
};

}  // namespace relay
