#include "stream_channel.hpp"

#include <utility>

namespace relay {

StreamChannel::StreamChannel(size_t capacity_bytes) : capacity_bytes_(capacity_bytes > 0 ? capacity_bytes : 1) {}

bool StreamChannel::Push(std::string chunk) {
  std::unique_lock<std::mutex> lock(mu_);
  // A single oversized chunk is still accepted once the queue is empty.
  can_push_.wait(lock, [&] { return cancelled_ || closed_ || queued_bytes_ < capacity_bytes_; });
  if (cancelled_ || closed_) return false;
  queued_bytes_ += chunk.size();
  chunks_.push_back(std::move(chunk));
  can_pop_.notify_one();
  return true;
}

void StreamChannel::Close() {
  std::lock_guard<std::mutex> lock(mu_);
  closed_ = true;
  can_pop_.notify_all();
  can_push_.notify_all();
}

void StreamChannel::Fail(std::string message) {
  std::lock_guard<std::mutex> lock(mu_);
  failure_ = std::move(message);
  closed_ = true;
  can_pop_.notify_all();
  can_push_.notify_all();
}

void StreamChannel::Cancel() {
  std::lock_guard<std::mutex> lock(mu_);
  cancelled_ = true;
  chunks_.clear();
  queued_bytes_ = 0;
  can_pop_.notify_all();
  can_push_.notify_all();
}

std::optional<std::string> StreamChannel::Pop() {
  std::unique_lock<std::mutex> lock(mu_);
  can_pop_.wait(lock, [&] { return cancelled_ || closed_ || !chunks_.empty(); });
  if (cancelled_ || chunks_.empty()) return std::nullopt;
  std::string chunk = std::move(chunks_.front());
  chunks_.pop_front();
  queued_bytes_ -= chunk.size();
  can_push_.notify_one();
  return chunk;
}

bool StreamChannel::Cancelled() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cancelled_;
}

std::optional<std::string> StreamChannel::Failure() const {
  std::lock_guard<std::mutex> lock(mu_);
  return failure_;
}

size_t StreamChannel::QueuedBytes() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queued_bytes_;
}

}  // namespace relay
