#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

#include "streamagent/core/config.hpp"
#include "streamagent/llm/chunk_decoder.hpp"
#include "streamagent/llm/transport.hpp"

namespace streamagent::llm {

// Exponential backoff without jitter
struct RetryPolicy {
  int max_retries = 3;
  std::chrono::milliseconds base_delay{1000};

  // Wait before attempt `attempt + 1` (0-indexed): base_delay * 2^attempt
  std::chrono::milliseconds delay_for(int attempt) const;

  static RetryPolicy from_config(const RetryConfig& config);
};

// Blocks for the given duration. Injected by tests to record waits.
using DelayFunction = std::function<void(std::chrono::milliseconds)>;

// Message prefix naming the failure class
std::string describe_failure(const TransportFailure& failure);

// Runs one completion request through a Transport, retrying transient
// failures, and presents the caller a single clean event sequence with
// exactly one terminal event.
class ResilientClient {
 public:
  explicit ResilientClient(std::shared_ptr<Transport> transport, RetryPolicy policy = {}, DelayFunction delay = nullptr);

  // Blocks until the terminal event has been emitted
  void run(const ChatRequest& request, const StreamCallback& emit);

  // Abort the running request and any backoff wait. The cancel sticks,
  // so a run() that has not started yet returns without an attempt.
  void cancel();

  // Clear a previous cancel
  void reset();

  void close();

  // Attempts made by the last run()
  int attempts() const {
    return attempts_;
  }

  const RetryPolicy& policy() const {
    return policy_;
  }

  Transport& transport() {
    return *transport_;
  }

 private:
  // Returns false when cancelled during the wait
  bool wait(std::chrono::milliseconds delay);

  bool cancelled() const;

  std::shared_ptr<Transport> transport_;
  RetryPolicy policy_;
  DelayFunction delay_;

  std::atomic<int> attempts_{0};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

}  // namespace streamagent::llm
