#include "streamagent/llm/resilient_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace streamagent::llm {

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
  return base_delay * (int64_t{1} << attempt);
}

RetryPolicy RetryPolicy::from_config(const RetryConfig& config) {
  RetryPolicy policy;
  policy.max_retries = std::max(0, config.max_retries);
  policy.base_delay = std::chrono::milliseconds(std::max<int64_t>(0, config.base_delay_ms));
  return policy;
}

std::string describe_failure(const TransportFailure& failure) {
  switch (failure.kind) {
    case TransportErrorKind::RateLimited:
      return "Rate limit exceeded: " + failure.message;
    case TransportErrorKind::Connectivity:
      return "Connection error: " + failure.message;
    case TransportErrorKind::Fatal:
      break;
  }
  return "API error: " + failure.message;
}

ResilientClient::ResilientClient(std::shared_ptr<Transport> transport, RetryPolicy policy, DelayFunction delay)
    : transport_(std::move(transport)), policy_(policy), delay_(std::move(delay)) {}

void ResilientClient::run(const ChatRequest& request, const StreamCallback& emit) {
  attempts_ = 0;

  const int max_attempts = policy_.max_retries + 1;
  TransportFailure last_failure;

  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    if (cancelled()) {
      spdlog::debug("{} request cancelled before attempt {}", transport_->name(), attempt + 1);
      ChunkDecoder decoder;
      decoder.fail(TransportError{"Request cancelled", TransportErrorKind::Fatal}, emit);
      return;
    }
    attempts_ = attempt + 1;

    // Fresh decoder per attempt: nothing of a failed attempt carries over
    ChunkDecoder decoder;
    bool live = false;
    auto tracked = [&](const StreamEvent& event) {
      live = true;
      emit(event);
    };

    std::optional<TransportFailure> failure;
    if (request.stream) {
      failure = transport_->stream(request, [&](const RawChunk& chunk) {
        decoder.feed(chunk, tracked);
      });
      if (!failure) {
        decoder.finish(tracked);
        return;
      }
    } else {
      auto response = transport_->complete(request);
      if (response.ok()) {
        ChunkDecoder::replay(response.completion, tracked);
        return;
      }
      failure = response.failure;
    }

    if (cancelled()) {
      spdlog::debug("{} request cancelled", transport_->name());
      decoder.fail(TransportError{"Request cancelled", TransportErrorKind::Fatal}, emit);
      return;
    }

    if (!failure->retryable()) {
      spdlog::error("{} request failed: {} (status {})", transport_->name(), failure->message, failure->status_code);
      decoder.fail(TransportError{describe_failure(*failure), failure->kind}, emit);
      return;
    }

    if (live) {
      // Retrying now would repeat output the caller has already seen
      spdlog::error("{} stream interrupted after output: {}", transport_->name(), failure->message);
      decoder.fail(TransportError{describe_failure(*failure), failure->kind}, emit);
      return;
    }

    last_failure = *failure;
    if (attempt + 1 >= max_attempts) {
      break;
    }

    auto delay = policy_.delay_for(attempt);
    spdlog::warn("{} request failed ({}: {}), retrying {}/{} in {}ms", transport_->name(), to_string(failure->kind), failure->message,
                 attempt + 1, policy_.max_retries, delay.count());
    if (!wait(delay)) {
      decoder.fail(TransportError{"Request cancelled", TransportErrorKind::Fatal}, emit);
      return;
    }
  }

  spdlog::error("{} request failed after {} attempts: {}", transport_->name(), attempts_.load(), last_failure.message);
  ChunkDecoder decoder;
  decoder.fail(TransportError{describe_failure(last_failure), last_failure.kind}, emit);
}

bool ResilientClient::wait(std::chrono::milliseconds delay) {
  if (delay_) {
    delay_(delay);
    return !cancelled();
  }

  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, delay, [this] {
    return cancelled_;
  });
  return !cancelled_;
}

bool ResilientClient::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

void ResilientClient::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
  transport_->cancel();
}

void ResilientClient::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = false;
}

void ResilientClient::close() {
  transport_->close();
}

}  // namespace streamagent::llm
