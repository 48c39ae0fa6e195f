#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

#include "net/http_client.hpp"
#include "streamagent/core/config.hpp"
#include "streamagent/llm/transport.hpp"

namespace streamagent::llm {

// ---------------------------------------------------------------------------
// Wire adapter: OpenAI chat-completions JSON <-> normalized types
// ---------------------------------------------------------------------------

std::optional<TokenUsage> usage_from_openai(const json& usage);

// One `chat.completion.chunk` payload
RawChunk chunk_from_openai(const json& j);

// A non-streaming `chat.completion` body. Throws std::runtime_error when the
// body carries no choices.
ChatCompletion completion_from_openai(const json& j);

// Classify a failed HTTP exchange. status_code is 0 when no response arrived.
TransportFailure classify_failure(int status_code, const std::string& error);

// OpenAI-compatible transport (also works with API-compatible services).
// Owns its I/O session: io_context, work guard, I/O thread and HttpClient,
// opened on the first request and released by close().
class OpenAITransport : public Transport {
 public:
  explicit OpenAITransport(ProviderConfig config, std::chrono::seconds timeout = std::chrono::seconds(120));

  ~OpenAITransport() override;

  std::string name() const override {
    return config_.name;
  }

  std::optional<TransportFailure> stream(const ChatRequest& request, const ChunkCallback& on_chunk) override;

  CompletionResponse complete(const ChatRequest& request) override;

  void cancel() override;

  void close() override;

  std::string endpoint() const;

  bool is_open() const;

 private:
  net::HttpClient& session();

  net::HttpOptions make_options(const ChatRequest& request) const;

  ProviderConfig config_;
  std::chrono::seconds timeout_;

  mutable std::mutex mutex_;
  std::unique_ptr<asio::io_context> io_ctx_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread io_thread_;
  std::unique_ptr<net::HttpClient> http_client_;
};

}  // namespace streamagent::llm
