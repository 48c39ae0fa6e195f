#include "openai.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "net/sse_parser.hpp"
#include "streamagent/llm/chunk_decoder.hpp"

namespace streamagent::llm {

std::optional<TokenUsage> usage_from_openai(const json& usage) {
  if (!usage.is_object()) {
    return std::nullopt;
  }

  TokenUsage result;
  result.prompt_tokens = usage.value("prompt_tokens", int64_t{0});
  result.completion_tokens = usage.value("completion_tokens", int64_t{0});
  result.total_tokens = usage.value("total_tokens", result.prompt_tokens + result.completion_tokens);
  // OpenAI may include cached tokens in newer API versions
  if (usage.contains("prompt_tokens_details") && usage["prompt_tokens_details"].is_object()) {
    result.cached_tokens = usage["prompt_tokens_details"].value("cached_tokens", int64_t{0});
  }
  return result;
}

RawChunk chunk_from_openai(const json& j) {
  RawChunk chunk;

  // Usage info (sent as final chunk with stream_options)
  if (j.contains("usage")) {
    chunk.usage = usage_from_openai(j["usage"]);
  }

  if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
    return chunk;
  }

  const auto& choice = j["choices"][0];
  if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    chunk.finish_reason = finish_reason_from_string(choice["finish_reason"].get<std::string>());
  }

  if (!choice.contains("delta") || !choice["delta"].is_object()) {
    return chunk;
  }
  const auto& delta = choice["delta"];

  if (delta.contains("content") && delta["content"].is_string()) {
    chunk.text = delta["content"].get<std::string>();
  }

  if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
    for (const auto& tc : delta["tool_calls"]) {
      ToolCallChunk piece;
      piece.index = tc.value("index", 0);
      if (tc.contains("id") && tc["id"].is_string()) {
        piece.id = tc["id"].get<std::string>();
      }
      if (tc.contains("function") && tc["function"].is_object()) {
        const auto& fn = tc["function"];
        if (fn.contains("name") && fn["name"].is_string()) {
          piece.name = fn["name"].get<std::string>();
        }
        if (fn.contains("arguments") && fn["arguments"].is_string()) {
          piece.arguments = fn["arguments"].get<std::string>();
        }
      }
      chunk.tool_calls.push_back(std::move(piece));
    }
  }

  return chunk;
}

ChatCompletion completion_from_openai(const json& j) {
  if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
    throw std::runtime_error("Response contains no choices");
  }

  ChatCompletion completion;
  const auto& choice = j["choices"][0];

  if (choice.contains("message") && choice["message"].is_object()) {
    const auto& message = choice["message"];

    if (message.contains("content") && message["content"].is_string()) {
      completion.text = message["content"].get<std::string>();
    }

    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
      int index = 0;
      for (const auto& tc : message["tool_calls"]) {
        ToolCallRequest call;
        if (tc.contains("id") && tc["id"].is_string()) {
          call.call_id = tc["id"].get<std::string>();
        }
        if (call.call_id.empty()) {
          call.call_id = "call_" + std::to_string(index);
        }
        if (tc.contains("function") && tc["function"].is_object()) {
          const auto& fn = tc["function"];
          if (fn.contains("name") && fn["name"].is_string()) {
            call.name = fn["name"].get<std::string>();
          }
          if (fn.contains("arguments") && fn["arguments"].is_string()) {
            call.arguments = parse_tool_arguments(fn["arguments"].get<std::string>());
          } else if (fn.contains("arguments") && fn["arguments"].is_object()) {
            call.arguments = fn["arguments"];
          }
        }
        completion.tool_calls.push_back(std::move(call));
        ++index;
      }
    }
  }

  if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    completion.finish_reason = finish_reason_from_string(choice["finish_reason"].get<std::string>());
  }

  if (j.contains("usage")) {
    completion.usage = usage_from_openai(j["usage"]);
  }

  return completion;
}

namespace {

bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
  for (const char* needle : needles) {
    if (text.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

// Prefer the API's own error message over the raw body
std::string api_error_message(int status_code, const std::string& error) {
  auto brace = error.find('{');
  if (brace == std::string::npos) {
    return error;
  }

  auto body = json::parse(error.substr(brace), nullptr, false);
  if (!body.is_discarded() && body.contains("error")) {
    const auto& err = body["error"];
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
      return "HTTP " + std::to_string(status_code) + ": " + err["message"].get<std::string>();
    }
    if (err.is_string()) {
      return "HTTP " + std::to_string(status_code) + ": " + err.get<std::string>();
    }
  }
  return error;
}

std::string in_stream_error_message(const json& error) {
  if (error.is_object() && error.contains("message") && error["message"].is_string()) {
    return error["message"].get<std::string>();
  }
  if (error.is_string()) {
    return error.get<std::string>();
  }
  return error.dump();
}

}  // namespace

TransportFailure classify_failure(int status_code, const std::string& error) {
  TransportFailure failure;
  failure.status_code = status_code;

  // No response at all, a timeout, or a connection broken mid-body
  if (status_code == 0 || (status_code >= 200 && status_code < 300)) {
    failure.kind = TransportErrorKind::Connectivity;
    failure.message = error;
    return failure;
  }

  failure.message = api_error_message(status_code, error);

  if (status_code == 429) {
    // Quota exhaustion will not recover by waiting
    if (contains_any(error, {"insufficient_quota", "quota_exceeded", "billing"})) {
      failure.kind = TransportErrorKind::Fatal;
    } else {
      failure.kind = TransportErrorKind::RateLimited;
    }
    return failure;
  }

  failure.kind = TransportErrorKind::Fatal;
  return failure;
}

OpenAITransport::OpenAITransport(ProviderConfig config, std::chrono::seconds timeout) : config_(std::move(config)), timeout_(timeout) {}

OpenAITransport::~OpenAITransport() {
  close();
}

std::string OpenAITransport::endpoint() const {
  std::string base = config_.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/chat/completions";
}

bool OpenAITransport::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return io_ctx_ != nullptr;
}

net::HttpClient& OpenAITransport::session() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!io_ctx_) {
    io_ctx_ = std::make_unique<asio::io_context>();
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(asio::make_work_guard(*io_ctx_));
    io_thread_ = std::thread([ctx = io_ctx_.get()]() {
      ctx->run();
    });
    http_client_ = std::make_unique<net::HttpClient>(*io_ctx_);
    spdlog::debug("{} transport session opened", config_.name);
  }
  return *http_client_;
}

void OpenAITransport::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!io_ctx_) {
    return;
  }

  http_client_->cancel();
  work_guard_.reset();
  io_ctx_->stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  http_client_.reset();
  io_ctx_.reset();
  spdlog::debug("{} transport session closed", config_.name);
}

void OpenAITransport::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (http_client_) {
    http_client_->cancel();
  }
}

net::HttpOptions OpenAITransport::make_options(const ChatRequest& request) const {
  net::HttpOptions options;
  options.method = "POST";
  options.body = request.to_openai_format().dump();
  options.timeout = timeout_;
  options.headers = {{"Content-Type", "application/json"}};

  if (!config_.api_key.empty()) {
    options.headers["Authorization"] = "Bearer " + config_.api_key;
  }

  if (request.stream) {
    options.headers["Accept"] = "text/event-stream";
  }

  // Add organization header if configured
  if (config_.organization && !config_.organization->empty()) {
    options.headers["OpenAI-Organization"] = *config_.organization;
  }

  // Add any custom headers
  for (const auto& [key, value] : config_.headers) {
    options.headers[key] = value;
  }

  return options;
}

std::optional<TransportFailure> OpenAITransport::stream(const ChatRequest& request, const ChunkCallback& on_chunk) {
  if (!net::ParsedUrl::parse(endpoint())) {
    return TransportFailure{TransportErrorKind::Fatal, "Invalid URL: " + endpoint(), 0};
  }

  ChatRequest streaming = request;
  streaming.stream = true;
  auto options = make_options(streaming);

  spdlog::debug("{} request URL: {}", config_.name, endpoint());
  spdlog::trace("{} request body: {}", config_.name, options.body);

  auto& client = session();

  // Touched only on the I/O thread
  struct StreamState {
    net::SseParser parser;
    bool done = false;
    std::optional<TransportFailure> failure;
  };
  auto state = std::make_shared<StreamState>();
  auto promise = std::make_shared<std::promise<std::optional<TransportFailure>>>();
  auto future = promise->get_future();

  auto fatal = [](std::string message) {
    return TransportFailure{TransportErrorKind::Fatal, std::move(message), 0};
  };

  client.request_stream(
      endpoint(), options,
      [state, &client, &on_chunk, fatal](const std::string& data) {
        if (state->done) return;

        for (const auto& event : state->parser.feed(data)) {
          if (event.data == "[DONE]") {
            state->done = true;
            break;
          }

          auto j = json::parse(event.data, nullptr, false);
          if (j.is_discarded()) {
            state->failure = fatal("Malformed stream payload: " + event.data);
            state->done = true;
            break;
          }

          // Handle error responses
          if (j.contains("error")) {
            state->failure = fatal(in_stream_error_message(j["error"]));
            state->done = true;
            break;
          }

          try {
            on_chunk(chunk_from_openai(j));
          } catch (const std::exception& e) {
            state->failure = fatal(std::string("Stream handling failed: ") + e.what());
            state->done = true;
            break;
          }
        }

        // Nothing after [DONE] or a failure matters
        if (state->done) {
          client.cancel();
        }
      },
      [state, promise](int status_code, const std::string& error) {
        if (state->failure) {
          promise->set_value(state->failure);
        } else if (state->done || error.empty()) {
          promise->set_value(std::nullopt);
        } else {
          promise->set_value(classify_failure(status_code, error));
        }
      });

  return future.get();
}

CompletionResponse OpenAITransport::complete(const ChatRequest& request) {
  CompletionResponse result;
  if (!net::ParsedUrl::parse(endpoint())) {
    result.failure = TransportFailure{TransportErrorKind::Fatal, "Invalid URL: " + endpoint(), 0};
    return result;
  }

  ChatRequest buffered = request;
  buffered.stream = false;
  auto options = make_options(buffered);

  spdlog::debug("{} request URL: {}", config_.name, endpoint());
  spdlog::trace("{} request body: {}", config_.name, options.body);

  auto response = session().request(endpoint(), options).get();

  if (!response.ok()) {
    std::string error = response.error;
    if (error.empty()) {
      error = "HTTP error " + std::to_string(response.status_code) + ": " + response.body;
    }
    result.failure = classify_failure(response.status_code, error);
    return result;
  }

  try {
    auto j = json::parse(response.body);
    if (j.contains("error")) {
      result.failure = TransportFailure{TransportErrorKind::Fatal, in_stream_error_message(j["error"]), response.status_code};
      return result;
    }
    result.completion = completion_from_openai(j);
  } catch (const std::exception& e) {
    result.failure = TransportFailure{TransportErrorKind::Fatal, std::string("Parse error: ") + e.what(), response.status_code};
  }

  return result;
}

}  // namespace streamagent::llm
