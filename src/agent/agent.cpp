#include "streamagent/agent/agent.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <type_traits>

#include "llm/openai.hpp"
#include "streamagent/tool/builtin/builtins.hpp"

namespace streamagent {

std::string to_string(AgentState state) {
  switch (state) {
    case AgentState::Idle:
      return "idle";
    case AgentState::Streaming:
      return "streaming";
    case AgentState::AwaitingToolExecution:
      return "awaiting_tool_execution";
    case AgentState::Finishing:
      return "finishing";
    case AgentState::Done:
      return "done";
  }
  return "unknown";
}

namespace {

// Runs the given cleanup when the turn returns
class TurnGuard {
 public:
  explicit TurnGuard(std::function<void()> on_exit) : on_exit_(std::move(on_exit)) {}
  ~TurnGuard() {
    on_exit_();
  }

  TurnGuard(const TurnGuard&) = delete;
  TurnGuard& operator=(const TurnGuard&) = delete;

 private:
  std::function<void()> on_exit_;
};

}  // namespace

std::shared_ptr<Agent> Agent::create(const Config& config) {
  auto transport = std::make_shared<llm::OpenAITransport>(config.provider, std::chrono::seconds(config.request_timeout_seconds));

  auto registry = std::make_shared<ToolRegistry>();
  registry->set_truncate_limits(config.truncate.max_lines, config.truncate.max_bytes);
  tools::register_builtins(*registry);

  return create(config, std::move(transport), std::move(registry));
}

std::shared_ptr<Agent> Agent::create(const Config& config, std::shared_ptr<llm::Transport> transport, std::shared_ptr<ToolExecutor> tools,
                                     llm::DelayFunction delay) {
  return std::shared_ptr<Agent>(new Agent(config, std::move(transport), std::move(tools), std::move(delay)));
}

Agent::Agent(const Config& config, std::shared_ptr<llm::Transport> transport, std::shared_ptr<ToolExecutor> tools, llm::DelayFunction delay)
    : config_(config),
      context_(config.system_prompt),
      tools_(std::move(tools)),
      client_(std::move(transport), llm::RetryPolicy::from_config(config.retry), std::move(delay)),
      abort_signal_(std::make_shared<std::atomic<bool>>(false)) {}

Agent::~Agent() {
  cancel();
  client_.close();
}

TokenUsage Agent::total_usage() const {
  std::lock_guard<std::mutex> lock(usage_mutex_);
  return total_usage_;
}

void Agent::cancel() {
  std::lock_guard<std::mutex> lock(turn_mutex_);
  if (!running_.load()) {
    return;
  }
  spdlog::debug("[Agent] Turn cancelled");
  abort_signal_->store(true);
  client_.cancel();
}

bool Agent::emit(const EventCallback& on_event, const AgentEvent& event) {
  if (cancelled()) {
    return false;
  }
  spdlog::trace("[Agent] Event: {}", event_name(event));
  if (on_event) {
    on_event(event);
  }
  return !cancelled();
}

ToolResult Agent::invoke_tool(const ToolCallRequest& call) {
  if (!tools_) {
    return ToolResult::failure("Unknown tool: " + call.name, "", {{"tool_name", call.name}});
  }

  try {
    ToolContext ctx;
    ctx.working_dir = config_.working_dir;
    ctx.abort_signal = abort_signal_;
    return tools_->invoke(call.name, call.arguments, ctx);
  } catch (const std::exception& e) {
    spdlog::error("[Agent] Tool {} threw: {}", call.name, e.what());
    return ToolResult::failure("Error invoking tool " + call.name + ": " + e.what(), "", {{"tool_name", call.name}});
  } catch (...) {
    spdlog::error("[Agent] Tool {} threw a non-standard exception", call.name);
    return ToolResult::failure("Error invoking tool " + call.name + ": unknown exception", "", {{"tool_name", call.name}});
  }
}

void Agent::run(const std::string& input, const EventCallback& on_event) {
  bool busy;
  {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    busy = running_.load();
    running_ = true;
  }
  if (busy) {
    spdlog::warn("[Agent] Rejected turn: another turn is running");
    if (on_event) {
      on_event(TurnError{"Agent is busy"});
    }
    return;
  }

  // Cancel flags are cleared only when a turn ends, so a cancel() that
  // lands anywhere inside this turn is never lost
  TurnGuard guard([this] {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    abort_signal_->store(false);
    client_.reset();
    running_ = false;
  });

  state_ = AgentState::Idle;

  context_.append(Message::user(input));
  if (!emit(on_event, TurnStarted{input})) {
    state_ = AgentState::Done;
    return;
  }

  // Build request
  llm::ChatRequest request;
  request.model = config_.provider.model;
  request.messages = context_.snapshot();
  if (tools_) {
    request.tools = tools_->schemas();
  }
  request.stream = config_.stream;
  request.temperature = config_.temperature;
  request.max_tokens = config_.max_tokens;

  spdlog::debug("[Agent] LLM request: model={}, messages={}, tools={}, stream={}", request.model, request.messages.size(), request.tools.size(),
                request.stream);

  if (cancelled()) {
    state_ = AgentState::Done;
    return;
  }

  state_ = AgentState::Streaming;

  std::string buffer;
  std::vector<ToolCallRequest> pending;
  std::optional<TokenUsage> usage;
  std::optional<std::string> error_message;

  client_.run(request, [&](const llm::StreamEvent& event) {
    std::visit(
        [&](auto&& e) {
          using T = std::decay_t<decltype(e)>;

          if constexpr (std::is_same_v<T, llm::TextFragment>) {
            buffer += e.text;
            emit(on_event, TextDelta{e.text});
          } else if constexpr (std::is_same_v<T, llm::ToolCallStarted>) {
            spdlog::debug("[Agent] Tool call started: id={}, name={}", e.call_id, e.name);
          } else if constexpr (std::is_same_v<T, llm::ToolCallArgumentsDelta>) {
            spdlog::trace("[Agent] Tool call arguments delta: name={}, delta={}", e.name, e.delta);
          } else if constexpr (std::is_same_v<T, llm::ToolCallFinished>) {
            spdlog::debug("[Agent] Tool call complete: id={}, name={}, args={}", e.call.call_id, e.call.name, e.call.arguments.dump());
            pending.push_back(e.call);
          } else if constexpr (std::is_same_v<T, llm::MessageFinished>) {
            usage = e.usage;
            // Non-streaming responses deliver their text here
            if (e.text) {
              buffer = *e.text;
            }
            spdlog::debug("[Agent] LLM finish: reason={}", e.reason ? to_string(*e.reason) : "none");
          } else if constexpr (std::is_same_v<T, llm::TransportError>) {
            error_message = e.message;
          }
        },
        event);
  });

  if (cancelled()) {
    state_ = AgentState::Done;
    return;
  }

  if (error_message) {
    spdlog::error("[Agent] LLM stream error: {}", *error_message);
    state_ = AgentState::Done;
    emit(on_event, TurnError{*error_message});
    return;
  }

  if (usage) {
    std::lock_guard<std::mutex> lock(usage_mutex_);
    total_usage_ += *usage;
  }

  std::optional<std::string> final_text;
  if (!buffer.empty()) {
    final_text = buffer;
    if (!emit(on_event, TextFinished{buffer})) {
      state_ = AgentState::Done;
      return;
    }
  }

  auto assistant = Message::assistant(buffer, pending);

  if (pending.empty()) {
    context_.append(std::move(assistant));
  } else {
    state_ = AgentState::AwaitingToolExecution;

    // Tool messages are recorded only once the whole batch has completed
    std::vector<Message> tool_messages;
    tool_messages.reserve(pending.size());

    for (const auto& call : pending) {
      if (!emit(on_event, ToolInvocationStarted{call.call_id, call.name, call.arguments})) {
        state_ = AgentState::Done;
        return;
      }

      auto result = invoke_tool(call);
      if (result.success) {
        spdlog::debug("[Agent] Tool {} succeeded, output length: {} bytes", call.name, result.output.size());
      } else {
        spdlog::error("[Agent] Tool {} failed: {}", call.name, result.error.value_or(""));
      }

      tool_messages.push_back(Message::tool(call.call_id, result.to_model_output()));
      if (!emit(on_event, ToolInvocationFinished{call.call_id, call.name, std::move(result)})) {
        state_ = AgentState::Done;
        return;
      }
    }

    context_.append(std::move(assistant));
    for (auto& msg : tool_messages) {
      context_.append(std::move(msg));
    }
  }

  state_ = AgentState::Finishing;
  emit(on_event, TurnFinished{final_text, usage});
  state_ = AgentState::Done;
}

}  // namespace streamagent
