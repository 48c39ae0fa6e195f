#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "streamagent/agent/events.hpp"
#include "streamagent/core/config.hpp"
#include "streamagent/core/context.hpp"
#include "streamagent/llm/resilient_client.hpp"
#include "streamagent/tool/tool.hpp"

namespace streamagent {

// Turn state
enum class AgentState { Idle, Streaming, AwaitingToolExecution, Finishing, Done };

std::string to_string(AgentState state);

// Drives one conversational turn: sends the context to the backend, relays
// the streamed response, runs the requested tools and records everything
// in the context.
class Agent {
 public:
  // OpenAI-compatible transport and the builtin tools
  static std::shared_ptr<Agent> create(const Config& config);

  static std::shared_ptr<Agent> create(const Config& config, std::shared_ptr<llm::Transport> transport, std::shared_ptr<ToolExecutor> tools,
                                       llm::DelayFunction delay = nullptr);

  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Run one turn. Blocks until the turn ends; events are delivered in order,
  // the last one being TurnError or TurnFinished unless the turn is cancelled.
  void run(const std::string& input, const EventCallback& on_event);

  // Abandon the running turn. Safe to call from the event callback or
  // another thread; no events follow.
  void cancel();

  AgentState state() const {
    return state_.load();
  }

  bool is_running() const {
    return running_.load();
  }

  Context& context() {
    return context_;
  }

  const Context& context() const {
    return context_;
  }

  TokenUsage total_usage() const;

  const Config& config() const {
    return config_;
  }

 private:
  Agent(const Config& config, std::shared_ptr<llm::Transport> transport, std::shared_ptr<ToolExecutor> tools, llm::DelayFunction delay);

  // Deliver an event; returns false once the turn has been cancelled
  bool emit(const EventCallback& on_event, const AgentEvent& event);

  bool cancelled() const {
    return abort_signal_->load();
  }

  ToolResult invoke_tool(const ToolCallRequest& call);

  Config config_;
  Context context_;
  std::shared_ptr<ToolExecutor> tools_;
  llm::ResilientClient client_;

  std::atomic<AgentState> state_{AgentState::Idle};
  std::atomic<bool> running_{false};
  std::shared_ptr<std::atomic<bool>> abort_signal_;

  // Orders turn start and end against cancel()
  std::mutex turn_mutex_;

  mutable std::mutex usage_mutex_;
  TokenUsage total_usage_;
};

}  // namespace streamagent
