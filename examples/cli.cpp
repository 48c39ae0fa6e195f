// streamagent command line driver
//
//   streamagent_cli "prompt"   run a single turn and exit
//   streamagent_cli            interactive loop (/clear resets the conversation, /exit quits)
#include <asio.hpp>
#include <atomic>
#include <csignal>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <type_traits>

#include "streamagent/streamagent.hpp"

using namespace streamagent;

static std::atomic<bool> g_running{false};  // true when a turn is in progress

static void print_event(const AgentEvent& event) {
  std::visit(
      [](auto&& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, TextDelta>) {
          std::cout << e.text << std::flush;
        } else if constexpr (std::is_same_v<T, TextFinished>) {
          std::cout << "\n";
        } else if constexpr (std::is_same_v<T, ToolInvocationStarted>) {
          std::cout << "\n[Calling tool: " << e.name << "]\n";
          std::cout << "[Arguments: " << e.arguments.dump(2) << "]\n";
        } else if constexpr (std::is_same_v<T, ToolInvocationFinished>) {
          std::cout << "[Tool " << e.name << " " << (e.result.success ? "completed" : "failed") << "]\n";
          auto output = e.result.to_model_output();
          if (output.size() > 500) {
            std::cout << "[Result: " << output.substr(0, 500) << "... (" << output.size() << " chars total)]\n";
          } else {
            std::cout << "[Result: " << output << "]\n";
          }
        } else if constexpr (std::is_same_v<T, TurnError>) {
          std::cout << "\n[Error: " << e.message << "]\n";
        } else if constexpr (std::is_same_v<T, TurnFinished>) {
          if (e.usage) {
            std::cout << "[Tokens: " << e.usage->prompt_tokens << " in, " << e.usage->completion_tokens << " out]\n";
          }
        }
      },
      event);
}

// Returns false when the turn ended in TurnError
static bool run_turn(Agent& agent, const std::string& input) {
  bool failed = false;
  g_running = true;
  agent.run(input, [&failed](const AgentEvent& event) {
    if (std::holds_alternative<TurnError>(event)) {
      failed = true;
    }
    print_event(event);
  });
  g_running = false;
  return !failed;
}

int main(int argc, char* argv[]) {
  auto config = Config::from_env();
  init(config);

  if (config.provider.api_key.empty()) {
    std::cerr << "Error: No API key found. Set STREAMAGENT_API_KEY or OPENAI_API_KEY\n";
    return 1;
  }

  auto agent = Agent::create(config);

  // Ctrl+C cancels the running turn
  asio::io_context signal_ctx;
  asio::signal_set signals(signal_ctx, SIGINT);
  std::function<void(const asio::error_code&, int)> on_signal = [&](const asio::error_code& ec, int) {
    if (ec) return;
    if (g_running.load()) {
      agent->cancel();
      std::cout << "\n[Interrupted]\n" << std::flush;
    } else {
      std::cout << "\nType /exit to quit.\n> " << std::flush;
    }
    signals.async_wait(on_signal);
  };
  signals.async_wait(on_signal);
  std::thread signal_thread([&signal_ctx]() {
    signal_ctx.run();
  });

  int exit_code = 0;

  if (argc > 1) {
    std::string prompt = argv[1];
    for (int i = 2; i < argc; ++i) {
      prompt += " ";
      prompt += argv[i];
    }
    if (!run_turn(*agent, prompt)) {
      exit_code = 1;
    }
  } else {
    std::cout << "streamagent v" << version() << " (" << config.provider.model << ")\n";
    std::cout << "Enter your message (or '/exit' to quit):\n\n";

    std::string input;
    while (true) {
      std::cout << "> " << std::flush;
      if (!std::getline(std::cin, input)) {
        break;
      }

      if (input == "/exit") {
        break;
      }

      if (input.empty()) {
        continue;
      }

      if (input == "/clear") {
        agent->context().clear();
        std::cout << "[Conversation cleared]\n";
        continue;
      }

      run_turn(*agent, input);
      std::cout << "\n";
    }
  }

  signal_ctx.stop();
  signal_thread.join();

  return exit_code;
}
