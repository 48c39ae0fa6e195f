#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "streamagent/core/message.hpp"

namespace streamagent {

// Append-only, chronologically ordered conversation log.
//
// The system prompt is not stored as a message; snapshot() synthesizes a
// leading system message whenever a prompt is configured.
class Context {
 public:
  explicit Context(std::string system_prompt = "");

  void append(Message msg);

  // Messages to send to the backend, system prompt first
  std::vector<Message> snapshot() const;

  // Logged messages only, without the synthesized system message
  std::vector<Message> history() const;

  size_t size() const;
  bool empty() const;

  std::string system_prompt() const;

  void clear();

 private:
  mutable std::mutex mutex_;
  std::string system_prompt_;
  std::vector<Message> messages_;
};

}  // namespace streamagent
