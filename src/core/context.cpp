#include "streamagent/core/context.hpp"

namespace streamagent {

Context::Context(std::string system_prompt) : system_prompt_(std::move(system_prompt)) {}

void Context::append(Message msg) {
  std::lock_guard lock(mutex_);
  messages_.push_back(std::move(msg));
}

std::vector<Message> Context::snapshot() const {
  std::lock_guard lock(mutex_);
  std::vector<Message> result;
  result.reserve(messages_.size() + 1);
  if (!system_prompt_.empty()) {
    result.push_back(Message::system(system_prompt_));
  }
  result.insert(result.end(), messages_.begin(), messages_.end());
  return result;
}

std::vector<Message> Context::history() const {
  std::lock_guard lock(mutex_);
  return messages_;
}

size_t Context::size() const {
  std::lock_guard lock(mutex_);
  return messages_.size();
}

bool Context::empty() const {
  return size() == 0;
}

std::string Context::system_prompt() const {
  std::lock_guard lock(mutex_);
  return system_prompt_;
}

void Context::clear() {
  std::lock_guard lock(mutex_);
  messages_.clear();
}

}  // namespace streamagent
