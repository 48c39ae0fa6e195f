#pragma once

// Core types
#include "streamagent/core/config.hpp"
#include "streamagent/core/context.hpp"
#include "streamagent/core/message.hpp"
#include "streamagent/core/types.hpp"

// LLM streaming
#include "streamagent/llm/chunk_decoder.hpp"
#include "streamagent/llm/resilient_client.hpp"
#include "streamagent/llm/stream_event.hpp"
#include "streamagent/llm/transport.hpp"

// Tool system
#include "streamagent/tool/builtin/builtins.hpp"
#include "streamagent/tool/tool.hpp"

// Agent loop
#include "streamagent/agent/agent.hpp"
#include "streamagent/agent/events.hpp"

#define STREAMAGENT_VERSION_STRING "0.1.0"

namespace streamagent {

// Initialize logging from the configuration
void init(const Config& config);

// Get version string
std::string version();

}  // namespace streamagent
