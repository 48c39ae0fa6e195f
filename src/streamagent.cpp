#include "streamagent/streamagent.hpp"

#include "log/log.h"

namespace streamagent {

void init(const Config& config) {
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
}

std::string version() {
  return STREAMAGENT_VERSION_STRING;
}

}  // namespace streamagent
