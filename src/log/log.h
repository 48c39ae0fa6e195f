#ifndef STREAMAGENT_LOG_H
#define STREAMAGENT_LOG_H

#include <cstddef>
#include <string>

namespace streamagent {

/**
 * Initialize logging.
 *
 * Logs are rotated per process start:
 * - the current streamagent.log is renamed to streamagent.0.log
 * - older files shift one slot: streamagent.0.log -> streamagent.1.log -> ...
 * - the oldest file (streamagent.<max_files-1>.log) is deleted
 *
 * @param log_path  log file path (default ~/.config/streamagent/log/streamagent.log)
 * @param max_files number of rotated files kept
 * @param level     trace, debug, info, warn, err, critical or off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

}  // namespace streamagent

#endif  // STREAMAGENT_LOG_H
