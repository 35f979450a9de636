#pragma once

#include <string>

namespace swarm {

// Configure the default spdlog logger: level name (trace, debug, info, warn,
// error, off) and a pattern tagging every line with the thread id.
// Unknown level names fall back to info.
void log_init(const std::string& level = "info");

} // namespace swarm
