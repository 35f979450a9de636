#include "log.h"
#include <spdlog/spdlog.h>

namespace swarm {

void log_init(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [swarm] [%t] %v");
}

} // namespace swarm
