#pragma once

#include "node.h"
#include <string>
#include <vector>
#include <optional>

namespace swarm {

// Pick the least loaded peer able to run task_type.
// Candidates must declare the capability, differ from self_id and have
// heartbeated within max_age_seconds of now. Ties keep the first candidate in
// snapshot order. Pure: no I/O.
std::optional<std::string> select_node(const std::string& task_type,
                                       const std::vector<swarm_node>& snapshot,
                                       const std::string& self_id,
                                       double now,
                                       double max_age_seconds = 60.0);

} // namespace swarm
