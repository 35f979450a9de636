#include "node.h"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace swarm {

const char* node_status_to_string(node_status status) {
    switch (status) {
        case NODE_STATUS_ACTIVE: return "active";
        case NODE_STATUS_BUSY: return "busy";
        case NODE_STATUS_OFFLINE: return "offline";
        default: return "unknown";
    }
}

std::string swarm_node::to_json() const {
    json j;
    j["node_id"] = node_id;
    j["instance_url"] = instance_url;
    j["capabilities"] = capabilities;
    j["load_factor"] = load_factor;
    j["last_heartbeat"] = last_heartbeat;
    j["status"] = node_status_to_string(status);
    return j.dump();
}

swarm_node swarm_node::from_json(const std::string& json_str) {
    json j = json::parse(json_str);
    swarm_node node;
    node.node_id = j.at("node_id").get<std::string>();
    node.instance_url = j.value("instance_url", "");
    node.capabilities = j.value("capabilities", std::vector<std::string>());
    node.load_factor = j.value("load_factor", 0.0);
    node.last_heartbeat = j.at("last_heartbeat").get<double>();

    std::string status_str = j.value("status", "active");
    if (status_str == "busy") node.status = NODE_STATUS_BUSY;
    else if (status_str == "offline") node.status = NODE_STATUS_OFFLINE;
    else node.status = NODE_STATUS_ACTIVE;
    return node;
}

bool swarm_node::has_capability(const std::string& capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

double swarm_node::heartbeat_age(double now) const {
    return now - last_heartbeat;
}

bool swarm_node::operator==(const swarm_node& other) const {
    return node_id == other.node_id &&
           instance_url == other.instance_url &&
           capabilities == other.capabilities &&
           load_factor == other.load_factor &&
           last_heartbeat == other.last_heartbeat &&
           status == other.status;
}

} // namespace swarm
