#include "redis-store.h"
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <iterator>

using json = nlohmann::json;

namespace swarm {

// KEYS[1] = queue, KEYS[2] = status hash, ARGV[1] = assigned record.
// Returns {} when the queue is empty, else {outcome, payload}.
static const char* CLAIM_SCRIPT = R"lua(
local payload = redis.call('LPOP', KEYS[1])
if not payload then
    return {}
end
local ok, task = pcall(cjson.decode, payload)
if not ok or type(task) ~= 'table' or type(task['task_id']) ~= 'string' then
    return {'invalid', payload}
end
local current = redis.call('HGET', KEYS[2], task['task_id'])
if current then
    local ok2, rec = pcall(cjson.decode, current)
    if not ok2 or type(rec) ~= 'table' or rec['status'] ~= 'pending' then
        return {'abandoned', payload}
    end
end
redis.call('HSET', KEYS[2], task['task_id'], ARGV[1])
return {'claimed', payload}
)lua";

// KEYS[1] = status hash, ARGV[1] = task id, ARGV[2] = new record,
// ARGV[3..] = statuses the current record may have ("none" = missing).
static const char* ADVANCE_SCRIPT = R"lua(
local current = redis.call('HGET', KEYS[1], ARGV[1])
local status = 'none'
if current then
    status = 'unknown'
    local ok, rec = pcall(cjson.decode, current)
    if ok and type(rec) == 'table' and type(rec['status']) == 'string' then
        status = rec['status']
    end
end
for i = 3, #ARGV do
    if ARGV[i] == status then
        redis.call('HSET', KEYS[1], ARGV[1], ARGV[2])
        return 1
    end
end
return 0
)lua";

struct redis_store::impl {
    std::string url;
    std::unique_ptr<sw::redis::Redis> redis;

    template <typename Func>
    auto call(const char* op, Func func) -> decltype(func()) {
        try {
            return func();
        } catch (const sw::redis::Error& e) {
            throw store_error(std::string("redis ") + op + " failed: " + e.what());
        }
    }
};

redis_store::redis_store(const std::string& url, int pool_size)
    : pimpl(std::make_unique<impl>()) {
    pimpl->url = url;
    try {
        sw::redis::ConnectionOptions opts(url);
        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = pool_size > 0 ? static_cast<std::size_t>(pool_size) : 1;
        pimpl->redis = std::make_unique<sw::redis::Redis>(opts, pool_opts);
    } catch (const sw::redis::Error& e) {
        throw store_error("invalid redis url '" + url + "': " + e.what());
    }
}

redis_store::~redis_store() = default;

bool redis_store::ping() {
    try {
        pimpl->redis->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        SPDLOG_WARN("Redis ping to {} failed: {}", pimpl->url, e.what());
        return false;
    }
}

void redis_store::hset(const std::string& key, const std::string& field, const std::string& value) {
    pimpl->call("HSET", [&]() { pimpl->redis->hset(key, field, value); });
}

std::optional<std::string> redis_store::hget(const std::string& key, const std::string& field) {
    return pimpl->call("HGET", [&]() -> std::optional<std::string> {
        auto value = pimpl->redis->hget(key, field);
        if (!value) {
            return std::nullopt;
        }
        return std::string(*value);
    });
}

std::map<std::string, std::string> redis_store::hgetall(const std::string& key) {
    return pimpl->call("HGETALL", [&]() {
        std::map<std::string, std::string> fields;
        pimpl->redis->hgetall(key, std::inserter(fields, fields.begin()));
        return fields;
    });
}

bool redis_store::hdel(const std::string& key, const std::string& field) {
    return pimpl->call("HDEL", [&]() { return pimpl->redis->hdel(key, field) > 0; });
}

void redis_store::rpush(const std::string& key, const std::string& value) {
    pimpl->call("RPUSH", [&]() { pimpl->redis->rpush(key, value); });
}

std::optional<std::string> redis_store::lpop(const std::string& key) {
    return pimpl->call("LPOP", [&]() -> std::optional<std::string> {
        auto value = pimpl->redis->lpop(key);
        if (!value) {
            return std::nullopt;
        }
        return std::string(*value);
    });
}

int64_t redis_store::llen(const std::string& key) {
    return pimpl->call("LLEN", [&]() { return static_cast<int64_t>(pimpl->redis->llen(key)); });
}

int64_t redis_store::lrem(const std::string& key, const std::string& value) {
    return pimpl->call("LREM", [&]() {
        return static_cast<int64_t>(pimpl->redis->lrem(key, 0, value));
    });
}

claim_result redis_store::claim_next(const std::string& queue_key,
                                     const std::string& status_key,
                                     const std::string& node_id,
                                     double now) {
    json claim;
    claim["status"] = "assigned";
    claim["assigned_to"] = node_id;
    claim["assigned_at"] = now;

    std::vector<std::string> keys = {queue_key, status_key};
    std::vector<std::string> args = {claim.dump()};
    std::vector<std::string> reply;

    pimpl->call("EVAL claim", [&]() {
        pimpl->redis->eval(CLAIM_SCRIPT, keys.begin(), keys.end(),
                           args.begin(), args.end(), std::back_inserter(reply));
    });

    claim_result result;
    if (reply.size() < 2) {
        return result;
    }
    result.payload = reply[1];
    if (reply[0] == "claimed") result.outcome = CLAIM_OUTCOME_CLAIMED;
    else if (reply[0] == "abandoned") result.outcome = CLAIM_OUTCOME_ABANDONED;
    else result.outcome = CLAIM_OUTCOME_INVALID;
    return result;
}

bool redis_store::advance_status(const std::string& status_key,
                                 const std::string& task_id,
                                 const std::string& record_json,
                                 const std::vector<std::string>& allowed_from) {
    std::vector<std::string> keys = {status_key};
    std::vector<std::string> args = {task_id, record_json};
    args.insert(args.end(), allowed_from.begin(), allowed_from.end());

    return pimpl->call("EVAL advance", [&]() {
        return pimpl->redis->eval<long long>(ADVANCE_SCRIPT, keys.begin(), keys.end(),
                                             args.begin(), args.end()) == 1;
    });
}

const std::string& redis_store::url() const {
    return pimpl->url;
}

} // namespace swarm
