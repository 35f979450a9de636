#pragma once

#include "store.h"
#include <string>
#include <memory>

namespace swarm {

// Redis-backed store (redis++ over hiredis). The claim and status transition
// operations run as Lua scripts so each is a single atomic server-side step.
class redis_store : public store_interface {
public:
    // url: redis://[user:password@]host:port[/db]
    // Throws store_error when the URL cannot be parsed.
    explicit redis_store(const std::string& url, int pool_size = 4);
    ~redis_store();

    redis_store(const redis_store&) = delete;
    redis_store& operator=(const redis_store&) = delete;

    bool ping() override;

    void hset(const std::string& key, const std::string& field, const std::string& value) override;
    std::optional<std::string> hget(const std::string& key, const std::string& field) override;
    std::map<std::string, std::string> hgetall(const std::string& key) override;
    bool hdel(const std::string& key, const std::string& field) override;

    void rpush(const std::string& key, const std::string& value) override;
    std::optional<std::string> lpop(const std::string& key) override;
    int64_t llen(const std::string& key) override;
    int64_t lrem(const std::string& key, const std::string& value) override;

    claim_result claim_next(const std::string& queue_key,
                            const std::string& status_key,
                            const std::string& node_id,
                            double now) override;

    bool advance_status(const std::string& status_key,
                        const std::string& task_id,
                        const std::string& record_json,
                        const std::vector<std::string>& allowed_from) override;

    const std::string& url() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm
