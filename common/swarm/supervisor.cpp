#include "supervisor.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <list>
#include <mutex>
#include <thread>
#include <vector>

namespace swarm {

struct task_group::impl {
    struct entry {
        std::string name;
        std::thread thread;
        bool done = false;
    };

    std::list<entry> entries;
    size_t running = 0;
    cancel_token token;
    mutable std::mutex mutex;
    std::condition_variable cv;
};

task_group::task_group() : pimpl(std::make_unique<impl>()) {}

task_group::~task_group() {
    cancel();
    wait(-1);
}

void task_group::spawn(const std::string& name, job fn) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    pimpl->entries.emplace_back();
    impl::entry* e = &pimpl->entries.back();
    e->name = name;
    pimpl->running++;

    impl* state = pimpl.get();
    e->thread = std::thread([state, e, fn = std::move(fn)]() {
        try {
            fn(state->token);
        } catch (const std::exception& ex) {
            SPDLOG_ERROR("Job {} raised: {}", e->name, ex.what());
        } catch (...) {
            SPDLOG_ERROR("Job {} raised an unknown exception", e->name);
        }

        std::lock_guard<std::mutex> done_lock(state->mutex);
        e->done = true;
        state->running--;
        state->cv.notify_all();
    });
}

size_t task_group::reap() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        for (auto it = pimpl->entries.begin(); it != pimpl->entries.end();) {
            if (it->done) {
                finished.push_back(std::move(it->thread));
                it = pimpl->entries.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& t : finished) {
        if (t.joinable()) {
            t.join();
        }
    }
    return finished.size();
}

bool task_group::wait(int64_t timeout_ms) {
    bool drained;
    {
        std::unique_lock<std::mutex> lock(pimpl->mutex);
        auto idle = [this]() { return pimpl->running == 0; };
        if (timeout_ms < 0) {
            pimpl->cv.wait(lock, idle);
            drained = true;
        } else {
            drained = pimpl->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
        }
    }
    reap();
    return drained;
}

void task_group::cancel() {
    pimpl->token.cancel();
}

size_t task_group::running() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->running;
}

} // namespace swarm
