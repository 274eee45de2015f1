#include <atomic>
#include <cassert>
#include <functional>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include "core/parallel_for.hpp"

static std::system_error no_threads() {
    return std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
}

int main() {
    // Every index runs exactly once
    {
        std::vector<int> hits(1000, 0);
        core::parallel_for(hits.size(), 4, [&](size_t i) { hits[i] += 1; });
        for (int h : hits) assert(h == 1);
    }
    // More workers than items, and nothing to do
    {
        std::vector<int> hits(3, 0);
        core::parallel_for(hits.size(), 16, [&](size_t i) { hits[i] += 1; });
        for (int h : hits) assert(h == 1);
        core::parallel_for(0, 4, [&](size_t) { assert(false); });
    }
    // Second thread fails to start: the started one and the caller finish the work
    {
        std::vector<int> hits(200, 0);
        int spawned = 0;
        core::ThreadFactory flaky = [&](std::function<void()> fn) {
            if (++spawned > 1) throw no_threads();
            return std::thread(std::move(fn));
        };
        core::parallel_for(hits.size(), 4, [&](size_t i) { hits[i] += 1; }, flaky);
        assert(spawned == 2);
        for (int h : hits) assert(h == 1);
    }
    // No thread can be started at all
    {
        std::vector<int> hits(50, 0);
        std::thread::id caller = std::this_thread::get_id();
        std::atomic<bool> off_caller{false};
        core::ThreadFactory broken = [](std::function<void()>) -> std::thread { throw no_threads(); };
        core::parallel_for(hits.size(), 8, [&](size_t i) {
            hits[i] += 1;
            if (std::this_thread::get_id() != caller) off_caller = true;
        }, broken);
        assert(!off_caller);
        for (int h : hits) assert(h == 1);
    }
    return 0;
}
