#include "core/parallel_for.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <atomic>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace core {

void parallel_for(std::size_t count, unsigned n_workers, const std::function<void(std::size_t)>& body) {
    parallel_for(count, n_workers, body, [](std::function<void()> fn) { return std::thread(std::move(fn)); });
}

void parallel_for(std::size_t count, unsigned n_workers, const std::function<void(std::size_t)>& body,
                  const ThreadFactory& spawn) {
    if (count == 0) return;
    n_workers = std::max(1u, n_workers);
    if (count < n_workers) n_workers = static_cast<unsigned>(count);

    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        for (std::size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) body(i);
    };

    std::vector<std::thread> pool;
    pool.reserve(n_workers - 1);
    try {
        for (unsigned w = 1; w < n_workers; ++w) pool.push_back(spawn(worker));
    } catch (const std::system_error& e) {
        log_warn("could not start worker thread (" + std::string(e.what()) + "), continuing on " +
                 std::to_string(pool.size() + 1) + " thread(s)");
    }
    worker();
    for (auto& t : pool) t.join();
}
}
