#pragma once
#include <cstddef>
#include <functional>
#include <thread>

namespace core {

using ThreadFactory = std::function<std::thread(std::function<void()>)>;

// Runs body(i) once for every i in [0, count) on up to n_workers threads, the calling
// thread included. Indices are handed out through an atomic counter.
// If a worker thread cannot be started, the threads that did start and the caller
// finish the remaining work.
void parallel_for(std::size_t count, unsigned n_workers, const std::function<void(std::size_t)>& body);

// Same, with thread creation supplied by the caller.
void parallel_for(std::size_t count, unsigned n_workers, const std::function<void(std::size_t)>& body,
                  const ThreadFactory& spawn);
}
