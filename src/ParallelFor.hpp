// ParallelFor.hpp
#pragma once

#include <cstddef>
#include <functional>

// Runs task(i) for every i in [0, count) on at most maxWorkers threads, the
// calling thread being one of them. Returns once every index has run. If the
// system refuses to start a thread the remaining work runs on fewer threads.
void parallelFor(size_t count, int maxWorkers, const std::function<void(size_t)>& task);
