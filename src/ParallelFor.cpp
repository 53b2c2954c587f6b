#include "ParallelFor.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <system_error>
#include <thread>
#include <vector>

void parallelFor(size_t count, int maxWorkers, const std::function<void(size_t)>& task) {
    if (count == 0) return;

    std::atomic<size_t> next{0};
    auto drain = [&next, count, &task]() {
        for (size_t i = next++; i < count; i = next++) {
            task(i);
        }
    };

    size_t helpers = std::min(count, static_cast<size_t>(std::max(1, maxWorkers))) - 1;
    std::vector<std::thread> threads;
    threads.reserve(helpers);
    for (size_t i = 0; i < helpers; ++i) {
        try {
            threads.emplace_back(drain);
        } catch (const std::system_error& e) {
            std::cerr << "[Pool] Could not start worker " << i + 1 << ": " << e.what()
                      << "; continuing with " << threads.size() + 1 << std::endl;
            break;
        }
    }

    drain();
    for (auto& t : threads) t.join();
}
