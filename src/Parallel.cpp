/**
 * @file Parallel.cpp
 */
#include "Parallel.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace {
std::atomic<int> g_override{0};

static int hardwareWorkers() {
    unsigned hc = std::thread::hardware_concurrency();
    if (hc == 0) hc = 2;
    // Leave 1 for UI thread
    return (int)std::max(1u, hc - 1);
}
}

int workerCount() {
    int o = g_override.load();
    return o > 0 ? o : hardwareWorkers();
}

void setWorkerCount(int n) { g_override.store(n > 0 ? n : 0); }

void parallelFor(std::size_t n, const std::function<void(std::size_t, std::size_t, int)>& fn) {
    int numWorkers = workerCount();
    if (n == 0 || numWorkers <= 1) {
        fn(0, n, 0);
        return;
    }
    std::size_t block = (n + (std::size_t)numWorkers - 1) / (std::size_t)numWorkers;
    std::vector<std::thread> th;
    th.reserve((std::size_t)numWorkers);
    std::mutex errMtx;
    std::exception_ptr firstError;
    for (int t = 0; t < numWorkers; ++t) {
        std::size_t begin = (std::size_t)t * block;
        if (begin >= n) break;
        std::size_t end = std::min(n, begin + block);
        th.emplace_back([&, begin, end, t]{
            try {
                fn(begin, end, t);
            } catch (...) {
                std::lock_guard<std::mutex> lk(errMtx);
                if (!firstError) firstError = std::current_exception();
            }
        });
    }
    for (auto& x : th) x.join();
    if (firstError) std::rethrow_exception(firstError);
}
