#include "infrastructure/runtime/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace hostkeeper::infra {

AsioContext::AsioContext(size_t threadCount)
    : threadCount_(threadCount > 0 ? threadCount : 1) {
    spdlog::debug("AsioContext created with {} threads", threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    std::lock_guard lock(threadsMutex_);
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        spawnWorker(i);
    }

    spdlog::info("AsioContext started with {} worker threads", threadCount_);
}

void AsioContext::ensureThreads(size_t count) {
    std::lock_guard lock(threadsMutex_);
    if (count <= threadCount_) {
        return;
    }

    const size_t previous = threadCount_;
    threadCount_ = count;
    if (!running_) {
        return;
    }

    for (size_t i = previous; i < threadCount_; ++i) {
        spawnWorker(i);
    }
    spdlog::info("AsioContext grown from {} to {} worker threads", previous, threadCount_);
}

size_t AsioContext::threadCount() const {
    std::lock_guard lock(threadsMutex_);
    return threadCount_;
}

void AsioContext::spawnWorker(size_t index) {
    threads_.emplace_back([this, index]() {
        spdlog::debug("Worker thread {} started", index);
        while (true) {
            try {
                ioContext_.run();
                break;
            } catch (const std::exception& e) {
                spdlog::error("Unhandled exception in worker thread {}: {}", index, e.what());
            }
        }
        spdlog::debug("Worker thread {} stopped", index);
    });
}

void AsioContext::stop() {
    std::vector<std::thread> threads;
    {
        std::lock_guard lock(threadsMutex_);
        if (!running_.exchange(false)) {
            return;
        }
        workGuard_.reset();
        ioContext_.stop();
        threads.swap(threads_);
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    ioContext_.restart();
    spdlog::info("AsioContext stopped");
}

} // namespace hostkeeper::infra
