#include <catch2/catch_test_macros.hpp>

#include "infrastructure/runtime/AsioContext.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>

using namespace hostkeeper::infra;

namespace {

/**
 * @brief Posts count handlers that block until released and reports how many started.
 */
class BlockingHandlers {
public:
    void post(AsioContext& context, int count) {
        for (int i = 0; i < count; ++i) {
            context.post([this] {
                std::unique_lock lock(mutex_);
                ++started_;
                cv_.notify_all();
                cv_.wait(lock, [this] { return released_; });
            });
        }
    }

    bool waitForStarted(int count) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [this, count] { return started_ >= count; });
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int started_{0};
    bool released_{false};
};

} // namespace

TEST_CASE("AsioContext worker pool", "[AsioContext]") {
    AsioContext context(1);
    BlockingHandlers handlers;

    SECTION("Growing a running pool adds workers") {
        context.start();
        handlers.post(context, 3);
        REQUIRE(handlers.waitForStarted(1));

        context.ensureThreads(3);
        REQUIRE(context.threadCount() == 3);
        REQUIRE(handlers.waitForStarted(3));

        handlers.release();
        context.stop();
    }

    SECTION("The pool never shrinks") {
        context.ensureThreads(4);
        context.ensureThreads(2);
        REQUIRE(context.threadCount() == 4);
    }

    SECTION("Growth before start applies on start") {
        context.ensureThreads(2);
        context.start();
        handlers.post(context, 2);
        REQUIRE(handlers.waitForStarted(2));

        handlers.release();
        context.stop();
    }
}
