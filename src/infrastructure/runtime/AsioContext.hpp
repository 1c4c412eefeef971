#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace hostkeeper::infra {

/**
 * @brief Manages an Asio I/O context with a thread pool for engine tasks.
 *
 * Invocations run as handlers posted to this pool. Timers (retry backoff,
 * periodic refresh and persistence) are asio::steady_timer objects bound to
 * the same context.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     *
     * Pending handlers and timers are discarded.
     */
    void stop();

    /**
     * @brief Grows the pool to at least the given number of worker threads.
     *
     * Connector work blocks its thread for the whole command, so the pool is
     * sized to cover every invocation that may run at once. The pool never
     * shrinks. When not running, the new size applies on the next start().
     */
    void ensureThreads(size_t count);

    bool isRunning() const { return running_; }
    size_t threadCount() const;

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Posts a handler to be executed on the thread pool.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Runs a handler on the thread pool after a delay.
     *
     * The returned timer can be cancelled; a cancelled handler does not run.
     */
    template <typename Handler>
    std::shared_ptr<asio::steady_timer> postAfter(std::chrono::milliseconds delay, Handler&& handler) {
        auto timer = std::make_shared<asio::steady_timer>(ioContext_);
        timer->expires_after(delay);
        timer->async_wait([timer, handler = std::forward<Handler>(handler)](const asio::error_code& ec) mutable {
            if (!ec) {
                handler();
            }
        });
        return timer;
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    void spawnWorker(size_t index);

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    mutable std::mutex threadsMutex_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace hostkeeper::infra
