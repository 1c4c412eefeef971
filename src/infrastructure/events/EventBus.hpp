#pragma once

#include "core/types/EngineEvent.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hostkeeper::infra {

/**
 * @brief What publish() does when the queue is full.
 */
enum class OverflowPolicy {
    DropOldest, ///< Discard the oldest queued event, the publisher never blocks
    Block       ///< Wait until the delivery thread makes room
};

/**
 * @brief Parses "drop_oldest" / "block". Unknown strings map to DropOldest.
 */
OverflowPolicy overflowPolicyFromString(const std::string& str);

/**
 * @brief In-process publish/subscribe channel for engine events.
 *
 * Events go through a bounded queue and are delivered in publication order
 * on a dedicated thread, so subscribers never run on a dispatcher worker.
 * A subscriber that throws is logged and skipped.
 */
class EventBus {
public:
    using EventCallback = std::function<void(const core::EngineEvent&)>;

    explicit EventBus(size_t capacity = 1024, OverflowPolicy policy = OverflowPolicy::DropOldest);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Registers a callback for every event.
     * @return Subscription id for unsubscribe().
     */
    int64_t subscribe(EventCallback callback);
    void unsubscribe(int64_t subscriptionId);

    /**
     * @brief Queues an event for delivery.
     * @return False if the bus has been stopped.
     */
    bool publish(core::EngineEvent event);

    /**
     * @brief Waits until every event published before the call was delivered or dropped.
     *
     * Returns immediately when called from a subscriber.
     */
    void flush();

    /**
     * @brief Delivers what is queued, then stops the delivery thread.
     */
    void stop();

    uint64_t droppedCount() const;
    size_t capacity() const { return capacity_; }
    OverflowPolicy policy() const { return policy_; }

private:
    struct Subscription {
        int64_t id;
        EventCallback callback;
    };

    void run();
    void deliver(const core::EngineEvent& event);
    bool onDeliveryThread() const;

    const size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex queueMutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::condition_variable processedCv_;
    std::deque<core::EngineEvent> queue_;
    uint64_t published_{0};
    uint64_t processed_{0};
    uint64_t dropped_{0};
    bool stopping_{false};

    std::mutex subscriptionsMutex_;
    std::vector<Subscription> subscriptions_;
    int64_t nextSubscriptionId_{1};

    std::thread thread_;
};

} // namespace hostkeeper::infra
