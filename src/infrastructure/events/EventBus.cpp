#include "infrastructure/events/EventBus.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hostkeeper::infra {

OverflowPolicy overflowPolicyFromString(const std::string& str) {
    if (str == "block") {
        return OverflowPolicy::Block;
    }
    return OverflowPolicy::DropOldest;
}

EventBus::EventBus(size_t capacity, OverflowPolicy policy)
    : capacity_(std::max<size_t>(capacity, 1)), policy_(policy) {
    thread_ = std::thread([this]() { run(); });
}

EventBus::~EventBus() {
    stop();
}

int64_t EventBus::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(subscriptionsMutex_);
    int64_t id = nextSubscriptionId_++;
    subscriptions_.push_back({id, std::move(callback)});
    spdlog::debug("Event subscriber added (id={})", id);
    return id;
}

void EventBus::unsubscribe(int64_t subscriptionId) {
    std::lock_guard<std::mutex> lock(subscriptionsMutex_);
    subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                        [subscriptionId](const Subscription& sub) {
                                            return sub.id == subscriptionId;
                                        }),
                         subscriptions_.end());
    spdlog::debug("Event subscriber removed (id={})", subscriptionId);
}

bool EventBus::publish(core::EngineEvent event) {
    std::unique_lock lock(queueMutex_);
    if (stopping_) {
        return false;
    }

    if (queue_.size() >= capacity_) {
        // A subscriber publishing into a full queue would wait on itself.
        if (policy_ == OverflowPolicy::Block && !onDeliveryThread()) {
            notFull_.wait(lock, [this]() { return stopping_ || queue_.size() < capacity_; });
            if (stopping_) {
                return false;
            }
        } else {
            auto dropped = eventTypeToString(queue_.front().type);
            queue_.pop_front();
            ++processed_;
            ++dropped_;
            processedCv_.notify_all();
            spdlog::warn("Event queue full ({}), dropped oldest event {}", capacity_, dropped);
        }
    }

    queue_.push_back(std::move(event));
    ++published_;
    notEmpty_.notify_one();
    return true;
}

void EventBus::flush() {
    if (onDeliveryThread()) {
        return;
    }

    std::unique_lock lock(queueMutex_);
    uint64_t target = published_;
    processedCv_.wait(lock, [this, target]() { return processed_ >= target; });
}

void EventBus::stop() {
    {
        std::lock_guard lock(queueMutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();

    if (thread_.joinable()) {
        if (onDeliveryThread()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

uint64_t EventBus::droppedCount() const {
    std::lock_guard lock(queueMutex_);
    return dropped_;
}

void EventBus::run() {
    std::unique_lock lock(queueMutex_);
    while (true) {
        notEmpty_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            break;
        }

        auto event = std::move(queue_.front());
        queue_.pop_front();
        notFull_.notify_one();

        lock.unlock();
        deliver(event);
        lock.lock();

        ++processed_;
        processedCv_.notify_all();
    }
}

void EventBus::deliver(const core::EngineEvent& event) {
    std::vector<EventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscriptionsMutex_);
        for (const auto& sub : subscriptions_) {
            callbacks.push_back(sub.callback);
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            spdlog::error("Error in event handler for '{}': {}", eventTypeToString(event.type),
                          e.what());
        }
    }
}

bool EventBus::onDeliveryThread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

} // namespace hostkeeper::infra
