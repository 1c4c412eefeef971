#pragma once

#include "core/types/EngineEvent.hpp"
#include "infrastructure/events/EventBus.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace hostkeeper::testing {

/**
 * @brief Collects every event published on a bus.
 */
class EventRecorder {
public:
    using Predicate = std::function<bool(const core::EngineEvent&)>;

    explicit EventRecorder(infra::EventBus& bus) : bus_(bus) {
        subscriptionId_ = bus_.subscribe([this](const core::EngineEvent& event) {
            {
                std::lock_guard lock(mutex_);
                events_.push_back(event);
            }
            cv_.notify_all();
        });
    }

    ~EventRecorder() { bus_.unsubscribe(subscriptionId_); }

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    std::vector<core::EngineEvent> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    std::vector<core::EngineEvent> ofType(core::EventType type) const {
        return matching([type](const core::EngineEvent& event) { return event.type == type; });
    }

    std::vector<core::EngineEvent> matching(const Predicate& predicate) const {
        std::lock_guard lock(mutex_);
        std::vector<core::EngineEvent> result;
        std::copy_if(events_.begin(), events_.end(), std::back_inserter(result), predicate);
        return result;
    }

    size_t count(core::EventType type) const { return ofType(type).size(); }

    /**
     * @brief Result event (data or command result) of one invocation, if delivered.
     */
    std::optional<core::EngineEvent> outcomeOf(core::InvocationId id) const {
        auto found = matching([id](const core::EngineEvent& event) {
            return event.invocationId == id && (event.type == core::EventType::MonitoringDataReceived ||
                                                event.type == core::EventType::CommandResultReceived);
        });
        if (found.empty()) {
            return std::nullopt;
        }
        return found.front();
    }

    /**
     * @brief Position of the first event matching the predicate, -1 if none.
     */
    int indexOf(const Predicate& predicate) const {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(events_.begin(), events_.end(), predicate);
        return it == events_.end() ? -1 : static_cast<int>(it - events_.begin());
    }

    bool waitFor(const Predicate& predicate, size_t count = 1,
                 std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            return static_cast<size_t>(std::count_if(events_.begin(), events_.end(), predicate)) >= count;
        });
    }

    bool waitForType(core::EventType type, size_t count = 1,
                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        return waitFor([type](const core::EngineEvent& event) { return event.type == type; }, count, timeout);
    }

    bool waitForOutcome(core::InvocationId id, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        return waitFor(
            [id](const core::EngineEvent& event) {
                return event.invocationId == id && (event.type == core::EventType::MonitoringDataReceived ||
                                                    event.type == core::EventType::CommandResultReceived);
            },
            1, timeout);
    }

    void clear() {
        std::lock_guard lock(mutex_);
        events_.clear();
    }

private:
    infra::EventBus& bus_;
    int64_t subscriptionId_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<core::EngineEvent> events_;
};

/**
 * @brief Polls a condition until it holds or the timeout expires.
 */
inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

} // namespace hostkeeper::testing
