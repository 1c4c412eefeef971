#include <catch2/catch_test_macros.hpp>

#include "infrastructure/events/EventBus.hpp"
#include "support/EventRecorder.hpp"

#include <atomic>
#include <future>

using namespace hostkeeper::core;
using namespace hostkeeper::infra;
using namespace hostkeeper::testing;

namespace {

EngineEvent numbered(int n) {
    auto event = EngineEvent::forHost(EventType::UpdateReceived, "host");
    event.message = std::to_string(n);
    return event;
}

std::vector<std::string> messages(const std::vector<EngineEvent>& events) {
    std::vector<std::string> result;
    for (const auto& event : events) {
        result.push_back(event.message);
    }
    return result;
}

/**
 * @brief Subscriber that blocks the delivery thread on its first event until released.
 */
class BlockingSubscriber {
public:
    explicit BlockingSubscriber(EventBus& bus) : bus_(bus) {
        id_ = bus_.subscribe([this](const EngineEvent&) {
            std::unique_lock lock(mutex_);
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] { return released_; });
        });
    }

    ~BlockingSubscriber() {
        release();
        bus_.unsubscribe(id_);
    }

    bool waitEntered() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [this] { return entered_; });
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

private:
    EventBus& bus_;
    int64_t id_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_{false};
    bool released_{false};
};

} // namespace

TEST_CASE("EventBus delivery", "[EventBus]") {
    EventBus bus;
    EventRecorder recorder(bus);

    SECTION("Events arrive in publication order") {
        for (int i = 0; i < 100; ++i) {
            REQUIRE(bus.publish(numbered(i)));
        }
        bus.flush();

        auto received = messages(recorder.events());
        REQUIRE(received.size() == 100);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(received[static_cast<size_t>(i)] == std::to_string(i));
        }
    }

    SECTION("A throwing subscriber does not affect the others") {
        auto id = bus.subscribe([](const EngineEvent&) { throw std::runtime_error("subscriber failure"); });
        EventRecorder later(bus);

        bus.publish(numbered(1));
        bus.publish(numbered(2));
        bus.flush();

        REQUIRE(recorder.events().size() == 2);
        REQUIRE(later.events().size() == 2);
        bus.unsubscribe(id);
    }

    SECTION("Unsubscribed callbacks receive nothing") {
        std::atomic<int> calls{0};
        auto id = bus.subscribe([&calls](const EngineEvent&) { ++calls; });
        bus.unsubscribe(id);

        bus.publish(numbered(1));
        bus.flush();

        REQUIRE(calls == 0);
        REQUIRE(recorder.events().size() == 1);
    }

    SECTION("Publishing after stop is refused") {
        bus.publish(numbered(1));
        bus.stop();

        REQUIRE(recorder.events().size() == 1);
        REQUIRE_FALSE(bus.publish(numbered(2)));
    }

    SECTION("Subscribers run off the publishing thread") {
        std::promise<std::thread::id> deliveredOn;
        auto future = deliveredOn.get_future();
        std::atomic<bool> set{false};
        auto id = bus.subscribe([&](const EngineEvent&) {
            if (!set.exchange(true)) {
                deliveredOn.set_value(std::this_thread::get_id());
            }
        });

        bus.publish(numbered(1));
        REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        REQUIRE(future.get() != std::this_thread::get_id());
        bus.unsubscribe(id);
    }
}

TEST_CASE("EventBus overflow policies", "[EventBus]") {
    SECTION("drop_oldest discards the oldest queued event") {
        EventBus bus(2, OverflowPolicy::DropOldest);
        EventRecorder recorder(bus);
        BlockingSubscriber blocker(bus);

        bus.publish(numbered(1));
        REQUIRE(blocker.waitEntered());

        bus.publish(numbered(2));
        bus.publish(numbered(3));
        bus.publish(numbered(4));
        REQUIRE(bus.droppedCount() == 1);

        blocker.release();
        bus.flush();

        REQUIRE(messages(recorder.events()) == std::vector<std::string>{"1", "3", "4"});
    }

    SECTION("block makes the publisher wait for room") {
        EventBus bus(1, OverflowPolicy::Block);
        EventRecorder recorder(bus);
        BlockingSubscriber blocker(bus);

        bus.publish(numbered(1));
        REQUIRE(blocker.waitEntered());
        bus.publish(numbered(2));

        std::atomic<bool> published{false};
        std::thread publisher([&] {
            bus.publish(numbered(3));
            published = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        REQUIRE_FALSE(published);

        blocker.release();
        publisher.join();
        bus.flush();

        REQUIRE(published);
        REQUIRE(bus.droppedCount() == 0);
        REQUIRE(messages(recorder.events()) == std::vector<std::string>{"1", "2", "3"});
    }

    SECTION("Policy parsing") {
        REQUIRE(overflowPolicyFromString("block") == OverflowPolicy::Block);
        REQUIRE(overflowPolicyFromString("drop_oldest") == OverflowPolicy::DropOldest);
        REQUIRE(overflowPolicyFromString("other") == OverflowPolicy::DropOldest);
    }
}
