// Unit tests for ShutdownSignal
#include <catch2/catch_test_macros.hpp>
#include "util/shutdown_signal.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace dhtnode::util;

TEST_CASE("ShutdownSignal fires subscribers once", "[util][shutdown]") {
    ShutdownSignal signal;
    int fired = 0;
    auto sub = signal.OnTriggered([&]() { ++fired; });

    REQUIRE_FALSE(signal.IsTriggered());
    REQUIRE(signal.SubscriberCount() == 1);

    REQUIRE(signal.Trigger());
    REQUIRE(signal.IsTriggered());
    REQUIRE(fired == 1);

    // Idempotent
    REQUIRE_FALSE(signal.Trigger());
    REQUIRE(fired == 1);
}

TEST_CASE("ShutdownSignal subscription after trigger runs immediately", "[util][shutdown]") {
    ShutdownSignal signal;
    signal.Trigger();

    bool fired = false;
    auto sub = signal.OnTriggered([&]() { fired = true; });
    REQUIRE(fired);
    REQUIRE(signal.SubscriberCount() == 0);
}

TEST_CASE("ShutdownSignal subscriptions are RAII", "[util][shutdown]") {
    ShutdownSignal signal;
    int fired = 0;

    SECTION("Destroyed subscription is not called") {
        {
            auto sub = signal.OnTriggered([&]() { ++fired; });
            REQUIRE(signal.SubscriberCount() == 1);
        }
        REQUIRE(signal.SubscriberCount() == 0);
        signal.Trigger();
        REQUIRE(fired == 0);
    }

    SECTION("Explicit Unsubscribe") {
        auto sub = signal.OnTriggered([&]() { ++fired; });
        sub.Unsubscribe();
        sub.Unsubscribe();
        signal.Trigger();
        REQUIRE(fired == 0);
    }

    SECTION("Moved subscription stays registered") {
        ShutdownSignal::Subscription outer;
        {
            auto inner = signal.OnTriggered([&]() { ++fired; });
            outer = std::move(inner);
        }
        REQUIRE(signal.SubscriberCount() == 1);
        signal.Trigger();
        REQUIRE(fired == 1);
    }
}

TEST_CASE("ShutdownSignal concurrent triggers fire once", "[util][shutdown][threading]") {
    ShutdownSignal signal;
    std::atomic<int> fired{0};
    std::atomic<int> winners{0};
    auto sub = signal.OnTriggered([&]() { ++fired; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (signal.Trigger()) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(fired == 1);
    REQUIRE(winners == 1);
}
