// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <cstdlib>
#include <string>

namespace {

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    dhtnode::util::LogManager::Initialize(level, false, "");

    // If level is "trace", also enable TRACE for all components
    // This ensures LOG_DHT_TRACE, LOG_NET_TRACE, etc. all work
    if (level == "trace") {
        for (const auto& component : dhtnode::util::LogManager::Components()) {
            dhtnode::util::LogManager::SetComponentLevel(component, "trace");
        }
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    dhtnode::util::LogManager::Shutdown();
}

// Quiet by default; DHTNODE_TEST_LOGLEVEL=debug (etc.) to see discovery logs
class TestLoggingListener : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        const char* env = std::getenv("DHTNODE_TEST_LOGLEVEL");
        InitializeTestLogging(env ? env : "off");
    }

    void testRunEnded(Catch::TestRunStats const&) override {
        ShutdownTestLogging();
    }
};

} // namespace

CATCH_REGISTER_LISTENER(TestLoggingListener)
