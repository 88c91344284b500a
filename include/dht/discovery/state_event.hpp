// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/discovery/error.hpp"
#include "dht/discovery/round_info.hpp"
#include <functional>
#include <string>
#include <variant>

namespace dhtnode {
namespace dht {

// Events produced by state handlers and consumed by the transition function.
// One alternative per event; payload-carrying events wrap their payload.
namespace events {
struct Initialized {};
struct BeginDiscovery {
  DiscoveryParams params;
};
struct Ready {};
struct Idle {};
struct DiscoveryComplete {
  DhtNetworkDiscoveryRoundInfo info;
};
struct Errored {
  DiscoveryError error;
};
struct Shutdown {};
} // namespace events

using StateEvent = std::variant<events::Initialized, events::BeginDiscovery, events::Ready,
                                events::Idle, events::DiscoveryComplete, events::Errored,
                                events::Shutdown>;

// Completion handler for StateHandler::NextEvent(). Invoked exactly once
// unless the handler is cancelled first.
using StateEventCallback = std::function<void(StateEvent)>;

// "Initialized", "BeginDiscovery(DiscoveryParams(...))", "Errored(RoundFailed: ...)"
std::string StateEventToString(const StateEvent &event);

// One-shot holder for a pending NextEvent() callback.
// After Cancel(), Fire() is a no-op: a cancelled handler never reports.
class EventCompletion {
public:
  void Arm(StateEventCallback callback) {
    callback_ = std::move(callback);
    cancelled_ = false;
  }

  void Cancel() {
    cancelled_ = true;
    callback_ = nullptr;
  }

  bool cancelled() const { return cancelled_; }
  bool pending() const { return static_cast<bool>(callback_); }

  void Fire(StateEvent event) {
    if (cancelled_ || !callback_) {
      return;
    }
    // Move out first: the callback may destroy the handler that owns us
    auto callback = std::move(callback_);
    callback_ = nullptr;
    callback(std::move(event));
  }

private:
  StateEventCallback callback_;
  bool cancelled_{false};
};

} // namespace dht
} // namespace dhtnode
