// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/discovery/context.hpp"
#include "dht/discovery/state_event.hpp"
#include <memory>

namespace dhtnode {
namespace dht {

// Initializing - startup checks before the first discovery round
//
// Yields Initialized once the node identity is usable and connectivity
// reports online; Errored(InitializationFailed) otherwise.
class Initializing : public std::enable_shared_from_this<Initializing> {
public:
  explicit Initializing(DiscoveryContext context);

  void NextEvent(StateEventCallback callback);
  void Cancel();

private:
  void OnConnectivityResult(bool online);

  DiscoveryContext context_;
  EventCompletion completion_;
};

} // namespace dht
} // namespace dhtnode
