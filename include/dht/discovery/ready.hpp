// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/discovery/context.hpp"
#include "dht/discovery/round_info.hpp"
#include "dht/discovery/state_event.hpp"
#include <optional>
#include <vector>

namespace dhtnode {
namespace dht {

/**
 * DiscoveryReady - decides what the loop does next
 *
 * Given the previous round's statistics (if any) and the registry, yields
 * one of:
 * - BeginDiscovery: another round with freshly selected sync peers
 * - Idle: enough rounds this cycle, or the network looks saturated
 * - Errored(RoundFailed): nobody to sync from
 *
 * Completes synchronously; there is nothing to cancel.
 */
class DiscoveryReady {
public:
  // Ready at the start of a cycle (after Initialized or a Waiting period)
  static DiscoveryReady Initial(DiscoveryContext context);

  DiscoveryReady(DiscoveryContext context, std::optional<RoundInfo> last_round);

  void NextEvent(StateEventCallback callback);
  void Cancel() {}

  const std::optional<RoundInfo> &last_round() const { return last_round_; }

private:
  StateEvent Decide();

  // Up to max_sync_peers candidates, or empty if the registry has nobody usable
  std::vector<NodeId> SelectSyncPeers() const;

  DiscoveryContext context_;
  std::optional<RoundInfo> last_round_;
};

} // namespace dht
} // namespace dhtnode
