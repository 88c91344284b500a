// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/node_id.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace dhtnode {
namespace dht {

// Input to one discovery round. Built by Ready, consumed by Discovering.
struct DiscoveryParams {
  std::vector<NodeId> peers;          // candidates to sync from, in order
  size_t num_peers_to_request{0};     // peers requested from each candidate
  size_t max_accept_closer_peers{0};  // cap on new neighbourhood peers per round

  // "DiscoveryParams(3 peer(s) selected, num_peers_to_request = 500, max_accept_closer_peers = 8)"
  std::string ToString() const;
};

// Statistics for one completed discovery round
struct DhtNetworkDiscoveryRoundInfo {
  size_t num_new_neighbours{0};
  size_t num_new_peers{0};
  size_t num_duplicate_peers{0};
  size_t num_succeeded{0};
  std::vector<NodeId> sync_peers; // candidates actually contacted

  bool has_new_peers() const { return num_new_peers > 0; }
  bool has_new_neighbours() const { return num_new_neighbours > 0; }

  // True if at least one sync peer was contacted and completed the protocol
  bool is_success() const { return num_succeeded > 0; }

  size_t num_failed() const {
    return sync_peers.size() > num_succeeded ? sync_peers.size() - num_succeeded : 0;
  }

  // "Synced 2/3, num_new_neighbours = 1, num_new_peers = 5, num_duplicate_peers = 7"
  std::string ToString() const;
};

using RoundInfo = DhtNetworkDiscoveryRoundInfo;

} // namespace dht
} // namespace dhtnode
