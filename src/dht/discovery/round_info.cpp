// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/round_info.hpp"
#include <spdlog/fmt/fmt.h>

namespace dhtnode {
namespace dht {

std::string DiscoveryParams::ToString() const {
  return fmt::format(
      "DiscoveryParams({} peer(s) selected, num_peers_to_request = {}, max_accept_closer_peers = {})",
      peers.size(), num_peers_to_request, max_accept_closer_peers);
}

std::string DhtNetworkDiscoveryRoundInfo::ToString() const {
  return fmt::format(
      "Synced {}/{}, num_new_neighbours = {}, num_new_peers = {}, num_duplicate_peers = {}",
      num_succeeded, sync_peers.size(), num_new_neighbours, num_new_peers, num_duplicate_peers);
}

} // namespace dht
} // namespace dhtnode
