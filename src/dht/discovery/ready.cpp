// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/ready.hpp"
#include "util/logging.hpp"

namespace dhtnode {
namespace dht {

namespace {

std::vector<NodeId> ToIds(const std::vector<PeerRecord> &records) {
  std::vector<NodeId> ids;
  ids.reserve(records.size());
  for (const auto &record : records) {
    ids.push_back(record.node_id);
  }
  return ids;
}

} // namespace

DiscoveryReady DiscoveryReady::Initial(DiscoveryContext context) {
  return DiscoveryReady(std::move(context), std::nullopt);
}

DiscoveryReady::DiscoveryReady(DiscoveryContext context, std::optional<RoundInfo> last_round)
    : context_(std::move(context)), last_round_(std::move(last_round)) {}

void DiscoveryReady::NextEvent(StateEventCallback callback) {
  callback(Decide());
}

StateEvent DiscoveryReady::Decide() {
  const auto &config = context_.config();
  const auto &self_id = context_.node_identity().node_id;
  auto &registry = context_.peer_registry();

  if (!last_round_) {
    context_.ResetRoundCount();
  }

  // Two separate calls on a registry other subsystems mutate: never go below zero
  const size_t total = registry.Count();
  const size_t num_peers = total > 0 && registry.Contains(self_id) ? total - 1 : total;
  if (num_peers == 0) {
    return events::Errored{DiscoveryError::RoundFailed("no peers available")};
  }

  const size_t num_rounds = context_.RoundCount();
  if (num_rounds >= config.idle_after_num_rounds) {
    LOG_DHT_DEBUG("Completed {} discovery round(s) this cycle, idling", num_rounds);
    return events::Idle{};
  }

  if (last_round_ && num_peers >= config.min_desired_peers && !last_round_->has_new_peers()) {
    LOG_DHT_DEBUG("Last round found no new peers and {} peer(s) are known (>= {}), idling",
                  num_peers, config.min_desired_peers);
    return events::Idle{};
  }

  auto sync_peers = SelectSyncPeers();
  if (sync_peers.empty()) {
    return events::Errored{DiscoveryError::RoundFailed("no sync peers available")};
  }

  const size_t round = context_.IncrementRoundCount() + 1;
  LOG_DHT_DEBUG("Starting discovery round {} with {} sync peer(s)", round, sync_peers.size());

  DiscoveryParams params;
  params.peers = std::move(sync_peers);
  params.num_peers_to_request = config.max_peers_to_sync_per_round;
  params.max_accept_closer_peers = config.num_neighbouring_nodes;
  return events::BeginDiscovery{std::move(params)};
}

std::vector<NodeId> DiscoveryReady::SelectSyncPeers() const {
  const auto &config = context_.config();
  const auto &self_id = context_.node_identity().node_id;
  const auto &registry = context_.peer_registry();

  // Closest peers after a round that moved our neighbourhood: they are the
  // most likely to know even closer ones. Random peers otherwise.
  const bool prefer_closest = last_round_ && last_round_->has_new_neighbours();

  auto select = [&](const std::vector<NodeId> &exclude) {
    if (prefer_closest) {
      return ToIds(registry.ClosestPeers(self_id, config.max_sync_peers, exclude));
    }
    return ToIds(registry.RandomPeers(config.max_sync_peers, exclude));
  };

  std::vector<NodeId> exclude{self_id};
  if (last_round_) {
    exclude.insert(exclude.end(), last_round_->sync_peers.begin(), last_round_->sync_peers.end());
  }

  auto selected = select(exclude);
  if (selected.empty() && exclude.size() > 1) {
    LOG_DHT_TRACE("No fresh sync peers, reusing last round's peers");
    selected = select({self_id});
  }
  return selected;
}

} // namespace dht
} // namespace dhtnode
