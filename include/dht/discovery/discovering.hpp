// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/connectivity.hpp"
#include "dht/discovery/context.hpp"
#include "dht/discovery/round_info.hpp"
#include "dht/discovery/state_event.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dhtnode {
namespace dht {

/**
 * Discovering - runs one discovery round
 *
 * Dials every candidate in DiscoveryParams concurrently and asks each one for
 * peers. Each batch is filtered and merged into the registry as soon as it
 * arrives, so a cancelled round leaves whatever was already merged in place.
 *
 * Per-peer failures are counted, never raised. Yields DiscoveryComplete once
 * every candidate has finished, or Errored(RoundFailed) if there were no
 * candidates at all.
 *
 * Threading: collaborator callbacks are posted onto the context's io_context;
 * all member state is touched from that thread only.
 */
class Discovering : public std::enable_shared_from_this<Discovering> {
public:
  Discovering(DiscoveryContext context, DiscoveryParams params);
  ~Discovering();

  Discovering(const Discovering &) = delete;
  Discovering &operator=(const Discovering &) = delete;

  void NextEvent(StateEventCallback callback);

  // Closes open sessions; late dial and request completions are discarded
  void Cancel();

  const DiscoveryParams &params() const { return params_; }

private:
  void SnapshotNeighbourhood();
  bool IsCloser(const NodeId &id) const;

  void SyncWithPeer(const NodeId &peer_id);
  void OnDialComplete(const NodeId &peer_id, PeerSessionPtr session, const std::string &error);
  void OnPeersReceived(const NodeId &peer_id, PeerSyncResult result);

  // Truncate and filter a batch. Sets closer_candidates to the ids in the
  // result that would join our neighbourhood.
  std::vector<PeerRecord> ProcessPeerBatch(std::vector<PeerRecord> peers,
                                           std::vector<NodeId> &closer_candidates) const;

  void PeerFinished(const NodeId &peer_id, bool success);
  void Finish();
  void CloseSessions();

  DiscoveryContext context_;
  DiscoveryParams params_;
  EventCompletion completion_;

  RoundInfo stats_;

  // Distance from us to the farthest member of a full neighbourhood.
  // nullopt while the neighbourhood still has room.
  std::optional<NodeId> neighbourhood_boundary_;

  size_t closer_accepted_{0};
  size_t pending_{0};
  bool finished_{false};

  std::map<NodeId, PeerSessionPtr> sessions_;
};

} // namespace dht
} // namespace dhtnode
