// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/discovering.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <set>

namespace dhtnode {
namespace dht {

Discovering::Discovering(DiscoveryContext context, DiscoveryParams params)
    : context_(std::move(context)), params_(std::move(params)) {}

Discovering::~Discovering() {
  CloseSessions();
}

void Discovering::NextEvent(StateEventCallback callback) {
  completion_.Arm(std::move(callback));

  // Drop repeated candidates, keeping the selection order
  std::vector<NodeId> candidates;
  candidates.reserve(params_.peers.size());
  for (const auto &id : params_.peers) {
    if (std::find(candidates.begin(), candidates.end(), id) == candidates.end()) {
      candidates.push_back(id);
    }
  }

  if (candidates.empty()) {
    completion_.Fire(
        events::Errored{DiscoveryError::RoundFailed("no sync peers given to discovery round")});
    return;
  }

  SnapshotNeighbourhood();

  stats_ = RoundInfo{};
  stats_.sync_peers = candidates;
  pending_ = candidates.size();

  LOG_DHT_DEBUG("Discovery round: syncing with {} peer(s), requesting up to {} each",
                candidates.size(), params_.num_peers_to_request);

  // Hold a reference: a dial may complete synchronously and finish the round
  auto self = shared_from_this();
  for (const auto &peer_id : candidates) {
    if (finished_ || completion_.cancelled()) {
      break;
    }
    SyncWithPeer(peer_id);
  }
}

void Discovering::SnapshotNeighbourhood() {
  const size_t size = context_.config().num_neighbouring_nodes;
  const auto &self_id = context_.node_identity().node_id;

  neighbourhood_boundary_.reset();
  if (size == 0) {
    return;
  }

  auto neighbours = context_.peer_registry().ClosestPeers(self_id, size, {self_id});
  if (neighbours.size() >= size) {
    neighbourhood_boundary_ = NodeId::Distance(neighbours.back().node_id, self_id);
  }
}

bool Discovering::IsCloser(const NodeId &id) const {
  if (context_.config().num_neighbouring_nodes == 0) {
    return false;
  }
  if (!neighbourhood_boundary_) {
    return true;
  }
  return NodeId::Distance(id, context_.node_identity().node_id) < *neighbourhood_boundary_;
}

void Discovering::SyncWithPeer(const NodeId &peer_id) {
  auto &io = context_.io_context();
  try {
    context_.connectivity().DialPeer(
        peer_id, [weak = weak_from_this(), &io, peer_id](PeerSessionPtr session,
                                                          const std::string &error) {
          boost::asio::post(io, [weak, peer_id, session = std::move(session), error]() mutable {
            auto self = weak.lock();
            if (!self) {
              if (session) {
                session->Close();
              }
              return;
            }
            self->OnDialComplete(peer_id, std::move(session), error);
          });
        });
  } catch (const std::exception &e) {
    LOG_DHT_WARN("Failed to dial peer {}: {}", peer_id.ShortString(), e.what());
    PeerFinished(peer_id, false);
  }
}

void Discovering::OnDialComplete(const NodeId &peer_id, PeerSessionPtr session,
                                 const std::string &error) {
  if (finished_ || completion_.cancelled()) {
    if (session) {
      session->Close();
    }
    return;
  }

  if (!session) {
    LOG_DHT_TRACE("Dial to {} failed: {}", peer_id.ShortString(),
                  error.empty() ? "no session" : error);
    PeerFinished(peer_id, false);
    return;
  }

  sessions_[peer_id] = session;

  auto &io = context_.io_context();
  try {
    session->RequestPeers(params_.num_peers_to_request,
                          [weak = weak_from_this(), &io, peer_id](PeerSyncResult result) {
                            boost::asio::post(io, [weak, peer_id,
                                                   result = std::move(result)]() mutable {
                              if (auto self = weak.lock()) {
                                self->OnPeersReceived(peer_id, std::move(result));
                              }
                            });
                          });
  } catch (const std::exception &e) {
    LOG_DHT_WARN("Peer request to {} failed: {}", peer_id.ShortString(), e.what());
    PeerFinished(peer_id, false);
  }
}

void Discovering::OnPeersReceived(const NodeId &peer_id, PeerSyncResult result) {
  if (finished_ || completion_.cancelled()) {
    return;
  }

  if (!result.success) {
    LOG_DHT_TRACE("Peer sync with {} failed: {}", peer_id.ShortString(), result.error);
    PeerFinished(peer_id, false);
    return;
  }

  const size_t received = result.peers.size();
  std::vector<NodeId> closer_candidates;
  auto batch = ProcessPeerBatch(std::move(result.peers), closer_candidates);

  size_t num_added = 0;
  size_t num_duplicates = 0;
  size_t num_closer = 0;
  if (!batch.empty()) {
    MergeResult merged;
    try {
      merged = context_.peer_registry().MergePeers(batch);
    } catch (const std::exception &e) {
      LOG_DHT_WARN("Failed to store peers from {}: {}", peer_id.ShortString(), e.what());
      PeerFinished(peer_id, false);
      return;
    }

    num_added = merged.num_added();
    num_duplicates = merged.num_duplicates();
    for (const auto &id : merged.added) {
      if (std::find(closer_candidates.begin(), closer_candidates.end(), id) !=
          closer_candidates.end()) {
        ++num_closer;
      }
    }
  }

  stats_.num_new_peers += num_added;
  stats_.num_duplicate_peers += num_duplicates;
  stats_.num_new_neighbours += num_closer;
  closer_accepted_ += num_closer;

  LOG_DHT_TRACE("Synced with {}: received {}, accepted {}, new {}, duplicate {}, closer {}",
                peer_id.ShortString(), received, batch.size(), num_added, num_duplicates,
                num_closer);

  PeerFinished(peer_id, true);
}

std::vector<PeerRecord>
Discovering::ProcessPeerBatch(std::vector<PeerRecord> peers,
                              std::vector<NodeId> &closer_candidates) const {
  const auto &self_id = context_.node_identity().node_id;
  const auto &registry = context_.peer_registry();

  if (peers.size() > params_.num_peers_to_request) {
    peers.resize(params_.num_peers_to_request);
  }

  const size_t closer_room = params_.max_accept_closer_peers > closer_accepted_
                                 ? params_.max_accept_closer_peers - closer_accepted_
                                 : 0;

  std::vector<PeerRecord> accepted;
  accepted.reserve(peers.size());
  std::set<NodeId> seen;

  for (auto &record : peers) {
    if (record.node_id == self_id || !record.IsValid()) {
      continue;
    }
    if (!seen.insert(record.node_id).second) {
      continue;
    }

    if (IsCloser(record.node_id) && !registry.Contains(record.node_id)) {
      if (closer_candidates.size() >= closer_room) {
        continue;
      }
      closer_candidates.push_back(record.node_id);
    }

    accepted.push_back(std::move(record));
  }

  return accepted;
}

void Discovering::PeerFinished(const NodeId &peer_id, bool success) {
  if (success) {
    ++stats_.num_succeeded;
  } else {
    LOG_DHT_DEBUG("Sync peer {} did not complete", peer_id.ShortString());
  }

  if (pending_ > 0) {
    --pending_;
  }
  if (pending_ == 0) {
    Finish();
  }
}

void Discovering::Finish() {
  if (finished_) {
    return;
  }
  finished_ = true;
  CloseSessions();

  LOG_DHT_INFO("Discovery round finished. {}", stats_.ToString());

  completion_.Fire(events::DiscoveryComplete{stats_});
}

void Discovering::Cancel() {
  completion_.Cancel();
  CloseSessions();
}

void Discovering::CloseSessions() {
  auto sessions = std::move(sessions_);
  sessions_.clear();
  for (auto &[id, session] : sessions) {
    if (session) {
      session->Close();
    }
  }
}

} // namespace dht
} // namespace dhtnode
