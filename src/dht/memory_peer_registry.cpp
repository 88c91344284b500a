// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/memory_peer_registry.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace dhtnode {
namespace dht {

MemoryPeerRegistry::MemoryPeerRegistry() : rng_(std::random_device{}()) {}

size_t MemoryPeerRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

bool MemoryPeerRegistry::Contains(const NodeId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.count(id) > 0;
}

std::optional<PeerRecord> MemoryPeerRegistry::Get(const NodeId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<PeerRecord>
MemoryPeerRegistry::CandidatesLocked(const std::vector<NodeId> &exclude) const {
  std::vector<PeerRecord> candidates;
  candidates.reserve(peers_.size());
  for (const auto &[id, record] : peers_) {
    if (std::find(exclude.begin(), exclude.end(), id) == exclude.end()) {
      candidates.push_back(record);
    }
  }
  return candidates;
}

std::vector<PeerRecord> MemoryPeerRegistry::ClosestPeers(const NodeId &target, size_t n,
                                                         const std::vector<NodeId> &exclude) const {
  std::vector<PeerRecord> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    candidates = CandidatesLocked(exclude);
  }

  // partial_sort: O(N log n) for the n closest
  size_t sort_count = std::min(n, candidates.size());
  std::partial_sort(candidates.begin(), candidates.begin() + sort_count, candidates.end(),
                    [&target](const PeerRecord &a, const PeerRecord &b) {
                      return NodeId::IsCloser(a.node_id, b.node_id, target);
                    });
  candidates.resize(sort_count);
  return candidates;
}

std::vector<PeerRecord> MemoryPeerRegistry::RandomPeers(size_t n,
                                                        const std::vector<NodeId> &exclude) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto candidates = CandidatesLocked(exclude);
  std::shuffle(candidates.begin(), candidates.end(), rng_);
  if (candidates.size() > n) {
    candidates.resize(n);
  }
  return candidates;
}

MergeResult MemoryPeerRegistry::MergePeers(const std::vector<PeerRecord> &records) {
  MergeResult result;
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &record : records) {
    if (!record.IsValid()) {
      continue;
    }

    auto it = peers_.find(record.node_id);
    if (it == peers_.end()) {
      peers_.emplace(record.node_id, record);
      result.added.push_back(record.node_id);
      continue;
    }

    PeerRecord &existing = it->second;
    for (const auto &addr : record.addresses) {
      if (!addr.empty() &&
          std::find(existing.addresses.begin(), existing.addresses.end(), addr) ==
              existing.addresses.end()) {
        existing.addresses.push_back(addr);
      }
    }
    existing.last_seen = std::max(existing.last_seen, record.last_seen);
    result.updated.push_back(record.node_id);
  }

  LOG_NET_TRACE("MemoryPeerRegistry: merged {} record(s): {} added, {} duplicate(s), {} total",
                records.size(), result.num_added(), result.num_duplicates(), peers_.size());
  return result;
}

bool MemoryPeerRegistry::Remove(const NodeId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.erase(id) > 0;
}

std::vector<PeerRecord> MemoryPeerRegistry::GetAll() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CandidatesLocked({});
}

void MemoryPeerRegistry::TestSeedRng(uint64_t seed) {
  std::lock_guard<std::mutex> lock(mutex_);
  rng_.seed(static_cast<std::mt19937::result_type>(seed));
}

} // namespace dht
} // namespace dhtnode
