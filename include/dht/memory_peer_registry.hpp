// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/peer_registry.hpp"
#include <map>
#include <mutex>
#include <random>

namespace dhtnode {
namespace dht {

/**
 * MemoryPeerRegistry - in-process PeerRegistry
 *
 * Merge rules:
 * - Unknown id: inserted as-is (counts as added)
 * - Known id: addresses are unioned (existing order kept, new ones appended),
 *   last_seen keeps the newest value (counts as duplicate)
 * - Invalid records (null id, no address) are ignored
 *
 * A single mutex guards the table, so MergePeers() is atomic with respect to
 * concurrent readers and writers.
 */
class MemoryPeerRegistry : public PeerRegistry {
public:
  MemoryPeerRegistry();

  size_t Count() const override;
  bool Contains(const NodeId &id) const override;
  std::optional<PeerRecord> Get(const NodeId &id) const override;

  std::vector<PeerRecord> ClosestPeers(const NodeId &target, size_t n,
                                       const std::vector<NodeId> &exclude) const override;
  std::vector<PeerRecord> RandomPeers(size_t n,
                                      const std::vector<NodeId> &exclude) const override;

  MergeResult MergePeers(const std::vector<PeerRecord> &records) override;

  // Remove a peer. Returns false if unknown.
  bool Remove(const NodeId &id);

  // Snapshot of all records (ordered by id)
  std::vector<PeerRecord> GetAll() const;

  // Test-only: seed RNG for deterministic RandomPeers()
  void TestSeedRng(uint64_t seed);

private:
  std::vector<PeerRecord> CandidatesLocked(const std::vector<NodeId> &exclude) const;

  mutable std::mutex mutex_;
  std::map<NodeId, PeerRecord> peers_;
  mutable std::mt19937 rng_;
};

} // namespace dht
} // namespace dhtnode
