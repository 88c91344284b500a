// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/node_id.hpp"
#include "dht/peer.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace dhtnode {
namespace dht {

// Outcome of merging a batch of records into the registry
struct MergeResult {
  std::vector<NodeId> added;   // ids the registry did not know before
  std::vector<NodeId> updated; // ids already present (duplicates), merged in place

  size_t num_added() const { return added.size(); }
  size_t num_duplicates() const { return updated.size(); }
};

// PeerRegistry - abstract peer store consumed by network discovery
//
// Implementations are shared with the rest of the node and must be safe to
// call from any thread: other subsystems (inbound connections, manual peer
// adds) mutate the registry concurrently with discovery.
class PeerRegistry {
public:
  virtual ~PeerRegistry() = default;

  virtual size_t Count() const = 0;
  virtual bool Contains(const NodeId &id) const = 0;
  virtual std::optional<PeerRecord> Get(const NodeId &id) const = 0;

  // Up to n peers sorted by XOR distance to target, skipping ids in exclude
  virtual std::vector<PeerRecord> ClosestPeers(const NodeId &target, size_t n,
                                               const std::vector<NodeId> &exclude) const = 0;

  // Up to n peers chosen uniformly at random, skipping ids in exclude
  virtual std::vector<PeerRecord> RandomPeers(size_t n,
                                              const std::vector<NodeId> &exclude) const = 0;

  // Insert new records and merge known ones. Applied as one unit per call.
  virtual MergeResult MergePeers(const std::vector<PeerRecord> &records) = 0;
};

using PeerRegistryPtr = std::shared_ptr<PeerRegistry>;

} // namespace dht
} // namespace dhtnode
