// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/node_id.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace dhtnode {
namespace dht {

// Peer record as exchanged during discovery and stored in the registry
struct PeerRecord {
  NodeId node_id;
  std::vector<std::string> addresses; // "host:port"
  int64_t last_seen{0};               // unix seconds, 0 = never

  // Non-null id and at least one non-empty address
  bool IsValid() const;

  std::string ToString() const;
};

// This node's own identity. Read-only after startup.
struct NodeIdentity {
  NodeId node_id;
  std::string public_address;

  NodeIdentity() = default;
  NodeIdentity(const NodeId &id, std::string address)
      : node_id(id), public_address(std::move(address)) {}
};

} // namespace dht
} // namespace dhtnode
