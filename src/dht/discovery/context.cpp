// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/context.hpp"
#include <stdexcept>

namespace dhtnode {
namespace dht {

DiscoveryContext::DiscoveryContext(boost::asio::io_context &io_context,
                                   NetworkDiscoveryConfig config,
                                   std::shared_ptr<const NodeIdentity> node_identity,
                                   PeerRegistryPtr peer_registry,
                                   ConnectivityPtr connectivity)
    : io_context_(&io_context),
      config_(std::make_shared<const NetworkDiscoveryConfig>(std::move(config))),
      node_identity_(std::move(node_identity)),
      peer_registry_(std::move(peer_registry)),
      connectivity_(std::move(connectivity)),
      num_rounds_(std::make_shared<std::atomic<size_t>>(0)) {
  // Handlers dereference these unconditionally
  if (!node_identity_) {
    throw std::invalid_argument("DiscoveryContext: node_identity is required");
  }
  if (!peer_registry_) {
    throw std::invalid_argument("DiscoveryContext: peer_registry is required");
  }
  if (!connectivity_) {
    throw std::invalid_argument("DiscoveryContext: connectivity is required");
  }
}

} // namespace dht
} // namespace dhtnode
