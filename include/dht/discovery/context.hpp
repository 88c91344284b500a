// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/connectivity.hpp"
#include "dht/discovery/config.hpp"
#include "dht/peer.hpp"
#include "dht/peer_registry.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <memory>

namespace dhtnode {
namespace dht {

/**
 * DiscoveryContext - configuration and collaborator handles shared by the
 * driver and every state handler
 *
 * Copies are cheap and share the same round counter, collaborators and
 * io_context. The configuration is read-only after construction; the only
 * mutable state is the atomic round counter, so no locking is needed.
 */
class DiscoveryContext {
public:
  DiscoveryContext(boost::asio::io_context &io_context,
                   NetworkDiscoveryConfig config,
                   std::shared_ptr<const NodeIdentity> node_identity,
                   PeerRegistryPtr peer_registry,
                   ConnectivityPtr connectivity);

  // Increment the number of rounds by 1, returning the previous count
  size_t IncrementRoundCount() const {
    return num_rounds_->fetch_add(1, std::memory_order_acq_rel);
  }

  size_t RoundCount() const {
    return num_rounds_->load(std::memory_order_relaxed);
  }

  // Reset the number of rounds to 0 (start of a fresh discovery cycle)
  void ResetRoundCount() const {
    num_rounds_->store(0, std::memory_order_release);
  }

  const NetworkDiscoveryConfig &config() const { return *config_; }
  const NodeIdentity &node_identity() const { return *node_identity_; }
  PeerRegistry &peer_registry() const { return *peer_registry_; }
  Connectivity &connectivity() const { return *connectivity_; }
  boost::asio::io_context &io_context() const { return *io_context_; }

private:
  boost::asio::io_context *io_context_;
  std::shared_ptr<const NetworkDiscoveryConfig> config_;
  std::shared_ptr<const NodeIdentity> node_identity_;
  PeerRegistryPtr peer_registry_;
  ConnectivityPtr connectivity_;
  std::shared_ptr<std::atomic<size_t>> num_rounds_;
};

} // namespace dht
} // namespace dhtnode
