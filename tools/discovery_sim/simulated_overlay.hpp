// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/connectivity.hpp"
#include "dht/node_id.hpp"
#include "dht/peer.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace dhtnode {
namespace sim {

struct OverlayParams {
  size_t num_peers{200};
  size_t table_size{40};                       // peers each simulated node knows
  double dial_failure_rate{0.1};               // probability a dial fails
  std::chrono::milliseconds min_latency{5};
  std::chrono::milliseconds max_latency{50};
  uint64_t seed{0};                            // 0 = random
};

/**
 * SimulatedOverlay - in-process overlay network for dht_discovery_sim
 *
 * Every simulated node has a random id and a routing table made of its
 * closest peers plus a few random ones (roughly what a converged DHT looks
 * like). Dials and peer requests complete on the io_context after a random
 * latency; a configurable share of dials fail.
 */
class SimulatedOverlay : public dht::Connectivity,
                         public std::enable_shared_from_this<SimulatedOverlay> {
public:
  SimulatedOverlay(boost::asio::io_context &io_context, const dht::NodeId &self_id,
                   OverlayParams params);

  const std::vector<dht::PeerRecord> &peers() const { return peers_; }

  // Connectivity
  bool IsOnline() const override { return true; }
  void WaitForOnline(std::chrono::milliseconds timeout, dht::OnlineCallback callback) override;
  void DialPeer(const dht::NodeId &peer_id, dht::DialCallback callback) override;

  size_t dials() const;
  size_t failed_dials() const;

private:
  class Session;

  std::vector<dht::PeerRecord> TableOf(const dht::NodeId &id, size_t max_peers);
  std::chrono::milliseconds RandomLatency();
  void After(std::chrono::milliseconds delay, std::function<void()> fn);

  boost::asio::io_context &io_context_;
  dht::NodeId self_id_;
  OverlayParams params_;

  std::vector<dht::PeerRecord> peers_;
  std::map<dht::NodeId, std::vector<size_t>> tables_; // indexes into peers_, self included as SIZE_MAX

  mutable std::mutex mutex_;
  std::mt19937_64 rng_;
  size_t dials_{0};
  size_t failed_dials_{0};
};

} // namespace sim
} // namespace dhtnode
