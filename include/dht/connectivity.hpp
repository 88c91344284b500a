// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/node_id.hpp"
#include "dht/peer.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dhtnode {
namespace dht {

// Abstract connectivity interface consumed by network discovery.
// Allows dependency injection of different implementations:
// - the node's real connection layer (sessions over the overlay transport)
// - SimulatedOverlay in tools/discovery_sim
// - MockConnectivity in test/dht/infra
//
// Callbacks may be invoked on any thread, and may be invoked synchronously
// from inside the call that registered them.

class PeerSession;
using PeerSessionPtr = std::shared_ptr<PeerSession>;

// Result of one peer-list request
struct PeerSyncResult {
  bool success{false};
  std::vector<PeerRecord> peers;
  std::string error; // set when !success
};

using OnlineCallback = std::function<void(bool online)>;
using DialCallback = std::function<void(PeerSessionPtr session, const std::string &error)>;
using PeerSyncCallback = std::function<void(PeerSyncResult result)>;

// PeerSession - an established, authenticated session with one peer over
// which the discovery protocol runs
class PeerSession {
public:
  virtual ~PeerSession() = default;

  virtual const NodeId &peer_id() const = 0;

  // Ask the remote peer for up to max_peers peer records
  virtual void RequestPeers(size_t max_peers, PeerSyncCallback callback) = 0;

  // Release the session. Pending RequestPeers callbacks may still fire
  // (typically with success == false).
  virtual void Close() = 0;
};

// Connectivity - establishes sessions with peers
class Connectivity {
public:
  virtual ~Connectivity() = default;

  virtual bool IsOnline() const = 0;

  // Callback fires once: true as soon as the node is online, false if the
  // timeout expires first
  virtual void WaitForOnline(std::chrono::milliseconds timeout, OnlineCallback callback) = 0;

  // Dial a peer. On failure the session is null and error is set.
  virtual void DialPeer(const NodeId &peer_id, DialCallback callback) = 0;
};

using ConnectivityPtr = std::shared_ptr<Connectivity>;

} // namespace dht
} // namespace dhtnode
