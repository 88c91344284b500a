// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace dhtnode {
namespace dht {

// Network discovery configuration. Read-only once handed to the context.
struct NetworkDiscoveryConfig {
  // Upper bound for every period; keeps timer arithmetic in range
  static constexpr std::chrono::seconds MAX_PERIOD{std::chrono::hours(24 * 365)};

  // Gate for the whole subsystem. When false the loop never starts.
  bool enabled{true};

  // Below this many known peers, Ready always begins another round
  size_t min_desired_peers{16};

  // Delay after Ready decides there is nothing to do
  std::chrono::seconds idle_period{std::chrono::minutes(30)};

  // Rounds per cycle before Ready forces an idle period
  size_t idle_after_num_rounds{10};

  // Backoff after an error or an unsuccessful round
  std::chrono::seconds on_failure_idle_period{std::chrono::seconds(5)};

  // Candidates contacted per round
  size_t max_sync_peers{5};

  // Peers requested from each candidate
  size_t max_peers_to_sync_per_round{500};

  // Size of our neighbourhood, and the cap on new closer peers accepted per round
  size_t num_neighbouring_nodes{8};

  // How long Initializing waits for connectivity before erroring
  std::chrono::seconds connectivity_wait_timeout{std::chrono::seconds(10)};

  // Per-subscriber event queue depth
  size_t event_channel_capacity{100};

  /**
   * Check invariants between fields
   * @throws std::runtime_error naming the offending field
   */
  void Validate() const;

  /**
   * Overlay values from a JSON object onto the defaults
   *
   * Durations are given in whole seconds. Unknown keys are ignored so that a
   * node-wide config file can be passed in directly.
   *
   * @throws std::runtime_error on wrong types or negative values
   */
  static NetworkDiscoveryConfig LoadFromJson(const nlohmann::json &j);

  // Load from a file containing either the discovery object itself or an
  // object with a "network_discovery" member
  static NetworkDiscoveryConfig LoadFromFile(const std::string &path);

  nlohmann::json ToJson() const;
};

} // namespace dht
} // namespace dhtnode
