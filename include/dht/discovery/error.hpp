// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace dhtnode {
namespace dht {

// Kinds of failure that abort a discovery step. Per-peer failures during a
// round are never represented here; they are counted in RoundInfo.
enum class DiscoveryErrorKind {
  InitializationFailed, // startup precondition not met (identity, connectivity)
  RoundFailed,          // the round as a whole could not proceed
  SubsystemError        // any other failure surfaced by a collaborator
};

std::string DiscoveryErrorKindToString(DiscoveryErrorKind kind);

struct DiscoveryError {
  DiscoveryErrorKind kind{DiscoveryErrorKind::SubsystemError};
  std::string message;

  DiscoveryError() = default;
  DiscoveryError(DiscoveryErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

  static DiscoveryError InitializationFailed(std::string msg) {
    return {DiscoveryErrorKind::InitializationFailed, std::move(msg)};
  }
  static DiscoveryError RoundFailed(std::string msg) {
    return {DiscoveryErrorKind::RoundFailed, std::move(msg)};
  }
  static DiscoveryError Subsystem(std::string msg) {
    return {DiscoveryErrorKind::SubsystemError, std::move(msg)};
  }

  // "RoundFailed: no sync peers"
  std::string ToString() const;
};

} // namespace dht
} // namespace dhtnode
