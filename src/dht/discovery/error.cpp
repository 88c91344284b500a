// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/error.hpp"

namespace dhtnode {
namespace dht {

std::string DiscoveryErrorKindToString(DiscoveryErrorKind kind) {
  switch (kind) {
  case DiscoveryErrorKind::InitializationFailed:
    return "InitializationFailed";
  case DiscoveryErrorKind::RoundFailed:
    return "RoundFailed";
  case DiscoveryErrorKind::SubsystemError:
    return "SubsystemError";
  }
  return "Unknown";
}

std::string DiscoveryError::ToString() const {
  if (message.empty()) {
    return DiscoveryErrorKindToString(kind);
  }
  return DiscoveryErrorKindToString(kind) + ": " + message;
}

} // namespace dht
} // namespace dhtnode
