// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/peer.hpp"
#include <algorithm>

namespace dhtnode {
namespace dht {

bool PeerRecord::IsValid() const {
  if (node_id.IsNull()) {
    return false;
  }
  return std::any_of(addresses.begin(), addresses.end(),
                     [](const std::string &a) { return !a.empty(); });
}

std::string PeerRecord::ToString() const {
  std::string out = node_id.ShortString();
  if (!addresses.empty()) {
    out += "@" + addresses.front();
    if (addresses.size() > 1) {
      out += "(+" + std::to_string(addresses.size() - 1) + ")";
    }
  }
  return out;
}

} // namespace dht
} // namespace dhtnode
