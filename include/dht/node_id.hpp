// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <string>

namespace dhtnode {
namespace dht {

/**
 * NodeId - fixed-size opaque overlay identifier
 *
 * Closeness in the overlay is measured with the XOR metric: the distance
 * between two ids is their bytewise XOR, compared lexicographically
 * (most significant byte first).
 */
class NodeId {
public:
  static constexpr size_t SIZE = 32;
  using Bytes = std::array<uint8_t, SIZE>;

  constexpr NodeId() : data_() {}
  explicit NodeId(const Bytes &bytes) : data_(bytes) {}

  bool IsNull() const {
    return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
  }

  void SetNull() { data_.fill(0); }

  int Compare(const NodeId &other) const {
    return std::memcmp(data_.data(), other.data_.data(), SIZE);
  }

  friend bool operator==(const NodeId &a, const NodeId &b) { return a.Compare(b) == 0; }
  friend bool operator!=(const NodeId &a, const NodeId &b) { return a.Compare(b) != 0; }
  friend bool operator<(const NodeId &a, const NodeId &b) { return a.Compare(b) < 0; }

  const Bytes &bytes() const { return data_; }
  const uint8_t *data() const { return data_.data(); }

  // Lowercase hex, most significant byte first
  std::string ToString() const;

  // First 8 hex chars, for log lines
  std::string ShortString() const;

  // Parse exactly SIZE*2 hex characters
  static std::optional<NodeId> FromHex(const std::string &hex);

  static NodeId Random();

  // XOR distance between two ids
  static NodeId Distance(const NodeId &a, const NodeId &b);

  // True if a is strictly closer to target than b
  static bool IsCloser(const NodeId &a, const NodeId &b, const NodeId &target) {
    return Distance(a, target) < Distance(b, target);
  }

private:
  Bytes data_;
};

struct NodeIdHasher {
  size_t operator()(const NodeId &id) const noexcept {
    // Ids are uniformly distributed; the first word is a fine hash
    size_t h;
    std::memcpy(&h, id.data(), sizeof(h));
    return h;
  }
};

} // namespace dht
} // namespace dhtnode
