// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/node_id.hpp"
#include "util/string_parsing.hpp"
#include <mutex>
#include <random>

namespace dhtnode {
namespace dht {

static constexpr char kHexDigits[] = "0123456789abcdef";

static int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string NodeId::ToString() const {
  std::string out;
  out.reserve(SIZE * 2);
  for (uint8_t b : data_) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0f]);
  }
  return out;
}

std::string NodeId::ShortString() const {
  return ToString().substr(0, 8);
}

std::optional<NodeId> NodeId::FromHex(const std::string &hex) {
  if (hex.size() != SIZE * 2 || !util::IsValidHex(hex)) {
    return std::nullopt;
  }

  Bytes bytes;
  for (size_t i = 0; i < SIZE; ++i) {
    bytes[i] = static_cast<uint8_t>((HexValue(hex[2 * i]) << 4) | HexValue(hex[2 * i + 1]));
  }
  return NodeId(bytes);
}

NodeId NodeId::Random() {
  // static random_device: some platforms open /dev/urandom per instance
  static std::random_device rd;
  static std::mutex rng_mutex;
  static std::mt19937_64 gen(rd());

  Bytes bytes;
  std::lock_guard<std::mutex> lock(rng_mutex);
  for (size_t i = 0; i < SIZE; i += sizeof(uint64_t)) {
    uint64_t word = gen();
    std::memcpy(bytes.data() + i, &word, sizeof(word));
  }
  return NodeId(bytes);
}

NodeId NodeId::Distance(const NodeId &a, const NodeId &b) {
  Bytes out;
  for (size_t i = 0; i < SIZE; ++i) {
    out[i] = a.data_[i] ^ b.data_[i];
  }
  return NodeId(out);
}

} // namespace dht
} // namespace dhtnode
