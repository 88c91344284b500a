// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace dhtnode {
namespace util {

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  // Reject empty or whitespace-leading strings (stoll would skip the whitespace)
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }
    if (value < min || value > max) {
      return std::nullopt;
    }
    return static_cast<int64_t>(value);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<std::chrono::seconds> SafeParseSeconds(const std::string& str, int64_t max_seconds) {
  auto value = SafeParseInt64(str, 0, max_seconds);
  if (!value) {
    return std::nullopt;
  }
  return std::chrono::seconds(*value);
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> SplitList(const std::string& str, char sep) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(sep, pos);
    if (next == std::string::npos) {
      next = str.size();
    }
    if (next > pos) {
      items.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return items;
}

} // namespace util
} // namespace dhtnode
