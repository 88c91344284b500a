// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line values to numeric types with validation
 - Consistent error handling across the tools

 Key functions:
 - SafeParseInt / SafeParseInt64: integers with bounds checking
 - SafeParseSeconds: non-negative durations given in whole seconds
 - IsValidHex: hex digit validation (node ids)
 - SplitList: comma-separated option values (--debug=dht,network)

 All parsers validate the entire input is consumed and return std::nullopt
 on any error (no exceptions escape).
*/

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dhtnode {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("86400", 0, 1000000) -> 86400
 *   SafeParseInt64("999999999999999999999", 0, INT64_MAX) -> std::nullopt (overflow)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse a duration in whole seconds, bounded by max_seconds
 *
 * Examples:
 *   SafeParseSeconds("30") -> 30s
 *   SafeParseSeconds("-1") -> std::nullopt
 */
std::optional<std::chrono::seconds> SafeParseSeconds(const std::string& str,
                                                     int64_t max_seconds = 365LL * 24 * 3600);

/**
 * Validate hexadecimal string
 * @return true if non-empty and all characters are hex digits [0-9a-fA-F]
 */
bool IsValidHex(const std::string& str);

/**
 * Split a comma-separated list, dropping empty items
 *
 * Example:
 *   SplitList("dht,,network") -> {"dht", "network"}
 */
std::vector<std::string> SplitList(const std::string& str, char sep = ',');

} // namespace util
} // namespace dhtnode
