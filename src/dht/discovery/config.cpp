// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/config.hpp"
#include <fstream>
#include <stdexcept>

namespace dhtnode {
namespace dht {

namespace {

// Non-negative integer field, or throw naming the key
int64_t ReadCount(const nlohmann::json &j, const char *key) {
  const auto &v = j.at(key);
  if (!v.is_number_integer()) {
    throw std::runtime_error(std::string("network_discovery.") + key + " must be an integer");
  }
  int64_t value = v.get<int64_t>();
  if (value < 0) {
    throw std::runtime_error(std::string("network_discovery.") + key + " must not be negative");
  }
  return value;
}

void ReadSize(const nlohmann::json &j, const char *key, size_t &out) {
  if (j.contains(key)) {
    out = static_cast<size_t>(ReadCount(j, key));
  }
}

void ReadSeconds(const nlohmann::json &j, const char *key, std::chrono::seconds &out) {
  if (j.contains(key)) {
    const int64_t value = ReadCount(j, key);
    if (value > NetworkDiscoveryConfig::MAX_PERIOD.count()) {
      throw std::runtime_error(std::string("network_discovery.") + key + " must be at most " +
                               std::to_string(NetworkDiscoveryConfig::MAX_PERIOD.count()) + "s");
    }
    out = std::chrono::seconds(value);
  }
}

void CheckPeriod(const char *key, std::chrono::seconds value) {
  if (value.count() < 0 || value > NetworkDiscoveryConfig::MAX_PERIOD) {
    throw std::runtime_error(std::string("network_discovery.") + key + " must be between 0 and " +
                             std::to_string(NetworkDiscoveryConfig::MAX_PERIOD.count()) + "s");
  }
}

} // namespace

void NetworkDiscoveryConfig::Validate() const {
  if (max_sync_peers == 0) {
    throw std::runtime_error("network_discovery.max_sync_peers must be at least 1");
  }
  if (max_peers_to_sync_per_round == 0) {
    throw std::runtime_error("network_discovery.max_peers_to_sync_per_round must be at least 1");
  }
  if (idle_after_num_rounds == 0) {
    throw std::runtime_error("network_discovery.idle_after_num_rounds must be at least 1");
  }
  if (event_channel_capacity == 0) {
    throw std::runtime_error("network_discovery.event_channel_capacity must be at least 1");
  }
  CheckPeriod("idle_period", idle_period);
  CheckPeriod("on_failure_idle_period", on_failure_idle_period);
  CheckPeriod("connectivity_wait_timeout", connectivity_wait_timeout);
  // A zero backoff turns a persistent failure into a busy loop
  if (on_failure_idle_period.count() == 0) {
    throw std::runtime_error("network_discovery.on_failure_idle_period must be non-zero");
  }
}

NetworkDiscoveryConfig NetworkDiscoveryConfig::LoadFromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("network_discovery config must be a JSON object");
  }

  NetworkDiscoveryConfig config;

  if (j.contains("enabled")) {
    if (!j.at("enabled").is_boolean()) {
      throw std::runtime_error("network_discovery.enabled must be a boolean");
    }
    config.enabled = j.at("enabled").get<bool>();
  }

  ReadSize(j, "min_desired_peers", config.min_desired_peers);
  ReadSeconds(j, "idle_period", config.idle_period);
  ReadSize(j, "idle_after_num_rounds", config.idle_after_num_rounds);
  ReadSeconds(j, "on_failure_idle_period", config.on_failure_idle_period);
  ReadSize(j, "max_sync_peers", config.max_sync_peers);
  ReadSize(j, "max_peers_to_sync_per_round", config.max_peers_to_sync_per_round);
  ReadSize(j, "num_neighbouring_nodes", config.num_neighbouring_nodes);
  ReadSeconds(j, "connectivity_wait_timeout", config.connectivity_wait_timeout);
  ReadSize(j, "event_channel_capacity", config.event_channel_capacity);

  return config;
}

NetworkDiscoveryConfig NetworkDiscoveryConfig::LoadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("invalid JSON in " + path + ": " + e.what());
  }

  if (j.is_object() && j.contains("network_discovery")) {
    return LoadFromJson(j.at("network_discovery"));
  }
  return LoadFromJson(j);
}

nlohmann::json NetworkDiscoveryConfig::ToJson() const {
  nlohmann::json j;
  j["enabled"] = enabled;
  j["min_desired_peers"] = min_desired_peers;
  j["idle_period"] = idle_period.count();
  j["idle_after_num_rounds"] = idle_after_num_rounds;
  j["on_failure_idle_period"] = on_failure_idle_period.count();
  j["max_sync_peers"] = max_sync_peers;
  j["max_peers_to_sync_per_round"] = max_peers_to_sync_per_round;
  j["num_neighbouring_nodes"] = num_neighbouring_nodes;
  j["connectivity_wait_timeout"] = connectivity_wait_timeout.count();
  j["event_channel_capacity"] = event_channel_capacity;
  return j;
}

} // namespace dht
} // namespace dhtnode
