// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/state_event.hpp"

namespace dhtnode {
namespace dht {

std::string StateEventToString(const StateEvent &event) {
  if (std::holds_alternative<events::Initialized>(event)) {
    return "Initialized";
  }
  if (const auto *begin = std::get_if<events::BeginDiscovery>(&event)) {
    return "BeginDiscovery(" + begin->params.ToString() + ")";
  }
  if (std::holds_alternative<events::Ready>(event)) {
    return "Ready";
  }
  if (std::holds_alternative<events::Idle>(event)) {
    return "Idle";
  }
  if (const auto *complete = std::get_if<events::DiscoveryComplete>(&event)) {
    return "DiscoveryComplete(" + complete->info.ToString() + ")";
  }
  if (const auto *errored = std::get_if<events::Errored>(&event)) {
    return "Errored(" + errored->error.ToString() + ")";
  }
  return "Shutdown";
}

} // namespace dht
} // namespace dhtnode
