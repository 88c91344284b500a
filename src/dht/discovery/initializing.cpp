// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/initializing.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>

namespace dhtnode {
namespace dht {

Initializing::Initializing(DiscoveryContext context) : context_(std::move(context)) {}

void Initializing::NextEvent(StateEventCallback callback) {
  completion_.Arm(std::move(callback));

  const auto &identity = context_.node_identity();
  if (identity.node_id.IsNull()) {
    completion_.Fire(events::Errored{
        DiscoveryError::InitializationFailed("node identity has a null node id")});
    return;
  }

  if (context_.connectivity().IsOnline()) {
    LOG_DHT_DEBUG("Node {} is online. Starting network discovery", identity.node_id.ShortString());
    completion_.Fire(events::Initialized{});
    return;
  }

  const auto timeout = context_.config().connectivity_wait_timeout;
  LOG_DHT_DEBUG("Waiting up to {}s for this node to come online...", timeout.count());

  // Connectivity may answer from any thread; hop back onto the loop
  auto &io = context_.io_context();
  context_.connectivity().WaitForOnline(
      std::chrono::duration_cast<std::chrono::milliseconds>(timeout),
      [weak = weak_from_this(), &io](bool online) {
        boost::asio::post(io, [weak, online]() {
          if (auto self = weak.lock()) {
            self->OnConnectivityResult(online);
          }
        });
      });
}

void Initializing::OnConnectivityResult(bool online) {
  if (completion_.cancelled()) {
    return;
  }

  if (!online) {
    completion_.Fire(events::Errored{DiscoveryError::InitializationFailed(
        "node did not come online within " +
        std::to_string(context_.config().connectivity_wait_timeout.count()) + "s")});
    return;
  }

  LOG_DHT_DEBUG("Node is online. Starting network discovery");
  completion_.Fire(events::Initialized{});
}

void Initializing::Cancel() {
  completion_.Cancel();
}

} // namespace dht
} // namespace dhtnode
