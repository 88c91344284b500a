// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/waiting.hpp"
#include "util/logging.hpp"

namespace dhtnode {
namespace dht {

Waiting::Waiting(boost::asio::io_context &io_context, std::chrono::milliseconds duration)
    : duration_(duration), timer_(io_context) {}

void Waiting::NextEvent(StateEventCallback callback) {
  completion_.Arm(std::move(callback));

  LOG_DHT_DEBUG("Waiting {}ms before next discovery step", duration_.count());

  timer_.expires_after(duration_);
  timer_.async_wait([weak = weak_from_this()](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    auto self = weak.lock();
    if (!self) {
      return;
    }
    self->completion_.Fire(events::Ready{});
  });
}

void Waiting::Cancel() {
  completion_.Cancel();
  timer_.cancel();
}

} // namespace dht
} // namespace dhtnode
