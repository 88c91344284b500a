// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/discovery/state_event.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>

namespace dhtnode {
namespace dht {

// Waiting - sleeps for a fixed duration, then yields Ready.
// This is the only backoff in the discovery loop: failures and idle
// decisions both route through here with a configured delay.
class Waiting : public std::enable_shared_from_this<Waiting> {
public:
  Waiting(boost::asio::io_context &io_context, std::chrono::milliseconds duration);

  void NextEvent(StateEventCallback callback);

  // Cancels the timer; the pending callback never fires
  void Cancel();

  std::chrono::milliseconds duration() const { return duration_; }

private:
  std::chrono::milliseconds duration_;
  boost::asio::steady_timer timer_;
  EventCompletion completion_;
};

} // namespace dht
} // namespace dhtnode
