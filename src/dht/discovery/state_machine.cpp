// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/discovery/state_machine.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <stdexcept>

namespace dhtnode {
namespace dht {

std::string StateToString(const State &state) {
  if (std::holds_alternative<states::Initializing>(state)) {
    return "Initializing";
  }
  if (std::holds_alternative<std::shared_ptr<DiscoveryReady>>(state)) {
    return "Ready";
  }
  if (std::holds_alternative<std::shared_ptr<Discovering>>(state)) {
    return "Discovering";
  }
  if (const auto *waiting = std::get_if<std::shared_ptr<Waiting>>(&state)) {
    const auto ms = (*waiting)->duration().count();
    if (ms % 1000 == 0) {
      return "Waiting(" + std::to_string(ms / 1000) + "s)";
    }
    return "Waiting(" + std::to_string(ms) + "ms)";
  }
  return "Shutdown";
}

std::shared_ptr<DhtNetworkDiscovery>
DhtNetworkDiscovery::Create(DiscoveryContext context, DhtEventPublisherPtr publisher,
                            std::shared_ptr<util::ShutdownSignal> shutdown) {
  if (!publisher) {
    throw std::invalid_argument("DhtNetworkDiscovery requires an event publisher");
  }
  if (!shutdown) {
    throw std::invalid_argument("DhtNetworkDiscovery requires a shutdown signal");
  }
  context.config().Validate();
  return std::shared_ptr<DhtNetworkDiscovery>(
      new DhtNetworkDiscovery(std::move(context), std::move(publisher), std::move(shutdown)));
}

DhtNetworkDiscovery::DhtNetworkDiscovery(DiscoveryContext context, DhtEventPublisherPtr publisher,
                                         std::shared_ptr<util::ShutdownSignal> shutdown)
    : context_(std::move(context)), publisher_(std::move(publisher)),
      shutdown_(std::move(shutdown)) {}

DhtNetworkDiscovery::~DhtNetworkDiscovery() {
  CancelActiveHandler();
}

bool DhtNetworkDiscovery::Start() {
  if (!context_.config().enabled) {
    LOG_DHT_WARN("Network discovery is disabled");
    return false;
  }

  if (running_.exchange(true, std::memory_order_acq_rel)) {
    LOG_DHT_DEBUG("Network discovery already running");
    return false;
  }

  auto &io = context_.io_context();

  state_ = states::Initializing{};
  initializing_.reset();
  awaiting_ = false;

  // Keep io_context::run() alive while every handler is idle (e.g. between
  // a cancelled timer and the next step)
  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io));

  shutdown_subscription_ = shutdown_->OnTriggered([weak = weak_from_this(), &io]() {
    boost::asio::post(io, [weak]() {
      if (auto self = weak.lock()) {
        self->OnShutdownSignal();
      }
    });
  });

  const auto &identity = context_.node_identity();
  LOG_DHT_INFO("Starting network discovery for node {}", identity.node_id.ShortString());

  PostStep();
  return true;
}

void DhtNetworkDiscovery::PostStep() {
  boost::asio::post(context_.io_context(), [weak = weak_from_this()]() {
    if (auto self = weak.lock()) {
      self->Step();
    }
  });
}

void DhtNetworkDiscovery::Step() {
  if (!IsRunning()) {
    return;
  }

  const uint64_t token = ++step_token_;
  awaiting_ = true;

  if (shutdown_->IsTriggered()) {
    OnEvent(token, events::Shutdown{});
    return;
  }

  auto callback = [weak = weak_from_this(), token](StateEvent event) {
    if (auto self = weak.lock()) {
      self->OnEvent(token, std::move(event));
    }
  };

  // Handlers are held by a local reference: a synchronous completion runs
  // Transition(), which replaces state_
  try {
    if (std::holds_alternative<states::Initializing>(state_)) {
      initializing_ = std::make_shared<Initializing>(context_);
      auto handler = initializing_;
      handler->NextEvent(std::move(callback));
    } else if (auto *ready = std::get_if<std::shared_ptr<DiscoveryReady>>(&state_)) {
      auto handler = *ready;
      handler->NextEvent(std::move(callback));
    } else if (auto *discovering = std::get_if<std::shared_ptr<Discovering>>(&state_)) {
      auto handler = *discovering;
      handler->NextEvent(std::move(callback));
    } else if (auto *waiting = std::get_if<std::shared_ptr<Waiting>>(&state_)) {
      auto handler = *waiting;
      handler->NextEvent(std::move(callback));
    } else {
      // Shutdown has no handler
      OnEvent(token, events::Shutdown{});
    }
  } catch (const std::exception &e) {
    CancelActiveHandler();
    OnEvent(token, events::Errored{DiscoveryError::Subsystem(e.what())});
  }
}

void DhtNetworkDiscovery::OnEvent(uint64_t token, StateEvent event) {
  if (token != step_token_ || !awaiting_) {
    LOG_DHT_TRACE("Dropping stale event {}", StateEventToString(event));
    return;
  }
  awaiting_ = false;

  state_ = Transition(std::move(state_), std::move(event));

  if (!std::holds_alternative<states::Initializing>(state_)) {
    initializing_.reset();
  }

  if (IsShutdown(state_)) {
    Stop();
    return;
  }

  PostStep();
}

void DhtNetworkDiscovery::OnShutdownSignal() {
  if (!IsRunning() || !awaiting_) {
    // Not inside a step; the next Step() observes the signal
    return;
  }

  LOG_DHT_DEBUG("Shutdown requested while {}", StateToString(state_));
  CancelActiveHandler();
  OnEvent(step_token_, events::Shutdown{});
}

void DhtNetworkDiscovery::CancelActiveHandler() {
  if (initializing_) {
    initializing_->Cancel();
  }
  if (auto *ready = std::get_if<std::shared_ptr<DiscoveryReady>>(&state_)) {
    (*ready)->Cancel();
  } else if (auto *discovering = std::get_if<std::shared_ptr<Discovering>>(&state_)) {
    (*discovering)->Cancel();
  } else if (auto *waiting = std::get_if<std::shared_ptr<Waiting>>(&state_)) {
    (*waiting)->Cancel();
  }
}

void DhtNetworkDiscovery::Stop() {
  running_.store(false, std::memory_order_release);
  CancelActiveHandler();
  initializing_.reset();
  shutdown_subscription_.Unsubscribe();

  if (work_guard_) {
    work_guard_.reset();
  }

  LOG_DHT_INFO("Network discovery stopped after {} round(s) this cycle", context_.RoundCount());

  if (stopped_callback_) {
    auto callback = std::move(stopped_callback_);
    stopped_callback_ = nullptr;
    callback();
  }
}

std::shared_ptr<DiscoveryReady>
DhtNetworkDiscovery::MakeReady(std::optional<RoundInfo> last_round) const {
  return std::make_shared<DiscoveryReady>(context_, std::move(last_round));
}

std::shared_ptr<Waiting> DhtNetworkDiscovery::MakeWaiting(std::chrono::seconds duration) const {
  return std::make_shared<Waiting>(context_.io_context(),
                                   std::chrono::duration_cast<std::chrono::milliseconds>(duration));
}

State DhtNetworkDiscovery::Transition(State current, StateEvent event) {
  const auto &config = context_.config();

  LOG_DHT_DEBUG("Transition: state = {}, event = {}", StateToString(current),
                StateEventToString(event));

  // Shutdown is absorbing
  if (IsShutdown(current)) {
    return states::Shutdown{};
  }

  if (std::holds_alternative<states::Initializing>(current) &&
      std::holds_alternative<events::Initialized>(event)) {
    return MakeReady(std::nullopt);
  }

  if (std::holds_alternative<events::Ready>(event)) {
    return MakeReady(std::nullopt);
  }

  if (std::holds_alternative<std::shared_ptr<DiscoveryReady>>(current)) {
    if (auto *begin = std::get_if<events::BeginDiscovery>(&event)) {
      return std::make_shared<Discovering>(context_, std::move(begin->params));
    }
  }

  if (std::holds_alternative<std::shared_ptr<Discovering>>(current)) {
    if (auto *complete = std::get_if<events::DiscoveryComplete>(&event)) {
      auto &info = complete->info;
      if (info.has_new_peers()) {
        const size_t receivers = publisher_->Publish(DhtEvent::NetworkDiscoveryPeersAdded(info));
        if (receivers == 0) {
          LOG_DHT_TRACE("No subscribers for NetworkDiscoveryPeersAdded");
        }
      }
      if (!info.is_success()) {
        LOG_DHT_DEBUG("Discovery round contacted no peers successfully, backing off");
        return MakeWaiting(config.on_failure_idle_period);
      }
      return MakeReady(std::move(info));
    }
  }

  if (std::holds_alternative<std::shared_ptr<DiscoveryReady>>(current) &&
      std::holds_alternative<events::Idle>(event)) {
    return MakeWaiting(config.idle_period);
  }

  if (std::holds_alternative<events::Shutdown>(event)) {
    return states::Shutdown{};
  }

  if (const auto *errored = std::get_if<events::Errored>(&event)) {
    LOG_DHT_ERROR("Network discovery error in state {}: {}", StateToString(current),
                  errored->error.ToString());
    return MakeWaiting(config.on_failure_idle_period);
  }

  LOG_DHT_DEBUG("No transition for event {} in state {}", StateEventToString(event),
                StateToString(current));
  ++unmatched_transitions_;
  return current;
}

} // namespace dht
} // namespace dhtnode
