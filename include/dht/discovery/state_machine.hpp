// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/discovery/context.hpp"
#include "dht/discovery/discovering.hpp"
#include "dht/discovery/initializing.hpp"
#include "dht/discovery/ready.hpp"
#include "dht/discovery/state_event.hpp"
#include "dht/discovery/waiting.hpp"
#include "dht/events.hpp"
#include "util/shutdown_signal.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace dhtnode {
namespace dht {

namespace states {
// Marker states. Initializing gets its handler from the driver on entry.
struct Initializing {};
struct Shutdown {};
} // namespace states

// Current phase of the discovery loop. Handler-backed states own their
// handler; the handler lives exactly as long as the state.
using State = std::variant<states::Initializing, std::shared_ptr<DiscoveryReady>,
                           std::shared_ptr<Discovering>, std::shared_ptr<Waiting>,
                           states::Shutdown>;

// "Initializing", "Ready", "Discovering", "Waiting(5s)", "Shutdown"
std::string StateToString(const State &state);

inline bool IsShutdown(const State &state) {
  return std::holds_alternative<states::Shutdown>(state);
}

/**
 * DhtNetworkDiscovery - drives the discovery state machine
 *
 * Each step asks the active state's handler for its next event, racing it
 * against the shutdown signal:
 *
 *   Initializing -> Ready -> Discovering -> Ready -> ... -> Waiting -> Ready
 *
 * The first completion wins; the loser is cancelled. The winning event is
 * fed through Transition() and the next step is posted, until the state
 * becomes Shutdown.
 *
 * Threading: everything runs on the context's io_context. Start() may be
 * called from any thread before or while the io_context runs. Accessors are
 * safe from the io_context thread, or from any thread once it has stopped.
 */
class DhtNetworkDiscovery : public std::enable_shared_from_this<DhtNetworkDiscovery> {
public:
  using StoppedCallback = std::function<void()>;

  /**
   * @throws std::invalid_argument if publisher or shutdown is null
   * @throws std::runtime_error if the configuration fails Validate()
   */
  static std::shared_ptr<DhtNetworkDiscovery> Create(DiscoveryContext context,
                                                     DhtEventPublisherPtr publisher,
                                                     std::shared_ptr<util::ShutdownSignal> shutdown);

  ~DhtNetworkDiscovery();

  DhtNetworkDiscovery(const DhtNetworkDiscovery &) = delete;
  DhtNetworkDiscovery &operator=(const DhtNetworkDiscovery &) = delete;

  /**
   * Begin the loop in Initializing
   * @return false if discovery is disabled or already running
   */
  bool Start();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  std::string CurrentStateName() const { return StateToString(state_); }

  size_t RoundCount() const { return context_.RoundCount(); }

  const DiscoveryContext &context() const { return context_; }

  // Invoked on the io_context thread once the loop reaches Shutdown
  void SetStoppedCallback(StoppedCallback callback) { stopped_callback_ = std::move(callback); }

  /**
   * Pure state transition. Side effects are limited to logging and event
   * publication. Shutdown is absorbing; (state, event) pairs with no rule
   * leave the state unchanged.
   */
  State Transition(State current, StateEvent event);

  // Number of (state, event) pairs that matched no rule
  uint64_t unmatched_transitions() const { return unmatched_transitions_; }

private:
  DhtNetworkDiscovery(DiscoveryContext context, DhtEventPublisherPtr publisher,
                      std::shared_ptr<util::ShutdownSignal> shutdown);

  void Step();
  void OnEvent(uint64_t token, StateEvent event);
  void OnShutdownSignal();
  void CancelActiveHandler();
  void Stop();
  void PostStep();

  std::shared_ptr<DiscoveryReady> MakeReady(std::optional<RoundInfo> last_round) const;
  std::shared_ptr<Waiting> MakeWaiting(std::chrono::seconds duration) const;

  DiscoveryContext context_;
  DhtEventPublisherPtr publisher_;
  std::shared_ptr<util::ShutdownSignal> shutdown_;

  State state_{states::Initializing{}};
  std::shared_ptr<Initializing> initializing_;

  // Identifies the step whose completion is awaited. Completions carrying
  // an older token lost the race and are dropped.
  uint64_t step_token_{0};
  bool awaiting_{false};

  std::atomic<bool> running_{false};
  uint64_t unmatched_transitions_{0};

  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  util::ShutdownSignal::Subscription shutdown_subscription_;
  StoppedCallback stopped_callback_;
};

} // namespace dht
} // namespace dhtnode
