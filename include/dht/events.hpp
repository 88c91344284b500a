// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dht/discovery/round_info.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dhtnode {
namespace dht {

// Externally visible DHT notification
struct DhtEvent {
  enum class Type {
    NetworkDiscoveryPeersAdded // round_info of the round that found new peers
  };

  Type type;
  DhtNetworkDiscoveryRoundInfo round_info;

  static DhtEvent NetworkDiscoveryPeersAdded(DhtNetworkDiscoveryRoundInfo info) {
    return DhtEvent{Type::NetworkDiscoveryPeersAdded, std::move(info)};
  }

  std::string ToString() const;
};

using DhtEventPtr = std::shared_ptr<const DhtEvent>;

/**
 * DhtEventPublisher - multi-subscriber, lossy broadcast channel
 *
 * Design:
 * - Each subscriber owns a bounded queue. Publish() appends to every queue
 *   and returns; it never waits for a consumer.
 * - A full queue drops its oldest event and bumps that subscriber's lag
 *   counter. Slow or absent subscribers never block the producer.
 * - Publishing with zero subscribers is not an error (returns 0).
 * - Subscriptions are RAII: destroying the handle detaches the queue.
 *
 * Thread-safety: Publish() and Subscribe() may be called from any thread.
 * A single Subscription must not be received from concurrently.
 */
class DhtEventPublisher {
  struct Queue;

public:
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Next event if one is queued
    std::optional<DhtEventPtr> TryReceive();

    // Block up to timeout for the next event
    std::optional<DhtEventPtr> Receive(std::chrono::milliseconds timeout);

    size_t Pending() const;

    // Events dropped because this subscriber fell behind
    uint64_t Lagged() const;

    bool IsActive() const { return queue_ != nullptr; }

    void Unsubscribe();

  private:
    friend class DhtEventPublisher;
    Subscription(std::shared_ptr<DhtEventPublisher> owner, std::shared_ptr<Queue> queue);

    std::weak_ptr<DhtEventPublisher> owner_;
    std::shared_ptr<Queue> queue_;
  };

  static std::shared_ptr<DhtEventPublisher> Create(size_t capacity);

  DhtEventPublisher(const DhtEventPublisher &) = delete;
  DhtEventPublisher &operator=(const DhtEventPublisher &) = delete;

  [[nodiscard]] Subscription Subscribe();

  // Broadcast to all current subscribers. Returns how many received it.
  size_t Publish(DhtEvent event);

  size_t SubscriberCount() const;
  size_t capacity() const { return capacity_; }

private:
  explicit DhtEventPublisher(size_t capacity);

  void Detach(const std::shared_ptr<Queue> &queue);

  struct Queue {
    explicit Queue(size_t cap) : capacity(cap) {}

    const size_t capacity;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<DhtEventPtr> events;
    uint64_t lagged{0};
  };

  // weak self, so Subscriptions can detach after the publisher is gone
  std::weak_ptr<DhtEventPublisher> self_;
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Queue>> queues_;
};

using DhtEventPublisherPtr = std::shared_ptr<DhtEventPublisher>;

} // namespace dht
} // namespace dhtnode
