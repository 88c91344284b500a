// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace dhtnode {
namespace util {

/**
 * ShutdownSignal - one-shot cancellation source
 *
 * - Trigger() may be called from any thread (signal handler thread, RPC,
 *   tests); only the first call fires the callbacks
 * - Callbacks run on the triggering thread, outside the internal lock.
 *   Consumers that live on an io_context must re-post onto it.
 * - Subscribing after the signal fired runs the callback immediately
 * - Subscriptions are RAII: destroying the handle unregisters the callback
 */
class ShutdownSignal {
public:
  using Callback = std::function<void()>;

  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class ShutdownSignal;
    Subscription(ShutdownSignal *owner, size_t id);

    ShutdownSignal *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  ShutdownSignal() = default;
  ShutdownSignal(const ShutdownSignal &) = delete;
  ShutdownSignal &operator=(const ShutdownSignal &) = delete;

  // Fire the signal. Returns false if it had already fired.
  bool Trigger();

  bool IsTriggered() const { return triggered_.load(std::memory_order_acquire); }

  [[nodiscard]] Subscription OnTriggered(Callback callback);

  size_t SubscriberCount() const;

private:
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    Callback callback;
  };

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
  std::atomic<bool> triggered_{false};
};

} // namespace util
} // namespace dhtnode
