// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/shutdown_signal.hpp"
#include <algorithm>

namespace dhtnode {
namespace util {

// ============================================================================
// ShutdownSignal::Subscription
// ============================================================================

ShutdownSignal::Subscription::Subscription(ShutdownSignal *owner, size_t id)
    : owner_(owner), id_(id), active_(true) {}

ShutdownSignal::Subscription::~Subscription() { Unsubscribe(); }

ShutdownSignal::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

ShutdownSignal::Subscription &
ShutdownSignal::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void ShutdownSignal::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// ShutdownSignal
// ============================================================================

bool ShutdownSignal::Trigger() {
  std::vector<CallbackEntry> to_run;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (triggered_.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    to_run = callbacks_;
  }

  // Run outside the lock so callbacks may unsubscribe themselves
  for (const auto &entry : to_run) {
    if (entry.callback) {
      entry.callback();
    }
  }
  return true;
}

ShutdownSignal::Subscription ShutdownSignal::OnTriggered(Callback callback) {
  size_t id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    if (!triggered_.load(std::memory_order_acquire)) {
      callbacks_.push_back(CallbackEntry{id, std::move(callback)});
      return Subscription(this, id);
    }
  }

  // Already fired: run now, nothing to keep registered
  if (callback) {
    callback();
  }
  return Subscription(this, id);
}

size_t ShutdownSignal::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void ShutdownSignal::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry &e) { return e.id == id; }),
                   callbacks_.end());
}

} // namespace util
} // namespace dhtnode
