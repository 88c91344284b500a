// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dht/events.hpp"
#include <algorithm>

namespace dhtnode {
namespace dht {

std::string DhtEvent::ToString() const {
  switch (type) {
  case Type::NetworkDiscoveryPeersAdded:
    return "NetworkDiscoveryPeersAdded(" + round_info.ToString() + ")";
  }
  return "Unknown";
}

// ============================================================================
// DhtEventPublisher::Subscription
// ============================================================================

DhtEventPublisher::Subscription::Subscription(std::shared_ptr<DhtEventPublisher> owner,
                                              std::shared_ptr<Queue> queue)
    : owner_(owner), queue_(std::move(queue)) {}

DhtEventPublisher::Subscription::~Subscription() { Unsubscribe(); }

DhtEventPublisher::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(std::move(other.owner_)), queue_(std::move(other.queue_)) {
  other.queue_.reset();
}

DhtEventPublisher::Subscription &
DhtEventPublisher::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = std::move(other.owner_);
    queue_ = std::move(other.queue_);
    other.queue_.reset();
  }
  return *this;
}

void DhtEventPublisher::Subscription::Unsubscribe() {
  if (!queue_) {
    return;
  }
  if (auto owner = owner_.lock()) {
    owner->Detach(queue_);
  }
  queue_.reset();
  owner_.reset();
}

std::optional<DhtEventPtr> DhtEventPublisher::Subscription::TryReceive() {
  if (!queue_) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(queue_->mutex);
  if (queue_->events.empty()) {
    return std::nullopt;
  }
  DhtEventPtr event = std::move(queue_->events.front());
  queue_->events.pop_front();
  return event;
}

std::optional<DhtEventPtr>
DhtEventPublisher::Subscription::Receive(std::chrono::milliseconds timeout) {
  if (!queue_) {
    return std::nullopt;
  }
  std::unique_lock<std::mutex> lock(queue_->mutex);
  if (!queue_->cv.wait_for(lock, timeout, [this] { return !queue_->events.empty(); })) {
    return std::nullopt;
  }
  DhtEventPtr event = std::move(queue_->events.front());
  queue_->events.pop_front();
  return event;
}

size_t DhtEventPublisher::Subscription::Pending() const {
  if (!queue_) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(queue_->mutex);
  return queue_->events.size();
}

uint64_t DhtEventPublisher::Subscription::Lagged() const {
  if (!queue_) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(queue_->mutex);
  return queue_->lagged;
}

// ============================================================================
// DhtEventPublisher
// ============================================================================

std::shared_ptr<DhtEventPublisher> DhtEventPublisher::Create(size_t capacity) {
  std::shared_ptr<DhtEventPublisher> publisher(new DhtEventPublisher(capacity));
  publisher->self_ = publisher;
  return publisher;
}

DhtEventPublisher::DhtEventPublisher(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

DhtEventPublisher::Subscription DhtEventPublisher::Subscribe() {
  auto queue = std::make_shared<Queue>(capacity_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_.push_back(queue);
  }
  return Subscription(self_.lock(), std::move(queue));
}

size_t DhtEventPublisher::Publish(DhtEvent event) {
  auto shared = std::make_shared<const DhtEvent>(std::move(event));

  std::vector<std::shared_ptr<Queue>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets = queues_;
  }

  for (const auto &queue : targets) {
    {
      std::lock_guard<std::mutex> lock(queue->mutex);
      if (queue->events.size() >= queue->capacity) {
        queue->events.pop_front();
        ++queue->lagged;
      }
      queue->events.push_back(shared);
    }
    queue->cv.notify_one();
  }
  return targets.size();
}

size_t DhtEventPublisher::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queues_.size();
}

void DhtEventPublisher::Detach(const std::shared_ptr<Queue> &queue) {
  std::lock_guard<std::mutex> lock(mutex_);
  queues_.erase(std::remove(queues_.begin(), queues_.end(), queue), queues_.end());
}

} // namespace dht
} // namespace dhtnode
