// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "simulated_overlay.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <array>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <limits>

namespace dhtnode {
namespace sim {

namespace {
constexpr size_t SELF_INDEX = std::numeric_limits<size_t>::max();
}

class SimulatedOverlay::Session : public dht::PeerSession {
public:
  Session(std::weak_ptr<SimulatedOverlay> overlay, const dht::NodeId &peer_id)
      : overlay_(std::move(overlay)), peer_id_(peer_id) {}

  const dht::NodeId &peer_id() const override { return peer_id_; }

  void RequestPeers(size_t max_peers, dht::PeerSyncCallback callback) override {
    auto overlay = overlay_.lock();
    if (!overlay || closed_) {
      dht::PeerSyncResult result;
      result.error = "session closed";
      callback(std::move(result));
      return;
    }

    auto records = overlay->TableOf(peer_id_, max_peers);
    overlay->After(overlay->RandomLatency(),
                   [callback = std::move(callback), records = std::move(records)]() mutable {
                     dht::PeerSyncResult result;
                     result.success = true;
                     result.peers = std::move(records);
                     callback(std::move(result));
                   });
  }

  void Close() override { closed_ = true; }

private:
  std::weak_ptr<SimulatedOverlay> overlay_;
  dht::NodeId peer_id_;
  bool closed_{false};
};

SimulatedOverlay::SimulatedOverlay(boost::asio::io_context &io_context,
                                   const dht::NodeId &self_id, OverlayParams params)
    : io_context_(io_context), self_id_(self_id), params_(params),
      rng_(params.seed != 0 ? params.seed : std::random_device{}()) {
  peers_.reserve(params_.num_peers);
  for (size_t i = 0; i < params_.num_peers; ++i) {
    dht::PeerRecord record;
    std::array<uint8_t, dht::NodeId::SIZE> bytes;
    for (auto &b : bytes) {
      b = static_cast<uint8_t>(rng_() & 0xff);
    }
    record.node_id = dht::NodeId(bytes);
    record.addresses.push_back("10." + std::to_string((i >> 16) & 0xff) + "." +
                               std::to_string((i >> 8) & 0xff) + "." +
                               std::to_string(i & 0xff) + ":9590");
    record.last_seen = 1700000000 + static_cast<int64_t>(i);
    peers_.push_back(std::move(record));
  }

  // Routing tables: mostly the closest peers, topped up with random ones
  const size_t closest_count = params_.table_size * 3 / 4;
  std::vector<size_t> order(peers_.size());
  for (size_t i = 0; i < peers_.size(); ++i) {
    const auto &owner = peers_[i].node_id;
    for (size_t j = 0; j < order.size(); ++j) {
      order[j] = j;
    }
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
      return dht::NodeId::IsCloser(peers_[a].node_id, peers_[b].node_id, owner);
    });

    std::vector<size_t> table;
    for (size_t j : order) {
      if (j == i) {
        continue;
      }
      if (table.size() >= closest_count) {
        break;
      }
      table.push_back(j);
    }

    // Nodes close to us know about us
    if (!table.empty() && dht::NodeId::IsCloser(self_id_, peers_[table.back()].node_id, owner) &&
        table.size() < params_.table_size) {
      table.push_back(SELF_INDEX);
    }

    std::uniform_int_distribution<size_t> pick(0, peers_.size() - 1);
    size_t attempts = 0;
    while (table.size() < params_.table_size && attempts++ < params_.table_size * 4) {
      size_t j = pick(rng_);
      if (j != i && std::find(table.begin(), table.end(), j) == table.end()) {
        table.push_back(j);
      }
    }
    tables_[owner] = std::move(table);
  }

  LOG_APP_INFO("Simulated overlay: {} peers, table size {}, dial failure rate {:.2f}",
               peers_.size(), params_.table_size, params_.dial_failure_rate);
}

void SimulatedOverlay::WaitForOnline(std::chrono::milliseconds /*timeout*/,
                                     dht::OnlineCallback callback) {
  boost::asio::post(io_context_, [callback = std::move(callback)]() { callback(true); });
}

void SimulatedOverlay::DialPeer(const dht::NodeId &peer_id, dht::DialCallback callback) {
  bool fail;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++dials_;
    std::bernoulli_distribution failure(params_.dial_failure_rate);
    fail = failure(rng_) || tables_.find(peer_id) == tables_.end();
    if (fail) {
      ++failed_dials_;
    }
  }
  const auto latency = RandomLatency();

  if (fail) {
    After(latency, [callback = std::move(callback)]() { callback(nullptr, "connection refused"); });
    return;
  }

  auto session = std::make_shared<Session>(weak_from_this(), peer_id);
  After(latency, [callback = std::move(callback), session]() { callback(session, ""); });
}

size_t SimulatedOverlay::dials() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dials_;
}

size_t SimulatedOverlay::failed_dials() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_dials_;
}

std::vector<dht::PeerRecord> SimulatedOverlay::TableOf(const dht::NodeId &id, size_t max_peers) {
  std::vector<dht::PeerRecord> records;
  auto it = tables_.find(id);
  if (it == tables_.end()) {
    return records;
  }
  for (size_t index : it->second) {
    if (records.size() >= max_peers) {
      break;
    }
    if (index == SELF_INDEX) {
      dht::PeerRecord self;
      self.node_id = self_id_;
      self.addresses.push_back("127.0.0.1:9590");
      records.push_back(std::move(self));
    } else {
      records.push_back(peers_[index]);
    }
  }
  return records;
}

std::chrono::milliseconds SimulatedOverlay::RandomLatency() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uniform_int_distribution<int64_t> dist(params_.min_latency.count(),
                                              std::max(params_.min_latency.count(),
                                                       params_.max_latency.count()));
  return std::chrono::milliseconds(dist(rng_));
}

void SimulatedOverlay::After(std::chrono::milliseconds delay, std::function<void()> fn) {
  auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, delay);
  timer->async_wait([timer, fn = std::move(fn)](const boost::system::error_code &ec) {
    if (!ec) {
      fn();
    }
  });
}

} // namespace sim
} // namespace dhtnode
