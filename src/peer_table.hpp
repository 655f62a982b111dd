#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log.hpp"

struct PeerAddress {
  std::string host;
  uint16_t port = 0;

  std::string to_string() const { return host + ":" + std::to_string(port); }
  bool operator==(const PeerAddress& other) const { return host == other.host && port == other.port; }
  bool operator!=(const PeerAddress& other) const { return !(*this == other); }
  bool operator<(const PeerAddress& other) const {
    if(host != other.host) return host < other.host;
    return port < other.port;
  }
};

struct PeerRecord {
  using Clock = std::chrono::steady_clock;

  PeerAddress address;
  std::string token;
  Clock::time_point last_seen{};
  bool alive = false;
  Clock::time_point not_alive_since{}; // valid while !alive
};

// Membership state shared by the discovery beacon (writer) and the sync
// orchestrator (reader). Records are keyed by address; every call locks
// once and never performs I/O. Callers pass the current time so that expiry
// can be driven by a simulated clock.
class PeerTable {
public:
  using Clock = PeerRecord::Clock;

  PeerTable(std::string local_token,
            std::chrono::milliseconds expiry_window,
            std::chrono::milliseconds removal_window,
            std::shared_ptr<Logger> logger = nullptr);

  // Identity used for self-filtering. The bound address is learned after
  // the transfer port is open.
  void set_local_address(const PeerAddress& address);

  void record_announcement(const PeerAddress& address,
                           const std::string& token,
                           Clock::time_point now);
  void record_announcement(const PeerAddress& address, Clock::time_point now) {
    record_announcement(address, std::string(), now);
  }

  // Marks silent peers not-alive and drops long-dead ones. Returns the
  // number of records whose state changed.
  std::size_t sweep_expired(Clock::time_point now);

  std::vector<PeerAddress> snapshot_alive_peers() const;
  std::vector<PeerRecord> records() const;

  std::size_t known_count() const;
  std::size_t alive_count() const;

  const std::string& local_token() const { return local_token_; }
  std::chrono::milliseconds expiry_window() const { return expiry_window_; }
  std::chrono::milliseconds removal_window() const { return removal_window_; }

private:
  bool is_self(const PeerRecord& record) const;

  const std::string local_token_;
  const std::chrono::milliseconds expiry_window_;
  const std::chrono::milliseconds removal_window_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  PeerAddress local_address_;
  std::map<PeerAddress, PeerRecord> peers_;
};
