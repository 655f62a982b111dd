#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

#include "peer_table.hpp"
#include "protocol.hpp"

// Periodic multicast announce, perpetual listen and periodic peer-table
// sweep, all driven by the owner's io_context.
class DiscoveryBeacon {
public:
  using Clock = PeerTable::Clock;

  struct Options {
    std::string group = "239.255.255.250";
    uint16_t port = 5007;
    int ttl = 2;
    bool loopback = true;
    std::chrono::milliseconds interval{5000};
  };

  DiscoveryBeacon(asio::io_context& io,
                  Options options,
                  PeerTable& table,
                  std::string token,
                  std::shared_ptr<Logger> logger = nullptr);
  ~DiscoveryBeacon();

  DiscoveryBeacon(const DiscoveryBeacon&) = delete;
  DiscoveryBeacon& operator=(const DiscoveryBeacon&) = delete;

  // Port carried in outgoing announcements.
  void set_announced_port(uint16_t port) { announced_port_.store(port); }
  uint16_t announced_port() const { return announced_port_.load(); }

  // Opens and joins the multicast socket and arms both timers. Failure
  // leaves the beacon inactive.
  std::error_code start();
  // Cancels timers and closes the socket from the io thread.
  void stop();
  bool running() const { return running_.load(); }

  // Applies one received datagram to the peer table. Returns false when the
  // datagram was malformed or came from this node.
  bool handle_datagram(const std::string& datagram,
                       const asio::ip::udp::endpoint& sender,
                       Clock::time_point now);

  void announce_now();

  std::size_t announcements_sent() const { return announcements_sent_.load(); }
  std::size_t datagrams_rejected() const { return datagrams_rejected_.load(); }

private:
  void do_receive();
  void schedule_announce();
  void schedule_sweep();
  void close_socket();

  asio::io_context& io_;
  Options options_;
  PeerTable& table_;
  const std::string token_;
  std::shared_ptr<Logger> logger_;

  asio::ip::udp::socket socket_;
  asio::ip::udp::endpoint group_endpoint_;
  asio::ip::udp::endpoint sender_;
  std::array<char, kMaxDatagramSize> recv_buf_{};
  asio::steady_timer announce_timer_;
  asio::steady_timer sweep_timer_;

  std::atomic<uint16_t> announced_port_{0};
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> announcements_sent_{0};
  std::atomic<std::size_t> datagrams_rejected_{0};
};
