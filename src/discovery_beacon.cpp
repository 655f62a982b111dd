#include "discovery_beacon.hpp"

DiscoveryBeacon::DiscoveryBeacon(asio::io_context& io,
                                 Options options,
                                 PeerTable& table,
                                 std::string token,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    table_(table),
    token_(std::move(token)),
    logger_(std::move(logger)),
    socket_(io),
    announce_timer_(io),
    sweep_timer_(io)
{
  if(options_.interval.count() <= 0) {
    options_.interval = std::chrono::milliseconds(5000);
  }
}

DiscoveryBeacon::~DiscoveryBeacon() {
  running_ = false;
  std::error_code ec;
  announce_timer_.cancel(ec);
  sweep_timer_.cancel(ec);
  close_socket();
}

std::error_code DiscoveryBeacon::start() {
  if(running_) return {};

  std::error_code ec;
  auto group = asio::ip::make_address(options_.group, ec);
  if(ec || !group.is_v4() || !group.is_multicast()) {
    log_error(logger_.get(), "Discovery group '{}' is not an IPv4 multicast address", options_.group);
    return ec ? ec : std::make_error_code(std::errc::invalid_argument);
  }
  group_endpoint_ = asio::ip::udp::endpoint(group, options_.port);

  using udp = asio::ip::udp;
  socket_.open(udp::v4(), ec);
  if(!ec) socket_.set_option(udp::socket::reuse_address(true), ec);
  if(!ec) socket_.bind(udp::endpoint(asio::ip::address_v4::any(), options_.port), ec);
  if(!ec) socket_.set_option(asio::ip::multicast::join_group(group.to_v4()), ec);
  if(!ec) socket_.set_option(asio::ip::multicast::hops(options_.ttl), ec);
  if(!ec) socket_.set_option(asio::ip::multicast::enable_loopback(options_.loopback), ec);
  if(ec) {
    log_error(logger_.get(), "Discovery socket on {}:{} unavailable: {}",
              options_.group, options_.port, ec.message());
    close_socket();
    return ec;
  }

  running_ = true;
  log_info(logger_.get(), "Discovery on {}:{} every {} ms",
           options_.group, options_.port, options_.interval.count());

  do_receive();
  announce_now();
  schedule_announce();
  schedule_sweep();
  return {};
}

void DiscoveryBeacon::stop() {
  if(!running_.exchange(false)) return;
  asio::post(io_, [this](){
    std::error_code ec;
    announce_timer_.cancel(ec);
    sweep_timer_.cancel(ec);
    close_socket();
  });
}

void DiscoveryBeacon::close_socket() {
  if(!socket_.is_open()) return;
  std::error_code ec;
  socket_.close(ec);
}

bool DiscoveryBeacon::handle_datagram(const std::string& datagram,
                                      const asio::ip::udp::endpoint& sender,
                                      Clock::time_point now) {
  std::string error;
  auto announcement = decode_announcement(datagram, error);
  if(!announcement) {
    ++datagrams_rejected_;
    log_debug(logger_.get(), "Dropped datagram from {}: {}", sender.address().to_string(), error);
    return false;
  }
  if(announcement->token == token_) {
    return false;
  }

  PeerAddress address;
  address.host = sender.address().to_string();
  address.port = announcement->port;
  table_.record_announcement(address, announcement->token, now);
  return true;
}

void DiscoveryBeacon::announce_now() {
  if(!running_ || !socket_.is_open()) return;
  Announcement a;
  a.token = token_;
  a.port = announced_port_.load();
  auto payload = std::make_shared<std::string>(encode_announcement(a));
  socket_.async_send_to(asio::buffer(*payload), group_endpoint_,
    [this, payload](std::error_code ec, std::size_t){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          log_warn(logger_.get(), "Announcement failed: {}", ec.message());
        }
        return;
      }
      ++announcements_sent_;
    });
}

void DiscoveryBeacon::do_receive() {
  socket_.async_receive_from(asio::buffer(recv_buf_), sender_,
    [this](std::error_code ec, std::size_t bytes){
      if(ec == asio::error::operation_aborted || !running_) return;
      if(ec) {
        log_warn(logger_.get(), "Discovery receive error: {}", ec.message());
      } else {
        handle_datagram(std::string(recv_buf_.data(), bytes), sender_, Clock::now());
      }
      if(socket_.is_open()) do_receive();
    });
}

void DiscoveryBeacon::schedule_announce() {
  announce_timer_.expires_after(options_.interval);
  announce_timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    announce_now();
    schedule_announce();
  });
}

void DiscoveryBeacon::schedule_sweep() {
  sweep_timer_.expires_after(options_.interval);
  sweep_timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    table_.sweep_expired(Clock::now());
    schedule_sweep();
  });
}
