#include "sync_node.hpp"

#include <stdexcept>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::shared_ptr<Logger> make_node_logger(bool verbose) {
  auto logger = std::make_shared<Logger>("lansync");
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  return logger;
}

} // namespace

SyncNode::SyncNode(NodeConfig config, Options options)
  : config_(std::move(config)),
    options_(std::move(options)),
    token_(options_.token.empty() ? random_hex_token(16) : options_.token),
    logger_(make_node_logger(config_.verbose)),
    transfer_log_(config_.transfer_log_size),
    client_(config_.io_timeout, config_.chunk_size, logger_->child("client")) {
  builder_ = std::make_shared<const CatalogBuilder>(token_, logger_->child("catalog"));
  catalog_cache_ = std::make_shared<CatalogCache>(builder_, config_.share_root, config_.catalog_cache);
  peer_table_ = std::make_unique<PeerTable>(token_,
                                            config_.expiry_window,
                                            config_.removal_window,
                                            logger_->child("peers"));

  Server::Options server_options;
  server_options.listen_ip = config_.listen_ip;
  server_options.port = config_.listen_port;
  server_options.io_timeout = config_.io_timeout;
  server_options.chunk_size = config_.chunk_size;
  server_ = std::make_unique<Server>(io_, server_options, config_.share_root, catalog_cache_,
                                     logger_->child("server"));
  server_->set_transfer_observer(
    [this](const std::string& peer, TransferDirection direction, const TransferResult& result){
      record_inbound(peer, direction, result);
    });

  DiscoveryBeacon::Options beacon_options;
  beacon_options.group = config_.multicast_group;
  beacon_options.port = config_.multicast_port;
  beacon_options.ttl = config_.multicast_ttl;
  beacon_options.loopback = config_.multicast_loopback;
  beacon_options.interval = config_.announce_interval;
  beacon_ = std::make_unique<DiscoveryBeacon>(io_, beacon_options, *peer_table_, token_,
                                              logger_->child("discovery"));

  orchestrator_ = std::make_unique<SyncOrchestrator>(config_.share_root, builder_, *peer_table_,
                                                     client_, transfer_log_, logger_->child("sync"));
  orchestrator_->set_local_change_callback([this](){ catalog_cache_->invalidate(); });
}

SyncNode::~SyncNode() {
  stop();
}

void SyncNode::prepare_share_root() const {
  std::error_code ec;
  fs::create_directories(config_.share_root, ec);
  if(ec || !fs::is_directory(config_.share_root, ec)) {
    throw std::runtime_error("share directory " + config_.share_root.string() + " is not accessible");
  }

  // Partial files from an interrupted run are never resumed.
  const fs::path staging = config_.share_root / kStagingDirName;
  if(fs::is_directory(staging, ec)) {
    std::size_t removed = 0;
    for(fs::directory_iterator it(staging, ec), end; !ec && it != end; it.increment(ec)) {
      std::error_code rm_ec;
      if(fs::remove(it->path(), rm_ec)) ++removed;
    }
    if(removed > 0) {
      log_info(logger_.get(), "Removed {} stale staging file(s)", removed);
    }
  }
}

void SyncNode::start() {
  if(started_) return;

  prepare_share_root();
  listen_port_ = server_->start();
  started_ = true;
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());

  PeerAddress self;
  self.host = config_.listen_ip == "0.0.0.0" ? detect_local_ip() : config_.listen_ip;
  self.port = listen_port_;
  peer_table_->set_local_address(self);
  beacon_->set_announced_port(listen_port_);

  log_info(logger_.get(), "Node {} sharing {} on port {}", token_, config_.share_root.string(), listen_port_);

  if(options_.enable_discovery) {
    if(auto ec = beacon_->start()) {
      log_warn(logger_.get(), "Continuing without discovery: {}", ec.message());
    }
  }
  if(options_.enable_sync_timer) {
    orchestrator_->start(config_.sync_interval);
  }
}

void SyncNode::run() {
  if(!started_) start();
  io_.run();
}

void SyncNode::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void SyncNode::stop() {
  if(!started_) return;
  started_ = false;

  orchestrator_->stop();
  beacon_->stop();
  server_->stop();

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  // Runs the socket closes posted above so a later start() can reopen them.
  io_.restart();
  io_.poll();
  io_.restart();
  log_info(logger_.get(), "Node {} stopped", token_);
}

NodeStatus SyncNode::status() const {
  NodeStatus s;
  s.token = token_;
  s.listen_port = listen_port_;
  s.known_peers = peer_table_->known_count();
  s.alive_peers = peer_table_->alive_count();
  s.state = orchestrator_->state();
  s.cycles_completed = orchestrator_->cycles_completed();
  s.transfers_ok = transfer_log_.total_ok();
  s.transfers_failed = transfer_log_.total_failed();
  return s;
}

LogListenerHandle SyncNode::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void SyncNode::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) logger_->remove_listener(handle);
}

void SyncNode::record_inbound(const std::string& peer, TransferDirection direction, const TransferResult& result) {
  TransferRecord rec;
  rec.time_ms = unix_time_ms();
  rec.peer = peer;
  rec.relative_path = result.relative_path;
  rec.direction = direction;
  rec.status = result.status;
  rec.bytes = result.bytes;
  rec.error = result.error;
  rec.initiated_locally = false;
  transfer_log_.append(std::move(rec));
}
