#pragma once

#include <asio.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "catalog.hpp"
#include "discovery_beacon.hpp"
#include "log.hpp"
#include "node_config.hpp"
#include "peer_client.hpp"
#include "peer_table.hpp"
#include "server.hpp"
#include "sync_orchestrator.hpp"
#include "transfer_log.hpp"

struct NodeStatus {
  std::string token;
  uint16_t listen_port = 0;
  std::size_t known_peers = 0;
  std::size_t alive_peers = 0;
  OrchestratorState state = OrchestratorState::Idle;
  std::size_t cycles_completed = 0;
  std::size_t transfers_ok = 0;
  std::size_t transfers_failed = 0;
};

// One sync peer: transfer server, discovery beacon and orchestrator wired
// around a shared peer table, with the asio loop on run() or a background
// thread.
class SyncNode {
public:
  struct Options {
    bool enable_discovery = true;
    bool enable_sync_timer = true;
    // Identity token; a random one is generated when empty.
    std::string token;
  };

  SyncNode(NodeConfig config, Options options);
  ~SyncNode();

  SyncNode(const SyncNode&) = delete;
  SyncNode& operator=(const SyncNode&) = delete;

  // Prepares the share root, opens the transfer port and starts discovery
  // and the sync timer as configured. Throws std::runtime_error when the
  // share root or the port is unusable.
  void start();
  void run();
  void start_background();
  void stop();

  NodeStatus status() const;

  uint16_t listen_port() const { return listen_port_; }
  const std::string& token() const { return token_; }
  const std::filesystem::path& share_root() const { return config_.share_root; }
  const NodeConfig& config() const { return config_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  PeerTable& peer_table() { return *peer_table_; }
  DiscoveryBeacon& beacon() { return *beacon_; }
  SyncOrchestrator& orchestrator() { return *orchestrator_; }
  TransferLog& transfer_log() { return transfer_log_; }
  CatalogCache& catalog_cache() { return *catalog_cache_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

private:
  void prepare_share_root() const;
  void record_inbound(const std::string& peer, TransferDirection direction, const TransferResult& result);

  NodeConfig config_;
  Options options_;
  std::string token_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;

  std::shared_ptr<const CatalogBuilder> builder_;
  std::shared_ptr<CatalogCache> catalog_cache_;
  std::unique_ptr<PeerTable> peer_table_;
  TransferLog transfer_log_;
  PeerClient client_;
  std::unique_ptr<Server> server_;
  std::unique_ptr<DiscoveryBeacon> beacon_;
  std::unique_ptr<SyncOrchestrator> orchestrator_;

  bool started_ = false;
  uint16_t listen_port_ = 0;
};
