#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>

#include "catalog.hpp"
#include "diff_engine.hpp"
#include "log.hpp"
#include "peer_client.hpp"
#include "peer_table.hpp"
#include "recurring_task.hpp"
#include "transfer_log.hpp"

enum class OrchestratorState {
  Idle,
  BuildingCatalog,
  ContactingPeers,
  Diffing,
  Transferring
};

const char* to_string(OrchestratorState state);

struct CycleReport {
  bool skipped = false;   // another cycle was already running
  bool cancelled = false; // a stop request ended the cycle early
  std::size_t local_files = 0;
  std::size_t peers_contacted = 0;
  std::size_t peers_unreachable = 0;
  std::size_t transfers_ok = 0;
  std::size_t transfers_failed = 0;
};

// Drives one sync cycle at a time against every alive peer: local catalog,
// remote catalog, diff, then one file at a time. Failures are logged and
// recorded; none of them ends the cycle.
class SyncOrchestrator {
public:
  SyncOrchestrator(std::filesystem::path share_root,
                   std::shared_ptr<const CatalogBuilder> builder,
                   PeerTable& peers,
                   const PeerClient& client,
                   TransferLog& transfer_log,
                   std::shared_ptr<Logger> logger = nullptr);
  ~SyncOrchestrator();

  SyncOrchestrator(const SyncOrchestrator&) = delete;
  SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

  // Called whenever a cycle has committed files locally.
  void set_local_change_callback(std::function<void()> callback) { on_local_change_ = std::move(callback); }

  // Runs a cycle on the calling thread. Returns immediately with
  // `skipped` set when a cycle is already in progress.
  CycleReport run_cycle();

  // Periodic cycles on a background thread.
  void start(std::chrono::milliseconds interval);
  // Lets the file in flight finish, then ends the cycle and the thread.
  void stop();
  // Ends the current cycle before its next file or peer.
  void request_stop() { stop_requested_ = true; }

  OrchestratorState state() const { return state_.load(); }
  std::size_t cycles_completed() const { return cycles_completed_.load(); }

private:
  // Returns true when a committed transfer changed the local tree.
  bool sync_with_peer(const PeerAddress& peer, const Catalog& local, CycleReport& report);
  void record(const PeerAddress& peer, const TransferIntent& intent,
              const TransferResult& result, CycleReport& report);
  void set_state(OrchestratorState state) { state_.store(state); }

  std::filesystem::path share_root_;
  std::shared_ptr<const CatalogBuilder> builder_;
  PeerTable& peers_;
  const PeerClient& client_;
  TransferLog& transfer_log_;
  std::shared_ptr<Logger> logger_;
  std::function<void()> on_local_change_;

  std::mutex cycle_mutex_;
  std::atomic<OrchestratorState> state_{OrchestratorState::Idle};
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::size_t> cycles_completed_{0};
  RecurringTask task_;
};
