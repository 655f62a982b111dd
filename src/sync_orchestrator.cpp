#include "sync_orchestrator.hpp"

#include "utils.hpp"

const char* to_string(OrchestratorState state) {
  switch(state) {
    case OrchestratorState::Idle: return "IDLE";
    case OrchestratorState::BuildingCatalog: return "BUILDING_CATALOG";
    case OrchestratorState::ContactingPeers: return "CONTACTING_PEERS";
    case OrchestratorState::Diffing: return "DIFFING";
    case OrchestratorState::Transferring: return "TRANSFERRING";
  }
  return "?";
}

SyncOrchestrator::SyncOrchestrator(std::filesystem::path share_root,
                                   std::shared_ptr<const CatalogBuilder> builder,
                                   PeerTable& peers,
                                   const PeerClient& client,
                                   TransferLog& transfer_log,
                                   std::shared_ptr<Logger> logger)
  : share_root_(std::move(share_root)),
    builder_(std::move(builder)),
    peers_(peers),
    client_(client),
    transfer_log_(transfer_log),
    logger_(std::move(logger)) {}

SyncOrchestrator::~SyncOrchestrator() {
  stop();
}

void SyncOrchestrator::start(std::chrono::milliseconds interval) {
  stop_requested_ = false;
  task_.start(interval, [this](){ run_cycle(); });
}

void SyncOrchestrator::stop() {
  stop_requested_ = true;
  task_.stop();
}

CycleReport SyncOrchestrator::run_cycle() {
  CycleReport report;
  std::unique_lock<std::mutex> lock(cycle_mutex_, std::try_to_lock);
  if(!lock.owns_lock()) {
    report.skipped = true;
    return report;
  }

  set_state(OrchestratorState::BuildingCatalog);
  Catalog local = builder_->build(share_root_);
  report.local_files = local.size();

  auto alive = peers_.snapshot_alive_peers();
  log_debug(logger_.get(), "Cycle start: {} local file(s), {} alive peer(s)", local.size(), alive.size());

  for(const auto& peer : alive) {
    if(stop_requested_) {
      report.cancelled = true;
      break;
    }
    if(sync_with_peer(peer, local, report)) {
      if(on_local_change_) on_local_change_();
      // Later peers are compared against what is on disk now.
      set_state(OrchestratorState::BuildingCatalog);
      local = builder_->build(share_root_);
    }
    if(stop_requested_) {
      report.cancelled = true;
      break;
    }
  }

  set_state(OrchestratorState::Idle);
  ++cycles_completed_;

  if(report.transfers_ok + report.transfers_failed > 0 || report.peers_unreachable > 0) {
    log_info(logger_.get(), "Cycle done: {} peer(s), {} unreachable, {} transfer(s) ok, {} failed{}",
             report.peers_contacted, report.peers_unreachable,
             report.transfers_ok, report.transfers_failed,
             report.cancelled ? " (cancelled)" : "");
  }
  return report;
}

bool SyncOrchestrator::sync_with_peer(const PeerAddress& peer, const Catalog& local, CycleReport& report) {
  set_state(OrchestratorState::ContactingPeers);
  std::string error;
  auto remote = client_.fetch_catalog(peer, error);
  if(!remote) {
    ++report.peers_unreachable;
    log_warn(logger_.get(), "Skipping {} this cycle: {}", peer.to_string(), error);
    return false;
  }
  ++report.peers_contacted;

  set_state(OrchestratorState::Diffing);
  auto intents = diff(local, *remote);
  if(intents.empty()) {
    log_debug(logger_.get(), "In sync with {}", peer.to_string());
    return false;
  }
  log_info(logger_.get(), "{} transfer(s) pending with {}", intents.size(), peer.to_string());

  set_state(OrchestratorState::Transferring);
  bool changed = false;
  for(const auto& intent : intents) {
    if(stop_requested_) {
      report.cancelled = true;
      break;
    }
    TransferResult result;
    if(intent.direction == TransferDirection::Pull) {
      const FileEntry* entry = remote->find(intent.relative_path);
      result = client_.fetch_file(peer, *entry, share_root_);
      if(result.ok()) changed = true;
    } else {
      const FileEntry* entry = local.find(intent.relative_path);
      result = client_.push_file(peer, *entry, share_root_);
    }
    record(peer, intent, result, report);
  }
  return changed;
}

void SyncOrchestrator::record(const PeerAddress& peer, const TransferIntent& intent,
                              const TransferResult& result, CycleReport& report) {
  TransferRecord rec;
  rec.time_ms = unix_time_ms();
  rec.peer = peer.to_string();
  rec.relative_path = intent.relative_path;
  rec.direction = intent.direction;
  rec.reason = intent.reason;
  rec.status = result.status;
  rec.bytes = result.bytes;
  rec.error = result.error;

  if(result.ok()) {
    ++report.transfers_ok;
    log_info(logger_.get(), "{}", describe(rec));
  } else {
    ++report.transfers_failed;
    log_warn(logger_.get(), "{}", describe(rec));
  }
  transfer_log_.append(std::move(rec));
}
