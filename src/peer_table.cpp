#include "peer_table.hpp"

#include <algorithm>

PeerTable::PeerTable(std::string local_token,
                     std::chrono::milliseconds expiry_window,
                     std::chrono::milliseconds removal_window,
                     std::shared_ptr<Logger> logger)
  : local_token_(std::move(local_token)),
    expiry_window_(expiry_window),
    removal_window_(removal_window),
    logger_(std::move(logger))
{
}

void PeerTable::set_local_address(const PeerAddress& address){
  std::lock_guard lg(m_);
  local_address_ = address;
}

bool PeerTable::is_self(const PeerRecord& record) const {
  if(!local_token_.empty() && record.token == local_token_) return true;
  return !local_address_.host.empty() && record.address == local_address_;
}

void PeerTable::record_announcement(const PeerAddress& address,
                                    const std::string& token,
                                    Clock::time_point now)
{
  std::lock_guard lg(m_);
  auto it = peers_.find(address);
  if(it == peers_.end()){
    PeerRecord record;
    record.address = address;
    record.token = token;
    record.last_seen = now;
    record.alive = true;
    peers_.emplace(address, record);
    log_info(logger_.get(), "Discovered peer {} ({})", address.to_string(), token.empty() ? "no token" : token);
    return;
  }

  auto& record = it->second;
  if(!record.alive){
    log_info(logger_.get(), "Peer {} is alive again", address.to_string());
  }
  if(!token.empty() && record.token != token){
    // Same address, new process: the old identity is gone.
    log_info(logger_.get(), "Peer {} restarted with token {}", address.to_string(), token);
    record.token = token;
  }
  record.last_seen = std::max(record.last_seen, now);
  record.alive = true;
}

std::size_t PeerTable::sweep_expired(Clock::time_point now){
  std::lock_guard lg(m_);
  std::size_t changed = 0;
  for(auto it = peers_.begin(); it != peers_.end();){
    auto& record = it->second;
    if(record.alive){
      if(now - record.last_seen > expiry_window_){
        record.alive = false;
        record.not_alive_since = now;
        ++changed;
        log_info(logger_.get(), "Peer {} expired (silent for {} ms)",
                 record.address.to_string(),
                 std::chrono::duration_cast<std::chrono::milliseconds>(now - record.last_seen).count());
      }
      ++it;
      continue;
    }
    if(now - record.not_alive_since > removal_window_){
      log_info(logger_.get(), "Removing peer {}", record.address.to_string());
      it = peers_.erase(it);
      ++changed;
      continue;
    }
    ++it;
  }
  return changed;
}

std::vector<PeerAddress> PeerTable::snapshot_alive_peers() const {
  std::lock_guard lg(m_);
  std::vector<PeerAddress> out;
  out.reserve(peers_.size());
  for(const auto& kv : peers_){
    if(!kv.second.alive) continue;
    if(is_self(kv.second)) continue;
    out.push_back(kv.first);
  }
  return out;
}

std::vector<PeerRecord> PeerTable::records() const {
  std::lock_guard lg(m_);
  std::vector<PeerRecord> out;
  out.reserve(peers_.size());
  for(const auto& kv : peers_) out.push_back(kv.second);
  return out;
}

std::size_t PeerTable::known_count() const {
  std::lock_guard lg(m_);
  std::size_t count = 0;
  for(const auto& kv : peers_){
    if(!is_self(kv.second)) ++count;
  }
  return count;
}

std::size_t PeerTable::alive_count() const {
  std::lock_guard lg(m_);
  std::size_t count = 0;
  for(const auto& kv : peers_){
    if(kv.second.alive && !is_self(kv.second)) ++count;
  }
  return count;
}
