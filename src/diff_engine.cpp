#include "diff_engine.hpp"

const char* to_string(TransferDirection direction) {
  switch(direction) {
    case TransferDirection::Push: return "PUSH";
    case TransferDirection::Pull: return "PULL";
  }
  return "?";
}

const char* to_string(TransferReason reason) {
  switch(reason) {
    case TransferReason::Missing: return "MISSING";
    case TransferReason::Stale: return "STALE";
    case TransferReason::ConflictNewerWins: return "CONFLICT_NEWER_WINS";
  }
  return "?";
}

Winner pick_winner(const FileEntry& local, const FileEntry& remote) {
  if(local.content_hash == remote.content_hash) return Winner::Equal;
  if(local.modified_at != remote.modified_at) {
    return local.modified_at > remote.modified_at ? Winner::Local : Winner::Remote;
  }
  return local.content_hash > remote.content_hash ? Winner::Local : Winner::Remote;
}

std::vector<TransferIntent> diff(const Catalog& local, const Catalog& remote) {
  std::vector<TransferIntent> intents;

  // Both maps are ordered by path, so a merge walk yields sorted output.
  auto l = local.entries.begin();
  auto r = remote.entries.begin();
  while(l != local.entries.end() || r != remote.entries.end()) {
    if(r == remote.entries.end() || (l != local.entries.end() && l->first < r->first)) {
      intents.push_back({l->first, TransferDirection::Push, TransferReason::Missing});
      ++l;
      continue;
    }
    if(l == local.entries.end() || r->first < l->first) {
      intents.push_back({r->first, TransferDirection::Pull, TransferReason::Missing});
      ++r;
      continue;
    }

    switch(pick_winner(l->second, r->second)) {
      case Winner::Equal:
        break;
      case Winner::Local:
        intents.push_back({l->first, TransferDirection::Push, TransferReason::ConflictNewerWins});
        break;
      case Winner::Remote:
        intents.push_back({l->first, TransferDirection::Pull, TransferReason::ConflictNewerWins});
        break;
    }
    ++l;
    ++r;
  }
  return intents;
}
