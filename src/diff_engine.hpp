#pragma once

#include <string>
#include <vector>

#include "catalog.hpp"

enum class TransferDirection { Push, Pull };

enum class TransferReason { Missing, Stale, ConflictNewerWins };

const char* to_string(TransferDirection direction);
const char* to_string(TransferReason reason);

struct TransferIntent {
  std::string relative_path;
  TransferDirection direction = TransferDirection::Push;
  TransferReason reason = TransferReason::Missing;

  bool operator==(const TransferIntent& other) const {
    return relative_path == other.relative_path &&
           direction == other.direction &&
           reason == other.reason;
  }
};

// Which side holds the copy both peers should end up with when two entries
// for the same path disagree. Later modification time wins; on equal times
// the lexicographically greater hash wins, so both peers reach the same
// verdict without talking to each other.
enum class Winner { Local, Remote, Equal };
Winner pick_winner(const FileEntry& local, const FileEntry& remote);

// Intents that bring `local` and `remote` to the same content, ordered by
// relative path. diff(a, a) is empty; diff(a, b) pushes exactly the paths
// diff(b, a) pulls.
std::vector<TransferIntent> diff(const Catalog& local, const Catalog& remote);
