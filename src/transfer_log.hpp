#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "chunk_transfer.hpp"
#include "diff_engine.hpp"

struct TransferRecord {
  int64_t time_ms = 0;
  std::string peer;
  std::string relative_path;
  TransferDirection direction = TransferDirection::Pull;
  TransferReason reason = TransferReason::Missing;
  TransferStatus status = TransferStatus::Ok;
  uint64_t bytes = 0;
  std::string error;
  // False for transfers a peer initiated against our server.
  bool initiated_locally = true;
};

std::string describe(const TransferRecord& record);

// Bounded history of transfer outcomes; the oldest record is dropped once
// `capacity` is reached. Totals cover every record ever appended.
class TransferLog {
public:
  explicit TransferLog(std::size_t capacity = 256);

  void append(TransferRecord record);
  std::vector<TransferRecord> snapshot() const;

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  std::size_t total_ok() const;
  std::size_t total_failed() const;

private:
  const std::size_t capacity_;
  mutable std::mutex m_;
  std::deque<TransferRecord> records_;
  std::size_t ok_ = 0;
  std::size_t failed_ = 0;
};
