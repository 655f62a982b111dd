#include "transfer_log.hpp"

#include <spdlog/fmt/fmt.h>

std::string describe(const TransferRecord& record) {
  std::string line = fmt::format("{} {} {} {} ({}) {} bytes",
                                 to_string(record.direction),
                                 record.relative_path,
                                 record.initiated_locally ? "with" : "served to",
                                 record.peer,
                                 to_string(record.reason),
                                 record.bytes);
  if(record.status != TransferStatus::Ok) {
    line += fmt::format(" [{}: {}]", to_string(record.status), record.error);
  }
  return line;
}

TransferLog::TransferLog(std::size_t capacity)
  : capacity_(capacity == 0 ? 1 : capacity) {}

void TransferLog::append(TransferRecord record) {
  std::lock_guard lg(m_);
  if(record.status == TransferStatus::Ok) ++ok_; else ++failed_;
  records_.push_back(std::move(record));
  while(records_.size() > capacity_) records_.pop_front();
}

std::vector<TransferRecord> TransferLog::snapshot() const {
  std::lock_guard lg(m_);
  return std::vector<TransferRecord>(records_.begin(), records_.end());
}

std::size_t TransferLog::size() const {
  std::lock_guard lg(m_);
  return records_.size();
}

std::size_t TransferLog::total_ok() const {
  std::lock_guard lg(m_);
  return ok_;
}

std::size_t TransferLog::total_failed() const {
  std::lock_guard lg(m_);
  return failed_;
}
