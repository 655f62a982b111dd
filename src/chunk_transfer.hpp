#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "connection.hpp"
#include "log.hpp"

enum class TransferStatus {
  Ok,
  NetworkError,    // transient; retried next cycle
  IntegrityError,  // chunk or file digest mismatch; staging discarded
  FilesystemError, // local read/write/rename failure
  ProtocolError,   // malformed or out-of-order data; connection unusable
  Rejected         // peer declined the request (missing file, newer copy)
};

const char* to_string(TransferStatus status);

struct TransferResult {
  TransferStatus status = TransferStatus::Ok;
  std::string relative_path;
  std::filesystem::path final_path; // set when a receive committed
  uint64_t bytes = 0;
  std::string error;

  bool ok() const { return status == TransferStatus::Ok; }
};

// Streams `local_path` over `conn` as chunk records. The file is read once;
// a file that changes size while being sent fails with FilesystemError
// after the chunks already written.
TransferResult send_file(Connection& conn,
                         const std::string& relative_path,
                         const std::filesystem::path& local_path,
                         std::size_t chunk_size,
                         Logger* logger = nullptr);

struct ReceiveOptions {
  std::filesystem::path share_root;
  // When set, the chunk stream must carry this path.
  std::optional<std::string> expected_path;
  // When set, the assembled file must hash to this value.
  std::optional<std::string> expected_hash;
  std::optional<uint64_t> expected_size;
  uint64_t max_file_size = UINT64_C(1) << 40;
};

// Reads one chunk stream and commits it under share_root. On a digest
// mismatch the remaining chunks are still drained so the connection stays
// usable for the final status frame.
TransferResult receive_file(Connection& conn,
                            const ReceiveOptions& options,
                            Logger* logger = nullptr);

// Staging location for `relative_path`.
std::filesystem::path staging_path_for(const std::filesystem::path& share_root,
                                       const std::string& relative_path);
