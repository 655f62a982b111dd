#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "catalog.hpp"
#include "chunk_transfer.hpp"
#include "log.hpp"
#include "peer_table.hpp"

// Outbound side of the transfer protocol. Each call opens its own
// connection and closes it before returning.
class PeerClient {
public:
    PeerClient(std::chrono::milliseconds io_timeout,
               std::size_t chunk_size,
               std::shared_ptr<Logger> logger = nullptr);

    std::optional<Catalog> fetch_catalog(const PeerAddress& peer, std::string& error) const;

    // Pulls `entry` from the peer and commits it under share_root.
    TransferResult fetch_file(const PeerAddress& peer,
                              const FileEntry& entry,
                              const std::filesystem::path& share_root) const;

    // Offers `entry` to the peer and streams it when accepted.
    TransferResult push_file(const PeerAddress& peer,
                             const FileEntry& entry,
                             const std::filesystem::path& share_root) const;

    std::size_t chunk_size() const { return chunk_size_; }

private:
    std::chrono::milliseconds io_timeout_;
    std::size_t chunk_size_;
    std::shared_ptr<Logger> logger_;
};

// Maps the "status" field of an error frame back to a TransferStatus.
TransferStatus status_from_string(const std::string& value);
