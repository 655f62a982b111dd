#include "chunk_transfer.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "catalog.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

const char* to_string(TransferStatus status){
    switch(status){
        case TransferStatus::Ok: return "ok";
        case TransferStatus::NetworkError: return "network_error";
        case TransferStatus::IntegrityError: return "integrity_error";
        case TransferStatus::FilesystemError: return "filesystem_error";
        case TransferStatus::ProtocolError: return "protocol_error";
        case TransferStatus::Rejected: return "rejected";
    }
    return "unknown";
}

namespace {

TransferResult failure(TransferStatus status, const std::string& relative_path, std::string error){
    TransferResult r;
    r.status = status;
    r.relative_path = relative_path;
    r.error = std::move(error);
    return r;
}

// Removes the staging file unless released.
class StagingGuard {
public:
    explicit StagingGuard(fs::path path) : path_(std::move(path)) {}
    ~StagingGuard(){ discard(); }

    void discard(){
        if(path_.empty()) return;
        std::error_code ec;
        fs::remove(path_, ec);
        path_.clear();
    }
    void release(){ path_.clear(); }

private:
    fs::path path_;
};

struct ChunkRecord {
    ChunkHeader header;
    std::vector<uint8_t> payload;
};

// Reads one complete chunk record. `status` tells the caller whether a
// failure came from the stream or from the bytes on it.
bool read_chunk(Connection& conn, ChunkRecord& rec, TransferStatus& status, std::string& error){
    uint8_t fixed[kChunkHeaderSize];
    if(auto ec = conn.read_exact(fixed, sizeof(fixed))){
        status = TransferStatus::NetworkError;
        error = "reading chunk header: " + ec.message();
        return false;
    }
    uint16_t path_length = 0;
    auto header = decode_chunk_header_fixed(fixed, sizeof(fixed), path_length, error);
    if(!header){
        status = TransferStatus::ProtocolError;
        return false;
    }

    std::string path(path_length, '\0');
    if(auto ec = conn.read_exact(path.data(), path.size())){
        status = TransferStatus::NetworkError;
        error = "reading chunk path: " + ec.message();
        return false;
    }
    header->relative_path = std::move(path);

    rec.payload.resize(header->payload_size);
    if(header->payload_size > 0){
        if(auto ec = conn.read_exact(rec.payload.data(), rec.payload.size())){
            status = TransferStatus::NetworkError;
            error = "reading chunk payload: " + ec.message();
            return false;
        }
    }
    rec.header = std::move(*header);
    return true;
}

} // namespace

fs::path staging_path_for(const fs::path& share_root, const std::string& relative_path){
    // Distinct per transfer so concurrent receives of one path never share a file.
    std::string name = sha256_hex(relative_path).substr(0, 16) + "-" + random_hex_token(4) + kStagingSuffix;
    return share_root / kStagingDirName / name;
}

TransferResult send_file(Connection& conn,
                         const std::string& relative_path,
                         const fs::path& local_path,
                         std::size_t chunk_size,
                         Logger* logger){
    if(relative_path.empty() || relative_path.size() > kMaxPathBytes){
        return failure(TransferStatus::ProtocolError, relative_path, "path length out of range");
    }
    if(chunk_size == 0 || chunk_size > kMaxChunkPayload){
        return failure(TransferStatus::ProtocolError, relative_path, "chunk size out of range");
    }

    std::error_code ec;
    auto size = fs::file_size(local_path, ec);
    if(ec){
        return failure(TransferStatus::FilesystemError, relative_path, "stat failed: " + ec.message());
    }
    auto mtime = file_mtime_ms(local_path, ec);
    if(!mtime){
        return failure(TransferStatus::FilesystemError, relative_path, "stat failed: " + ec.message());
    }
    std::ifstream in(local_path, std::ios::binary);
    if(!in){
        return failure(TransferStatus::FilesystemError, relative_path, "cannot open " + local_path.string());
    }

    ChunkHeader header;
    header.relative_path = relative_path;
    header.total_size = size;
    header.chunk_count = chunk_count_for(size, chunk_size);
    header.modified_at = *mtime;

    std::vector<uint8_t> buf(chunk_size);
    uint64_t sent = 0;
    for(uint32_t index = 0; index < header.chunk_count; ++index){
        auto want = static_cast<std::size_t>(std::min<uint64_t>(chunk_size, size - sent));
        if(want > 0){
            in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(want));
            if(static_cast<std::size_t>(in.gcount()) != want){
                return failure(TransferStatus::FilesystemError, relative_path,
                               "file shrank while sending at chunk " + std::to_string(index));
            }
        }
        header.chunk_index = index;
        header.payload_size = static_cast<uint32_t>(want);
        header.chunk_digest = sha256_digest(buf.data(), want);

        if(auto wec = conn.write_all(encode_chunk_header(header))){
            return failure(TransferStatus::NetworkError, relative_path, "send failed: " + wec.message());
        }
        if(want > 0){
            if(auto wec = conn.write_all(buf.data(), want)){
                return failure(TransferStatus::NetworkError, relative_path, "send failed: " + wec.message());
            }
        }
        sent += want;
    }

    log_debug(logger, "Sent {} ({} bytes, {} chunk(s)) to {}",
              relative_path, sent, header.chunk_count, conn.peer_description());

    TransferResult r;
    r.relative_path = relative_path;
    r.bytes = sent;
    return r;
}

TransferResult receive_file(Connection& conn, const ReceiveOptions& options, Logger* logger){
    const std::string label = options.expected_path.value_or(std::string());

    ChunkRecord rec;
    TransferStatus status = TransferStatus::Ok;
    std::string error;
    if(!read_chunk(conn, rec, status, error)){
        return failure(status, label, error);
    }

    const ChunkHeader first = rec.header;
    auto normalized = normalize_relative_path(first.relative_path);
    if(!normalized || *normalized != first.relative_path || is_reserved_path(*normalized)){
        return failure(TransferStatus::ProtocolError, label, "invalid path '" + first.relative_path + "'");
    }
    const std::string relative_path = *normalized;
    if(options.expected_path && *options.expected_path != relative_path){
        return failure(TransferStatus::ProtocolError, label,
                       "expected '" + *options.expected_path + "' but got '" + relative_path + "'");
    }
    if(first.chunk_index != 0){
        return failure(TransferStatus::ProtocolError, relative_path, "stream does not start at chunk 0");
    }
    if(first.total_size > options.max_file_size){
        return failure(TransferStatus::ProtocolError, relative_path, "file too large");
    }
    if(options.expected_size && *options.expected_size != first.total_size){
        return failure(TransferStatus::ProtocolError, relative_path,
                       "announced size " + std::to_string(first.total_size) +
                       " differs from expected " + std::to_string(*options.expected_size));
    }

    // Staging problems are remembered and the stream is still drained, so
    // the peer sees a clean status frame rather than a reset.
    TransferStatus deferred = TransferStatus::Ok;
    std::string deferred_error;

    const fs::path staging = staging_path_for(options.share_root, relative_path);
    StagingGuard guard(staging);
    std::ofstream out;
    if(crosses_symlink(options.share_root, relative_path) ||
       crosses_symlink(options.share_root, kStagingDirName)){
        deferred = TransferStatus::FilesystemError;
        deferred_error = "target path leaves the shared directory through a symlink";
    } else {
        std::error_code ec;
        fs::create_directories(staging.parent_path(), ec);
        out.open(staging, std::ios::binary | std::ios::trunc);
        if(ec || !out){
            deferred = TransferStatus::FilesystemError;
            deferred_error = "cannot create staging file " + staging.string();
        }
    }

    Sha256Stream whole;
    uint64_t received = 0;
    uint32_t expected_index = 0;
    while(true){
        const auto& h = rec.header;
        if(h.chunk_index != expected_index || h.chunk_count != first.chunk_count ||
           h.total_size != first.total_size || h.relative_path != first.relative_path){
            return failure(TransferStatus::ProtocolError, relative_path,
                           "chunk " + std::to_string(h.chunk_index) + " out of sequence, expected " +
                           std::to_string(expected_index));
        }

        if(deferred == TransferStatus::Ok){
            auto digest = sha256_digest(rec.payload.data(), rec.payload.size());
            if(digest != h.chunk_digest){
                deferred = TransferStatus::IntegrityError;
                deferred_error = "digest mismatch in chunk " + std::to_string(h.chunk_index);
                out.close();
                guard.discard();
            } else {
                out.write(reinterpret_cast<const char*>(rec.payload.data()),
                          static_cast<std::streamsize>(rec.payload.size()));
                if(!out){
                    deferred = TransferStatus::FilesystemError;
                    deferred_error = "write to staging file failed";
                    out.close();
                    guard.discard();
                }
                whole.update(rec.payload.data(), rec.payload.size());
            }
        }
        received += rec.payload.size();
        if(received > first.total_size){
            return failure(TransferStatus::ProtocolError, relative_path, "more bytes than announced");
        }

        if(h.chunk_index + 1 == first.chunk_count) break;
        ++expected_index;
        if(!read_chunk(conn, rec, status, error)){
            return failure(status, relative_path, error);
        }
    }

    if(deferred != TransferStatus::Ok){
        log_warn(logger, "Discarded {} from {}: {}", relative_path, conn.peer_description(), deferred_error);
        return failure(deferred, relative_path, deferred_error);
    }
    if(received != first.total_size){
        return failure(TransferStatus::IntegrityError, relative_path,
                       "received " + std::to_string(received) + " of " +
                       std::to_string(first.total_size) + " bytes");
    }
    auto file_hash = whole.finish_hex();
    if(options.expected_hash && *options.expected_hash != file_hash){
        return failure(TransferStatus::IntegrityError, relative_path, "file hash differs from catalog");
    }

    out.close();
    if(!out){
        return failure(TransferStatus::FilesystemError, relative_path, "closing staging file failed");
    }

    const fs::path final_path = options.share_root / fs::path(relative_path);
    std::error_code ec;
    fs::create_directories(final_path.parent_path(), ec);
    if(ec){
        return failure(TransferStatus::FilesystemError, relative_path,
                       "cannot create " + final_path.parent_path().string() + ": " + ec.message());
    }
    if(crosses_symlink(options.share_root, relative_path)){
        return failure(TransferStatus::FilesystemError, relative_path,
                       "target path leaves the shared directory through a symlink");
    }
    if(fs::is_directory(fs::symlink_status(final_path, ec))){
        return failure(TransferStatus::FilesystemError, relative_path, "a directory occupies the target path");
    }
    fs::rename(staging, final_path, ec);
    if(ec){
        return failure(TransferStatus::FilesystemError, relative_path, "commit failed: " + ec.message());
    }
    guard.release();

    if(!set_file_mtime_ms(final_path, first.modified_at, ec)){
        log_warn(logger, "Committed {} but could not restore its mtime: {}", relative_path, ec.message());
    }

    log_debug(logger, "Received {} ({} bytes) from {}", relative_path, received, conn.peer_description());

    TransferResult r;
    r.relative_path = relative_path;
    r.final_path = final_path;
    r.bytes = received;
    return r;
}
