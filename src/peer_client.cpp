#include "peer_client.hpp"

#include "connection.hpp"
#include "utils.hpp"

namespace {

TransferResult failed(TransferStatus status, const std::string& path, std::string error){
    TransferResult r;
    r.status = status;
    r.relative_path = path;
    r.error = std::move(error);
    return r;
}

std::string error_text(const Frame& frame){
    if(frame.body.is_object() && frame.body.contains("error") && frame.body["error"].is_string()){
        return frame.body["error"].get<std::string>();
    }
    return "peer reported an error";
}

TransferStatus error_status(const Frame& frame, TransferStatus fallback){
    if(frame.body.is_object() && frame.body.contains("status") && frame.body["status"].is_string()){
        return status_from_string(frame.body["status"].get<std::string>());
    }
    return fallback;
}

} // namespace

TransferStatus status_from_string(const std::string& value){
    for(auto s : {TransferStatus::Ok, TransferStatus::NetworkError, TransferStatus::IntegrityError,
                  TransferStatus::FilesystemError, TransferStatus::ProtocolError, TransferStatus::Rejected}){
        if(value == to_string(s)) return s;
    }
    return TransferStatus::ProtocolError;
}

PeerClient::PeerClient(std::chrono::milliseconds io_timeout,
                       std::size_t chunk_size,
                       std::shared_ptr<Logger> logger)
: io_timeout_(io_timeout), chunk_size_(chunk_size), logger_(std::move(logger))
{
}

std::optional<Catalog> PeerClient::fetch_catalog(const PeerAddress& peer, std::string& error) const {
    std::error_code ec;
    auto conn = TcpConnection::connect(peer.host, peer.port, io_timeout_, ec);
    if(!conn){
        error = "connect failed: " + ec.message();
        return std::nullopt;
    }
    if(auto wec = write_frame(*conn, FrameTag::CatalogRequest)){
        error = "request failed: " + wec.message();
        return std::nullopt;
    }
    Frame reply;
    if(auto rec = read_frame(*conn, reply)){
        error = "no catalog: " + rec.message();
        return std::nullopt;
    }
    if(reply.tag == FrameTag::Error){
        error = error_text(reply);
        return std::nullopt;
    }
    if(reply.tag != FrameTag::CatalogResponse){
        error = std::string("unexpected ") + to_string(reply.tag) + " frame";
        return std::nullopt;
    }
    auto catalog = catalog_from_json(reply.body, error);
    if(catalog){
        log_debug(logger_.get(), "Catalog from {}: {} file(s)", peer.to_string(), catalog->size());
    }
    return catalog;
}

TransferResult PeerClient::fetch_file(const PeerAddress& peer,
                                      const FileEntry& entry,
                                      const std::filesystem::path& share_root) const {
    const auto& path = entry.relative_path;
    std::error_code ec;
    auto conn = TcpConnection::connect(peer.host, peer.port, io_timeout_, ec);
    if(!conn){
        return failed(TransferStatus::NetworkError, path, "connect failed: " + ec.message());
    }
    if(auto wec = write_frame(*conn, FrameTag::GetFile, json{{"path", path}})){
        return failed(TransferStatus::NetworkError, path, "request failed: " + wec.message());
    }

    Frame reply;
    if(auto rec = read_frame(*conn, reply)){
        auto status = rec == std::errc::bad_message ? TransferStatus::ProtocolError : TransferStatus::NetworkError;
        return failed(status, path, "no reply: " + rec.message());
    }
    if(reply.tag == FrameTag::Error){
        return failed(error_status(reply, TransferStatus::Rejected), path, error_text(reply));
    }
    if(reply.tag != FrameTag::Ready){
        return failed(TransferStatus::ProtocolError, path, std::string("unexpected ") + to_string(reply.tag) + " frame");
    }

    ReceiveOptions options;
    options.share_root = share_root;
    options.expected_path = path;
    // The peer reports what it holds now, which may be newer than its catalog.
    options.expected_hash = entry.content_hash;
    if(reply.body.is_object() && reply.body.contains("hash")){
        const auto& hash = reply.body["hash"];
        if(!hash.is_string() || !is_hex_string(hash.get<std::string>(), 2 * SHA256_DIGEST_LENGTH)){
            return failed(TransferStatus::ProtocolError, path, "ready frame carries a malformed hash");
        }
        options.expected_hash = hash.get<std::string>();
    }
    if(reply.body.is_object() && reply.body.contains("size") && reply.body["size"].is_number_unsigned()){
        options.expected_size = reply.body["size"].get<uint64_t>();
    }
    return receive_file(*conn, options, logger_.get());
}

TransferResult PeerClient::push_file(const PeerAddress& peer,
                                     const FileEntry& entry,
                                     const std::filesystem::path& share_root) const {
    const auto& path = entry.relative_path;
    std::error_code ec;
    auto conn = TcpConnection::connect(peer.host, peer.port, io_timeout_, ec);
    if(!conn){
        return failed(TransferStatus::NetworkError, path, "connect failed: " + ec.message());
    }

    json offer;
    offer["path"] = path;
    offer["size"] = entry.size;
    offer["hash"] = entry.content_hash;
    offer["modified_at"] = entry.modified_at;
    if(auto wec = write_frame(*conn, FrameTag::PutFile, offer)){
        return failed(TransferStatus::NetworkError, path, "offer failed: " + wec.message());
    }

    Frame reply;
    if(auto rec = read_frame(*conn, reply)){
        return failed(TransferStatus::NetworkError, path, "no reply to offer: " + rec.message());
    }
    if(reply.tag == FrameTag::Ack){
        // Receiver already holds identical content.
        TransferResult r;
        r.relative_path = path;
        return r;
    }
    if(reply.tag == FrameTag::Error){
        return failed(error_status(reply, TransferStatus::Rejected), path, error_text(reply));
    }
    if(reply.tag != FrameTag::Ready){
        return failed(TransferStatus::ProtocolError, path, std::string("unexpected ") + to_string(reply.tag) + " frame");
    }

    auto sent = send_file(*conn, path, share_root / std::filesystem::path(path), chunk_size_, logger_.get());
    if(!sent.ok()){
        return sent;
    }

    Frame outcome;
    if(auto rec = read_frame(*conn, outcome)){
        return failed(TransferStatus::NetworkError, path, "no acknowledgement: " + rec.message());
    }
    if(outcome.tag == FrameTag::Error){
        return failed(error_status(outcome, TransferStatus::ProtocolError), path, error_text(outcome));
    }
    if(outcome.tag != FrameTag::Ack){
        return failed(TransferStatus::ProtocolError, path, std::string("unexpected ") + to_string(outcome.tag) + " frame");
    }
    return sent;
}
