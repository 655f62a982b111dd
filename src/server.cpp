#include "server.hpp"

#include <optional>
#include <stdexcept>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

// Peer-supplied path that is safe to resolve under the share root.
std::optional<std::string> checked_path(const json& body, std::string& error){
    if(!body.is_object() || !body.contains("path") || !body["path"].is_string()){
        error = "missing path";
        return std::nullopt;
    }
    auto raw = body["path"].get<std::string>();
    auto path = normalize_relative_path(raw);
    if(!path || *path != raw || is_reserved_path(*path)){
        error = "invalid path '" + raw + "'";
        return std::nullopt;
    }
    return path;
}

bool is_plain_file(const fs::path& p){
    std::error_code ec;
    auto st = fs::symlink_status(p, ec);
    return !ec && fs::is_regular_file(st);
}

} // namespace

Server::Server(asio::io_context& io,
               Options options,
               fs::path share_root,
               std::shared_ptr<CatalogCache> catalog_cache,
               std::shared_ptr<Logger> logger)
: io_(io),
  options_(std::move(options)),
  share_root_(std::move(share_root)),
  catalog_cache_(std::move(catalog_cache)),
  logger_(std::move(logger)),
  acceptor_(io)
{
}

Server::~Server(){
    stop();
    reap_finished(true);
}

uint16_t Server::start(){
    using tcp = asio::ip::tcp;
    std::error_code ec;
    auto address = asio::ip::make_address(options_.listen_ip, ec);
    if(ec){
        throw std::runtime_error("invalid listen address '" + options_.listen_ip + "'");
    }
    tcp::endpoint endpoint(address, options_.port);
    acceptor_.open(endpoint.protocol(), ec);
    if(!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if(!ec) acceptor_.bind(endpoint, ec);
    if(!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if(ec){
        std::error_code ignore;
        acceptor_.close(ignore);
        throw std::runtime_error("cannot listen on " + options_.listen_ip + ":" +
                                 std::to_string(options_.port) + ": " + ec.message());
    }
    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    log_info(logger_.get(), "Serving {} on {}:{}", share_root_.string(), options_.listen_ip, port_);
    do_accept();
    return port_;
}

void Server::stop(){
    if(!running_.exchange(false)) return;
    asio::post(io_, [this](){
        std::error_code ec;
        acceptor_.close(ec);
    });
    {
        std::lock_guard lg(workers_mutex_);
        for(auto& w : workers_){
            // Runs inside the worker's next wait, on the worker's own thread.
            asio::post(*w.io, [weak = w.conn](){
                if(auto conn = weak.lock()) conn->close();
            });
        }
    }
    reap_finished(true);
}

std::size_t Server::active_connections() const {
    std::lock_guard lg(workers_mutex_);
    std::size_t n = 0;
    for(const auto& w : workers_){
        if(!w.done->load()) ++n;
    }
    return n;
}

void Server::do_accept(){
    auto conn_io = std::make_shared<asio::io_context>();
    acceptor_.async_accept(*conn_io,
        [this, conn_io](std::error_code ec, asio::ip::tcp::socket socket){
            if(!running_ || ec == asio::error::operation_aborted) return;
            if(ec){
                log_warn(logger_.get(), "Accept error: {}", ec.message());
            } else {
                reap_finished(false);
                auto conn = std::make_shared<TcpConnection>(conn_io, std::move(socket), options_.io_timeout);
                log_debug(logger_.get(), "Accepted connection from {}", conn->peer_description());

                Worker w;
                w.io = conn_io;
                w.conn = conn;
                w.done = std::make_shared<std::atomic<bool>>(false);
                w.thread = std::thread([this, conn, done = w.done](){
                    handle_connection(*conn);
                    conn->close();
                    done->store(true);
                });
                std::lock_guard lg(workers_mutex_);
                workers_.push_back(std::move(w));
            }
            do_accept();
        });
}

void Server::reap_finished(bool all){
    std::list<Worker> finished;
    {
        std::lock_guard lg(workers_mutex_);
        for(auto it = workers_.begin(); it != workers_.end();){
            if(all || it->done->load()){
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for(auto& w : finished){
        if(w.thread.joinable()) w.thread.join();
    }
}

void Server::handle_connection(Connection& conn){
    Frame request;
    if(auto ec = read_frame(conn, request)){
        log_debug(logger_.get(), "No request from {}: {}", conn.peer_description(), ec.message());
        if(ec == std::errc::bad_message){
            send_error(conn, "malformed frame", TransferStatus::ProtocolError);
        }
        return;
    }

    switch(request.tag){
        case FrameTag::CatalogRequest:
            serve_catalog(conn);
            break;
        case FrameTag::GetFile:
            serve_get(conn, request.body);
            break;
        case FrameTag::PutFile:
            serve_put(conn, request.body);
            break;
        default:
            log_warn(logger_.get(), "Unexpected {} frame from {}", to_string(request.tag), conn.peer_description());
            send_error(conn, std::string("unexpected ") + to_string(request.tag) + " frame",
                       TransferStatus::ProtocolError);
            break;
    }
}

void Server::serve_catalog(Connection& conn){
    auto catalog = catalog_cache_->get();
    reply(conn, FrameTag::CatalogResponse, catalog_to_json(*catalog));
}

void Server::serve_get(Connection& conn, const json& body){
    std::string error;
    auto path = checked_path(body, error);
    if(!path){
        send_error(conn, error, TransferStatus::ProtocolError);
        return;
    }
    const fs::path local = share_root_ / fs::path(*path);
    if(crosses_symlink(share_root_, *path) || !is_plain_file(local)){
        send_error(conn, "no such file '" + *path + "'", TransferStatus::Rejected);
        return;
    }
    std::error_code ec;
    auto size = fs::file_size(local, ec);
    auto hash = sha256_file(local);
    if(ec || !hash){
        send_error(conn, "cannot read '" + *path + "'", TransferStatus::FilesystemError);
        return;
    }

    json ready;
    ready["path"] = *path;
    ready["size"] = size;
    ready["hash"] = *hash;
    if(!reply(conn, FrameTag::Ready, ready)) return;

    auto result = send_file(conn, *path, local, options_.chunk_size, logger_.get());
    notify(conn.peer_description(), TransferDirection::Push, result);
}

void Server::serve_put(Connection& conn, const json& body){
    std::string error;
    auto path = checked_path(body, error);
    if(!path){
        send_error(conn, error, TransferStatus::ProtocolError);
        return;
    }
    if(crosses_symlink(share_root_, *path)){
        send_error(conn, "refusing '" + *path + "': it resolves through a symlink", TransferStatus::Rejected);
        return;
    }

    FileEntry offered;
    offered.relative_path = *path;
    try {
        offered.size = body.at("size").get<uint64_t>();
        offered.content_hash = body.at("hash").get<std::string>();
        offered.modified_at = body.value("modified_at", int64_t{0});
    } catch(const json::exception& e){
        send_error(conn, std::string("malformed offer: ") + e.what(), TransferStatus::ProtocolError);
        return;
    }
    if(!is_hex_string(offered.content_hash, 2 * SHA256_DIGEST_LENGTH)){
        send_error(conn, "malformed hash", TransferStatus::ProtocolError);
        return;
    }

    // The requester decided from a catalog that may be older than our file.
    const fs::path local = share_root_ / fs::path(*path);
    if(is_plain_file(local)){
        std::error_code ec;
        auto hash = sha256_file(local);
        auto mtime = file_mtime_ms(local, ec);
        if(hash && mtime){
            FileEntry current;
            current.relative_path = *path;
            current.size = fs::file_size(local, ec);
            current.content_hash = *hash;
            current.modified_at = *mtime;
            switch(pick_winner(current, offered)){
                case Winner::Equal:
                    reply(conn, FrameTag::Ack, json{{"bytes", 0}});
                    return;
                case Winner::Local:
                    log_info(logger_.get(), "Declined {} from {}: offered copy is {}",
                             *path, conn.peer_description(), to_string(TransferReason::Stale));
                    send_error(conn, "receiver holds a newer copy of '" + *path + "'",
                               TransferStatus::Rejected, to_string(TransferReason::Stale));
                    return;
                case Winner::Remote:
                    break;
            }
        }
    }

    if(!reply(conn, FrameTag::Ready, json::object())) return;

    ReceiveOptions options;
    options.share_root = share_root_;
    options.expected_path = *path;
    options.expected_hash = offered.content_hash;
    options.expected_size = offered.size;
    auto result = receive_file(conn, options, logger_.get());
    notify(conn.peer_description(), TransferDirection::Pull, result);

    if(result.ok()){
        catalog_cache_->invalidate();
        reply(conn, FrameTag::Ack, json{{"bytes", result.bytes}});
    } else if(result.status != TransferStatus::NetworkError){
        send_error(conn, result.error, result.status);
    }
}

void Server::send_error(Connection& conn, const std::string& message,
                        TransferStatus status, const char* reason){
    json body;
    body["error"] = message;
    body["status"] = to_string(status);
    if(reason) body["reason"] = reason;
    reply(conn, FrameTag::Error, body);
}

bool Server::reply(Connection& conn, FrameTag tag, const json& body){
    if(auto ec = write_frame(conn, tag, body)){
        log_debug(logger_.get(), "{} frame to {} failed: {}", to_string(tag), conn.peer_description(), ec.message());
        return false;
    }
    return true;
}

void Server::notify(const std::string& peer, TransferDirection direction, const TransferResult& result){
    if(result.ok()){
        log_info(logger_.get(), "{} {} ({} bytes) for {}",
                 direction == TransferDirection::Push ? "Served" : "Accepted",
                 result.relative_path, result.bytes, peer);
    } else {
        log_warn(logger_.get(), "Transfer of {} for {} failed: {} ({})",
                 result.relative_path, peer, result.error, to_string(result.status));
    }
    if(observer_) observer_(peer, direction, result);
}
