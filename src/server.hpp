#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "catalog.hpp"
#include "chunk_transfer.hpp"
#include "connection.hpp"
#include "diff_engine.hpp"
#include "log.hpp"

// Accepts transfer-port connections on the node's io_context and serves
// each one on its own short-lived thread: one request per connection.
class Server {
public:
    struct Options {
        std::string listen_ip = "0.0.0.0";
        uint16_t port = 0;
        std::chrono::milliseconds io_timeout{5000};
        std::size_t chunk_size = 64 * 1024;
    };

    // Reports every file served or received on behalf of a peer.
    using TransferObserver = std::function<void(const std::string& peer,
                                                TransferDirection direction,
                                                const TransferResult& result)>;

    Server(asio::io_context& io,
           Options options,
           std::filesystem::path share_root,
           std::shared_ptr<CatalogCache> catalog_cache,
           std::shared_ptr<Logger> logger = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    void set_transfer_observer(TransferObserver observer) { observer_ = std::move(observer); }

    // Binds and listens; throws std::runtime_error when the port is unusable.
    // Returns the bound port.
    uint16_t start();
    // Closes the acceptor, aborts in-flight requests and joins their threads.
    void stop();

    uint16_t port() const { return port_; }
    std::size_t active_connections() const;

    // Serves exactly one request on an established connection.
    void handle_connection(Connection& conn);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<asio::io_context> io;
        std::weak_ptr<TcpConnection> conn;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void do_accept();
    void reap_finished(bool all);

    void serve_catalog(Connection& conn);
    void serve_get(Connection& conn, const json& body);
    void serve_put(Connection& conn, const json& body);
    bool reply(Connection& conn, FrameTag tag, const json& body);
    void send_error(Connection& conn, const std::string& message,
                    TransferStatus status, const char* reason = nullptr);
    void notify(const std::string& peer, TransferDirection direction, const TransferResult& result);

    asio::io_context& io_;
    Options options_;
    std::filesystem::path share_root_;
    std::shared_ptr<CatalogCache> catalog_cache_;
    std::shared_ptr<Logger> logger_;
    TransferObserver observer_;

    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
};
