#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "protocol.hpp"

// Blocking byte stream. Every call either completes or fails with an error
// code; implementations bound each call by a timeout.
class Connection {
public:
    virtual ~Connection() = default;

    virtual std::error_code write_all(const void* data, std::size_t size) = 0;
    virtual std::error_code read_exact(void* data, std::size_t size) = 0;
    virtual void close() = 0;
    virtual std::string peer_description() const = 0;

    std::error_code write_all(const std::vector<uint8_t>& bytes) {
        return write_all(bytes.data(), bytes.size());
    }
};

// Frame helpers shared by the server and the peer client. A frame with an
// unknown tag, an oversized body or a body that is not JSON yields
// std::errc::bad_message.
std::error_code write_frame(Connection& conn, FrameTag tag, const json& body = json::object());
std::error_code read_frame(Connection& conn, Frame& out);

class TcpConnection : public Connection {
public:
    // Takes over a socket bound to `io`; the connection drives `io` itself
    // while it waits, so `io` must not be run by anyone else.
    TcpConnection(std::shared_ptr<asio::io_context> io,
                  asio::ip::tcp::socket socket,
                  std::chrono::milliseconds timeout);
    ~TcpConnection() override;

    // Resolves and connects within `timeout`.
    static std::unique_ptr<TcpConnection> connect(const std::string& host,
                                                  uint16_t port,
                                                  std::chrono::milliseconds timeout,
                                                  std::error_code& ec);

    std::error_code write_all(const void* data, std::size_t size) override;
    std::error_code read_exact(void* data, std::size_t size) override;
    void close() override;
    std::string peer_description() const override;

    using Connection::write_all;

private:
    // Runs the private io_context until the pending operation completes or
    // the timeout elapses; on timeout the socket is closed and the result is
    // std::errc::timed_out.
    std::error_code run_until_done(std::error_code& op_ec);

    std::shared_ptr<asio::io_context> io_;
    asio::ip::tcp::socket socket_;
    std::chrono::milliseconds timeout_;
    std::string peer_;
};

// In-memory pipe used by tests: writes go to `outbound`, reads come from
// `inbound`. Reads past the end of `inbound` fail with eof.
class MemoryConnection : public Connection {
public:
    MemoryConnection() = default;
    explicit MemoryConnection(std::vector<uint8_t> inbound);

    std::error_code write_all(const void* data, std::size_t size) override;
    std::error_code read_exact(void* data, std::size_t size) override;
    void close() override { closed_ = true; }
    std::string peer_description() const override { return "memory"; }

    using Connection::write_all;

    void feed(const std::vector<uint8_t>& bytes);
    const std::vector<uint8_t>& outbound() const { return outbound_; }
    std::vector<uint8_t> take_outbound();
    std::size_t remaining() const { return inbound_.size(); }
    bool closed() const { return closed_; }

private:
    mutable std::mutex m_;
    std::deque<uint8_t> inbound_;
    std::vector<uint8_t> outbound_;
    bool closed_ = false;
};
