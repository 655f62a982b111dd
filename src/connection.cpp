#include "connection.hpp"

#include <algorithm>
#include <cstring>

std::error_code write_frame(Connection& conn, FrameTag tag, const json& body){
    Frame frame;
    frame.tag = tag;
    frame.body = body;
    return conn.write_all(encode_frame(frame));
}

std::error_code read_frame(Connection& conn, Frame& out){
    uint8_t preamble[kFramePreambleSize];
    if(auto ec = conn.read_exact(preamble, sizeof(preamble))) return ec;
    if(!is_known_tag(preamble[0])){
        return std::make_error_code(std::errc::bad_message);
    }
    uint32_t length = get_u32(preamble + 1);
    if(length > kMaxFrameBody){
        return std::make_error_code(std::errc::bad_message);
    }

    std::string body(length, '\0');
    if(length > 0){
        if(auto ec = conn.read_exact(body.data(), body.size())) return ec;
    }

    out.tag = static_cast<FrameTag>(preamble[0]);
    if(body.empty()){
        out.body = json::object();
        return {};
    }
    out.body = json::parse(body, nullptr, false);
    if(out.body.is_discarded()){
        return std::make_error_code(std::errc::bad_message);
    }
    return {};
}

// ---- TcpConnection ---------------------------------------------------------

TcpConnection::TcpConnection(std::shared_ptr<asio::io_context> io,
                             asio::ip::tcp::socket socket,
                             std::chrono::milliseconds timeout)
: io_(std::move(io)), socket_(std::move(socket)), timeout_(timeout)
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("unconnected") : ep.address().to_string() + ":" + std::to_string(ep.port());
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

TcpConnection::~TcpConnection(){
    close();
}

std::unique_ptr<TcpConnection> TcpConnection::connect(const std::string& host,
                                                      uint16_t port,
                                                      std::chrono::milliseconds timeout,
                                                      std::error_code& ec){
    auto io = std::make_shared<asio::io_context>();
    asio::ip::tcp::resolver resolver(*io);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if(ec) return nullptr;

    asio::ip::tcp::socket socket(*io);
    std::error_code op_ec = asio::error::would_block;
    asio::async_connect(socket, endpoints,
        [&op_ec](std::error_code e, const asio::ip::tcp::endpoint&){ op_ec = e; });

    io->restart();
    io->run_for(timeout);
    if(!io->stopped()){
        std::error_code ignore;
        socket.close(ignore);
        io->run();
        ec = std::make_error_code(std::errc::timed_out);
        return nullptr;
    }
    if(op_ec){
        ec = op_ec;
        return nullptr;
    }
    ec.clear();
    return std::make_unique<TcpConnection>(std::move(io), std::move(socket), timeout);
}

std::error_code TcpConnection::run_until_done(std::error_code& op_ec){
    io_->restart();
    io_->run_for(timeout_);
    if(!io_->stopped()){
        // Cancel the pending operation and let its handler run.
        std::error_code ignore;
        socket_.close(ignore);
        io_->run();
        return std::make_error_code(std::errc::timed_out);
    }
    if(op_ec == asio::error::operation_aborted){
        return std::make_error_code(std::errc::timed_out);
    }
    return op_ec;
}

std::error_code TcpConnection::write_all(const void* data, std::size_t size){
    if(!socket_.is_open()) return asio::error::not_connected;
    std::error_code op_ec = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(data, size),
        [&op_ec](std::error_code e, std::size_t){ op_ec = e; });
    return run_until_done(op_ec);
}

std::error_code TcpConnection::read_exact(void* data, std::size_t size){
    if(!socket_.is_open()) return asio::error::not_connected;
    std::error_code op_ec = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(data, size),
        [&op_ec](std::error_code e, std::size_t){ op_ec = e; });
    return run_until_done(op_ec);
}

void TcpConnection::close(){
    if(!socket_.is_open()) return;
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

std::string TcpConnection::peer_description() const {
    return peer_;
}

// ---- MemoryConnection ------------------------------------------------------

MemoryConnection::MemoryConnection(std::vector<uint8_t> inbound)
: inbound_(inbound.begin(), inbound.end())
{
}

std::error_code MemoryConnection::write_all(const void* data, std::size_t size){
    std::lock_guard lg(m_);
    if(closed_) return std::make_error_code(std::errc::not_connected);
    auto* p = static_cast<const uint8_t*>(data);
    outbound_.insert(outbound_.end(), p, p + size);
    return {};
}

std::error_code MemoryConnection::read_exact(void* data, std::size_t size){
    std::lock_guard lg(m_);
    if(closed_) return std::make_error_code(std::errc::not_connected);
    if(inbound_.size() < size){
        inbound_.clear();
        return asio::error::eof;
    }
    auto* p = static_cast<uint8_t*>(data);
    std::copy_n(inbound_.begin(), size, p);
    inbound_.erase(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(size));
    return {};
}

void MemoryConnection::feed(const std::vector<uint8_t>& bytes){
    std::lock_guard lg(m_);
    inbound_.insert(inbound_.end(), bytes.begin(), bytes.end());
}

std::vector<uint8_t> MemoryConnection::take_outbound(){
    std::lock_guard lg(m_);
    std::vector<uint8_t> out;
    out.swap(outbound_);
    return out;
}
