#include "utils.hpp"

#include <asio.hpp>

#include <sys/stat.h>
#include <fcntl.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return oss.str();
}

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    return hex_from_bytes(b.data(), b.size());
}

std::string hex_from_digest(const Sha256Digest& digest){
    return hex_from_bytes(digest.data(), digest.size());
}

bool is_hex_string(const std::string& value, std::size_t expected_length){
    if(value.size() != expected_length) return false;
    for(char c : value){
        if(!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Sha256Digest sha256_digest(const void* data, std::size_t size){
    Sha256Digest out{};
    SHA256(static_cast<const unsigned char*>(data), size, out.data());
    return out;
}

std::string sha256_hex(const std::string& data){
    return hex_from_digest(sha256_digest(data.data(), data.size()));
}

Sha256Stream::Sha256Stream(){
    SHA256_Init(&ctx_);
}

void Sha256Stream::update(const void* data, std::size_t size){
    if(size == 0 || finished_) return;
    SHA256_Update(&ctx_, data, size);
}

Sha256Digest Sha256Stream::finish(){
    Sha256Digest out{};
    if(!finished_){
        SHA256_Final(out.data(), &ctx_);
        finished_ = true;
    }
    return out;
}

std::optional<std::string> sha256_file(const std::filesystem::path& file, std::size_t buffer_size){
    std::ifstream in(file, std::ios::binary);
    if(!in) return std::nullopt;

    Sha256Stream hasher;
    std::vector<char> buffer(buffer_size == 0 ? 8192 : buffer_size);
    while(in){
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize read = in.gcount();
        if(read > 0) hasher.update(buffer.data(), static_cast<std::size_t>(read));
    }
    if(in.bad()) return std::nullopt;
    return hasher.finish_hex();
}

std::optional<std::string> normalize_relative_path(const std::string& input){
    std::string unified = input;
    for(auto& c : unified){
        if(c == '\\') c = '/';
    }

    std::vector<std::string> parts;
    std::string current;
    auto flush = [&]() -> bool {
        if(current.empty() || current == ".") {
            current.clear();
            return true;
        }
        if(current == "..") return false;
        parts.push_back(current);
        current.clear();
        return true;
    };
    for(char c : unified){
        if(c == '/'){
            if(!flush()) return std::nullopt;
        } else if(c == '\0'){
            return std::nullopt;
        } else {
            current.push_back(c);
        }
    }
    if(!flush()) return std::nullopt;
    if(parts.empty()) return std::nullopt;
    // "C:" style drive prefixes would escape the root on another OS
    if(parts.front().size() >= 2 && parts.front()[1] == ':') return std::nullopt;

    std::string out;
    for(const auto& p : parts){
        if(!out.empty()) out.push_back('/');
        out += p;
    }
    return out;
}

bool crosses_symlink(const std::filesystem::path& root, const std::string& relative){
    std::filesystem::path current = root;
    for(const auto& part : std::filesystem::path(relative)){
        current /= part;
        std::error_code ec;
        auto st = std::filesystem::symlink_status(current, ec);
        if(st.type() == std::filesystem::file_type::not_found) return false;
        if(ec || std::filesystem::is_symlink(st)) return true;
    }
    return false;
}

std::optional<int64_t> file_mtime_ms(const std::filesystem::path& file, std::error_code& ec){
    struct stat st{};
    if(::lstat(file.c_str(), &st) != 0){
        ec.assign(errno, std::generic_category());
        return std::nullopt;
    }
    ec.clear();
    return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 +
           static_cast<int64_t>(st.st_mtim.tv_nsec / 1000000);
}

bool set_file_mtime_ms(const std::filesystem::path& file, int64_t mtime_ms, std::error_code& ec){
    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = static_cast<time_t>(mtime_ms / 1000);
    times[1].tv_nsec = static_cast<long>((mtime_ms % 1000) * 1000000);
    if(times[1].tv_nsec < 0){
        times[1].tv_sec -= 1;
        times[1].tv_nsec += 1000000000L;
    }
    if(::utimensat(AT_FDCWD, file.c_str(), times, 0) != 0){
        ec.assign(errno, std::generic_category());
        return false;
    }
    ec.clear();
    return true;
}

int64_t unix_time_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string random_hex_token(std::size_t bytes){
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<unsigned char> raw(bytes);
    for(auto& b : raw) b = static_cast<unsigned char>(dist(rng));
    return hex_from_bytes(raw);
}

std::string detect_local_ip(){
    // Connecting a UDP socket sends nothing; it only selects the outbound interface.
    try {
        asio::io_context io;
        asio::ip::udp::socket sock(io);
        sock.connect(asio::ip::udp::endpoint(asio::ip::make_address("10.255.255.255"), 1));
        return sock.local_endpoint().address().to_string();
    } catch(const std::exception&) {
        return "127.0.0.1";
    }
}
