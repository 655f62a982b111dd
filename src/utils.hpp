#pragma once

#include <openssl/sha.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using Sha256Digest = std::array<unsigned char, SHA256_DIGEST_LENGTH>;

std::string hex_from_bytes(const unsigned char* data, std::size_t size);
std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string hex_from_digest(const Sha256Digest& digest);
bool is_hex_string(const std::string& value, std::size_t expected_length);

Sha256Digest sha256_digest(const void* data, std::size_t size);
std::string sha256_hex(const std::string& data);

// Incremental SHA-256 over OpenSSL's context API.
class Sha256Stream {
public:
  Sha256Stream();
  void update(const void* data, std::size_t size);
  Sha256Digest finish();
  std::string finish_hex() { return hex_from_digest(finish()); }

private:
  SHA256_CTX ctx_;
  bool finished_ = false;
};

// Streams the file through SHA-256; nullopt when it cannot be read.
std::optional<std::string> sha256_file(const std::filesystem::path& file,
                                       std::size_t buffer_size = 64 * 1024);

// Turns a peer-supplied or scanned path into the canonical catalog form:
// forward slashes, no leading "./" or "/", no "." or ".." components.
// Returns nullopt for empty paths and paths escaping the root.
std::optional<std::string> normalize_relative_path(const std::string& input);

// True when an existing component of `relative` under `root` is a symlink or
// cannot be inspected. Missing components end the walk.
bool crosses_symlink(const std::filesystem::path& root, const std::string& relative);

// Modification time in milliseconds since the Unix epoch (symlinks not followed).
std::optional<int64_t> file_mtime_ms(const std::filesystem::path& file, std::error_code& ec);
bool set_file_mtime_ms(const std::filesystem::path& file, int64_t mtime_ms, std::error_code& ec);

int64_t unix_time_ms();
std::string random_hex_token(std::size_t bytes = 16);

// Address the host would use to reach the LAN, "127.0.0.1" when unknown.
std::string detect_local_ip();
