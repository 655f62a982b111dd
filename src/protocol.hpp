#pragma once
#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "utils.hpp"

using json = nlohmann::json;

// ---- discovery datagram ----------------------------------------------------

inline constexpr const char* kAnnounceType = "lansync_announce";
inline constexpr int kAnnounceVersion = 1;
inline constexpr std::size_t kTokenHexLength = 32;
inline constexpr std::size_t kMaxDatagramSize = 512;

struct Announcement {
  std::string token;
  uint16_t port = 0;
};

std::string encode_announcement(const Announcement& announcement);
// nullopt for anything that is not a well-formed announcement; `error`
// says why.
std::optional<Announcement> decode_announcement(const std::string& datagram, std::string& error);

// ---- request framing -------------------------------------------------------
//
// Every control message on the transfer port is a frame:
//   tag (1 byte) | body length (4 bytes, big-endian) | JSON body
// File bytes never travel inside a frame; they follow as chunk records.

enum class FrameTag : uint8_t {
  CatalogRequest  = 'C',
  CatalogResponse = 'L',
  GetFile         = 'G',
  PutFile         = 'P',
  Ready           = 'R',
  Ack             = 'K',
  Error           = 'E'
};

inline constexpr std::size_t kFramePreambleSize = 5;
inline constexpr uint32_t kMaxFrameBody = 64u * 1024u * 1024u;

bool is_known_tag(uint8_t tag);
const char* to_string(FrameTag tag);

struct Frame {
  FrameTag tag = FrameTag::Error;
  json body = json::object();
};

std::vector<uint8_t> encode_frame(const Frame& frame);

// ---- chunk records ---------------------------------------------------------
//
// Fixed 68-byte header, big-endian:
//   magic "LSCK" (4) | version (2) | path length (2) | total size (8)
//   chunk index (4) | chunk count (4) | payload length (4)
//   modified at, ms since epoch (8) | SHA-256 of payload (32)
// followed by the path bytes and then exactly `payload length` bytes.

inline constexpr std::array<uint8_t, 4> kChunkMagic = {'L', 'S', 'C', 'K'};
inline constexpr uint16_t kChunkVersion = 1;
inline constexpr std::size_t kChunkHeaderSize = 68;
inline constexpr std::size_t kMaxPathBytes = 4096;
inline constexpr std::size_t kMaxChunkPayload = 16u * 1024u * 1024u;

struct ChunkHeader {
  std::string relative_path;
  uint64_t total_size = 0;
  uint32_t chunk_index = 0;
  uint32_t chunk_count = 0;
  uint32_t payload_size = 0;
  int64_t modified_at = 0;
  Sha256Digest chunk_digest{};
};

// Number of chunks a file of `size` bytes is split into. An empty file is
// still sent as one empty chunk so that the receiver has a commit point.
uint32_t chunk_count_for(uint64_t size, std::size_t chunk_size);

// Fixed part followed by the path bytes.
std::vector<uint8_t> encode_chunk_header(const ChunkHeader& header);

// Decodes the fixed part; relative_path is left empty and the path length is
// returned through `path_length`. nullopt with `error` set on any field that
// is out of range.
std::optional<ChunkHeader> decode_chunk_header_fixed(const uint8_t* data,
                                                     std::size_t size,
                                                     uint16_t& path_length,
                                                     std::string& error);

// ---- catalog ---------------------------------------------------------------

json catalog_to_json(const Catalog& catalog);
// Entries with an invalid path or hash are rejected as a whole.
std::optional<Catalog> catalog_from_json(const json& j, std::string& error);

// ---- byte order helpers ----------------------------------------------------

void put_u16(uint8_t* out, uint16_t value);
void put_u32(uint8_t* out, uint32_t value);
void put_u64(uint8_t* out, uint64_t value);
uint16_t get_u16(const uint8_t* in);
uint32_t get_u32(const uint8_t* in);
uint64_t get_u64(const uint8_t* in);
