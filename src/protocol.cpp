#include "protocol.hpp"

#include <algorithm>
#include <cstring>

void put_u16(uint8_t* out, uint16_t value){
    out[0] = static_cast<uint8_t>(value >> 8);
    out[1] = static_cast<uint8_t>(value);
}

void put_u32(uint8_t* out, uint32_t value){
    for(int i = 3; i >= 0; --i){
        out[i] = static_cast<uint8_t>(value);
        value >>= 8;
    }
}

void put_u64(uint8_t* out, uint64_t value){
    for(int i = 7; i >= 0; --i){
        out[i] = static_cast<uint8_t>(value);
        value >>= 8;
    }
}

uint16_t get_u16(const uint8_t* in){
    return static_cast<uint16_t>((in[0] << 8) | in[1]);
}

uint32_t get_u32(const uint8_t* in){
    uint32_t v = 0;
    for(int i = 0; i < 4; ++i) v = (v << 8) | in[i];
    return v;
}

uint64_t get_u64(const uint8_t* in){
    uint64_t v = 0;
    for(int i = 0; i < 8; ++i) v = (v << 8) | in[i];
    return v;
}

std::string encode_announcement(const Announcement& announcement){
    json j;
    j["type"] = kAnnounceType;
    j["v"] = kAnnounceVersion;
    j["token"] = announcement.token;
    j["port"] = announcement.port;
    return j.dump();
}

std::optional<Announcement> decode_announcement(const std::string& datagram, std::string& error){
    json j = json::parse(datagram, nullptr, false);
    if(j.is_discarded() || !j.is_object()){
        error = "not a JSON object";
        return std::nullopt;
    }
    if(!j.contains("type") || !j["type"].is_string() || j["type"].get<std::string>() != kAnnounceType){
        error = "unexpected type";
        return std::nullopt;
    }
    if(!j.contains("v") || !j["v"].is_number_integer() || j["v"].get<int>() != kAnnounceVersion){
        error = "unsupported version";
        return std::nullopt;
    }
    if(!j.contains("token") || !j["token"].is_string()){
        error = "missing token";
        return std::nullopt;
    }
    auto token = j["token"].get<std::string>();
    if(!is_hex_string(token, kTokenHexLength)){
        error = "token must be " + std::to_string(kTokenHexLength) + " hex characters";
        return std::nullopt;
    }
    if(!j.contains("port") || !j["port"].is_number_integer()){
        error = "missing or non-numeric port";
        return std::nullopt;
    }
    auto port = j["port"].get<long long>();
    if(port <= 0 || port > 65535){
        error = "port out of range";
        return std::nullopt;
    }
    Announcement out;
    out.token = std::move(token);
    out.port = static_cast<uint16_t>(port);
    return out;
}

bool is_known_tag(uint8_t tag){
    switch(static_cast<FrameTag>(tag)){
        case FrameTag::CatalogRequest:
        case FrameTag::CatalogResponse:
        case FrameTag::GetFile:
        case FrameTag::PutFile:
        case FrameTag::Ready:
        case FrameTag::Ack:
        case FrameTag::Error:
            return true;
    }
    return false;
}

const char* to_string(FrameTag tag){
    switch(tag){
        case FrameTag::CatalogRequest: return "catalog_request";
        case FrameTag::CatalogResponse: return "catalog_response";
        case FrameTag::GetFile: return "get_file";
        case FrameTag::PutFile: return "put_file";
        case FrameTag::Ready: return "ready";
        case FrameTag::Ack: return "ack";
        case FrameTag::Error: return "error";
    }
    return "unknown";
}

std::vector<uint8_t> encode_frame(const Frame& frame){
    std::string body = frame.body.is_null() ? std::string() : frame.body.dump();
    std::vector<uint8_t> out(kFramePreambleSize + body.size());
    out[0] = static_cast<uint8_t>(frame.tag);
    put_u32(out.data() + 1, static_cast<uint32_t>(body.size()));
    std::memcpy(out.data() + kFramePreambleSize, body.data(), body.size());
    return out;
}

uint32_t chunk_count_for(uint64_t size, std::size_t chunk_size){
    if(size == 0 || chunk_size == 0) return 1;
    return static_cast<uint32_t>((size + chunk_size - 1) / chunk_size);
}

std::vector<uint8_t> encode_chunk_header(const ChunkHeader& header){
    std::vector<uint8_t> out(kChunkHeaderSize + header.relative_path.size());
    uint8_t* p = out.data();
    std::copy(kChunkMagic.begin(), kChunkMagic.end(), p);
    put_u16(p + 4, kChunkVersion);
    put_u16(p + 6, static_cast<uint16_t>(header.relative_path.size()));
    put_u64(p + 8, header.total_size);
    put_u32(p + 16, header.chunk_index);
    put_u32(p + 20, header.chunk_count);
    put_u32(p + 24, header.payload_size);
    put_u64(p + 28, static_cast<uint64_t>(header.modified_at));
    std::copy(header.chunk_digest.begin(), header.chunk_digest.end(), p + 36);
    std::memcpy(p + kChunkHeaderSize, header.relative_path.data(), header.relative_path.size());
    return out;
}

std::optional<ChunkHeader> decode_chunk_header_fixed(const uint8_t* data,
                                                     std::size_t size,
                                                     uint16_t& path_length,
                                                     std::string& error){
    if(size < kChunkHeaderSize){
        error = "short chunk header";
        return std::nullopt;
    }
    if(!std::equal(kChunkMagic.begin(), kChunkMagic.end(), data)){
        error = "bad chunk magic";
        return std::nullopt;
    }
    if(get_u16(data + 4) != kChunkVersion){
        error = "unsupported chunk version " + std::to_string(get_u16(data + 4));
        return std::nullopt;
    }
    path_length = get_u16(data + 6);
    if(path_length == 0 || path_length > kMaxPathBytes){
        error = "path length " + std::to_string(path_length) + " out of range";
        return std::nullopt;
    }

    ChunkHeader header;
    header.total_size = get_u64(data + 8);
    header.chunk_index = get_u32(data + 16);
    header.chunk_count = get_u32(data + 20);
    header.payload_size = get_u32(data + 24);
    header.modified_at = static_cast<int64_t>(get_u64(data + 28));
    std::copy(data + 36, data + 68, header.chunk_digest.begin());

    if(header.chunk_count == 0 || header.chunk_index >= header.chunk_count){
        error = "chunk index " + std::to_string(header.chunk_index) +
                " not below count " + std::to_string(header.chunk_count);
        return std::nullopt;
    }
    if(header.payload_size > kMaxChunkPayload || header.payload_size > header.total_size){
        error = "payload length " + std::to_string(header.payload_size) + " out of range";
        return std::nullopt;
    }
    return header;
}

json catalog_to_json(const Catalog& catalog){
    json j;
    j["type"] = "catalog";
    j["owner"] = catalog.owner;
    j["generated_at"] = catalog.generated_at;
    json arr = json::array();
    for(const auto& kv : catalog.entries){
        const auto& entry = kv.second;
        json item;
        item["path"] = entry.relative_path;
        item["size"] = entry.size;
        item["hash"] = entry.content_hash;
        item["modified_at"] = entry.modified_at;
        arr.push_back(item);
    }
    j["entries"] = arr;
    return j;
}

std::optional<Catalog> catalog_from_json(const json& j, std::string& error){
    if(!j.is_object() || !j.contains("type") || !j["type"].is_string() || j["type"].get<std::string>() != "catalog"){
        error = "not a catalog";
        return std::nullopt;
    }
    if(!j.contains("entries") || !j["entries"].is_array()){
        error = "catalog without entries";
        return std::nullopt;
    }

    Catalog catalog;
    try {
        if(j.contains("owner")) catalog.owner = j["owner"].get<std::string>();
        if(j.contains("generated_at")) catalog.generated_at = j["generated_at"].get<int64_t>();
        for(const auto& item : j["entries"]){
            auto raw_path = item.at("path").get<std::string>();
            auto path = normalize_relative_path(raw_path);
            if(!path || *path != raw_path || is_reserved_path(*path)){
                error = "invalid path '" + raw_path + "'";
                return std::nullopt;
            }
            FileEntry entry;
            entry.relative_path = *path;
            entry.size = item.at("size").get<uint64_t>();
            entry.content_hash = item.at("hash").get<std::string>();
            entry.modified_at = item.at("modified_at").get<int64_t>();
            if(!is_hex_string(entry.content_hash, 2 * SHA256_DIGEST_LENGTH)){
                error = "invalid hash for '" + raw_path + "'";
                return std::nullopt;
            }
            if(!catalog.entries.emplace(entry.relative_path, entry).second){
                error = "duplicate path '" + raw_path + "'";
                return std::nullopt;
            }
        }
    } catch(const json::exception& e){
        error = std::string("malformed entry: ") + e.what();
        return std::nullopt;
    }
    return catalog;
}
