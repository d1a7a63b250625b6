#pragma once

// ============================================================
// protocol_io.hpp -- Byte-order handling and payload packing
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <string>
#include <stdexcept>

// Linux: htobe16/32/64 and be16/32/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Encode individual struct fields (in-place, host<->network) ----

inline void encode_auth_session_req(AuthSessionReq& r) {
    r.session_len  = hton16(r.session_len);
    r.api_id       = hton32(r.api_id);
    r.api_hash_len = hton16(r.api_hash_len);
}

inline void decode_auth_session_req(AuthSessionReq& r) {
    r.session_len  = ntoh16(r.session_len);
    r.api_id       = ntoh32(r.api_id);
    r.api_hash_len = ntoh16(r.api_hash_len);
}

inline void encode_auth_ok(AuthOk& a) {
    a.endpoint_id = hton32(a.endpoint_id);
}

inline void decode_auth_ok(AuthOk& a) {
    a.endpoint_id = ntoh32(a.endpoint_id);
}

inline void encode_export_auth_req(ExportAuthReq& r) {
    r.endpoint_id = hton32(r.endpoint_id);
}

inline void decode_export_auth_req(ExportAuthReq& r) {
    r.endpoint_id = ntoh32(r.endpoint_id);
}

inline void encode_exported_auth(ExportedAuthMsg& m) {
    m.auth_id = hton64(m.auth_id);
}

inline void decode_exported_auth(ExportedAuthMsg& m) {
    m.auth_id = ntoh64(m.auth_id);
}

inline void encode_import_auth_req(ImportAuthReq& r) {
    r.auth_id = hton64(r.auth_id);
}

inline void decode_import_auth_req(ImportAuthReq& r) {
    r.auth_id = ntoh64(r.auth_id);
}

inline void encode_get_file_req(GetFileReq& r) {
    r.location_id = hton64(r.location_id);
    r.offset      = hton64(r.offset);
    r.limit       = hton32(r.limit);
}

inline void decode_get_file_req(GetFileReq& r) {
    r.location_id = ntoh64(r.location_id);
    r.offset      = ntoh64(r.offset);
    r.limit       = ntoh32(r.limit);
}

inline void encode_save_part_req(SavePartReq& r) {
    r.file_id     = hton64(r.file_id);
    r.part_index  = hton32(r.part_index);
    r.total_parts = hton32(r.total_parts);
}

inline void decode_save_part_req(SavePartReq& r) {
    r.file_id     = ntoh64(r.file_id);
    r.part_index  = ntoh32(r.part_index);
    r.total_parts = ntoh32(r.total_parts);
}

inline void encode_commit_file_req(CommitFileReq& r) {
    r.file_id    = hton64(r.file_id);
    r.part_count = hton32(r.part_count);
    r.name_len   = hton16(r.name_len);
}

inline void decode_commit_file_req(CommitFileReq& r) {
    r.file_id    = ntoh64(r.file_id);
    r.part_count = ntoh32(r.part_count);
    r.name_len   = ntoh16(r.name_len);
}

inline void encode_file_location(FileLocationMsg& m) {
    m.location_id = hton64(m.location_id);
    m.size        = hton64(m.size);
    m.endpoint_id = hton32(m.endpoint_id);
}

inline void decode_file_location(FileLocationMsg& m) {
    m.location_id = ntoh64(m.location_id);
    m.size        = ntoh64(m.size);
    m.endpoint_id = ntoh32(m.endpoint_id);
}

inline void encode_error_msg(ErrorMsg& m) {
    m.code    = hton32(m.code);
    m.value   = hton32(m.value);
    m.msg_len = hton16(m.msg_len);
}

inline void decode_error_msg(ErrorMsg& m) {
    m.code    = ntoh32(m.code);
    m.value   = ntoh32(m.value);
    m.msg_len = ntoh16(m.msg_len);
}

// ---- Payload assembly: fixed struct (already encoded) + trailing bytes ----

template<typename T>
inline std::vector<u8> pack(const T& encoded, const void* tail = nullptr, size_t tail_len = 0) {
    std::vector<u8> payload(sizeof(T) + tail_len);
    std::memcpy(payload.data(), &encoded, sizeof(T));
    if (tail && tail_len > 0) {
        std::memcpy(payload.data() + sizeof(T), tail, tail_len);
    }
    return payload;
}

// Copy the fixed struct out of a payload; throws on short payloads
template<typename T>
inline T unpack(const std::vector<u8>& payload) {
    if (payload.size() < sizeof(T)) {
        throw std::runtime_error("Short payload: " + std::to_string(payload.size()) +
                                 " < " + std::to_string(sizeof(T)));
    }
    T out{};
    std::memcpy(&out, payload.data(), sizeof(T));
    return out;
}

// Read a trailing string of len bytes starting at offset
inline std::string tail_string(const std::vector<u8>& payload, size_t offset, size_t len) {
    if (payload.size() < offset + len) {
        throw std::runtime_error("Short payload tail");
    }
    return std::string(reinterpret_cast<const char*>(payload.data() + offset), len);
}

} // namespace proto
