#pragma once

// protocol.hpp -- Wire protocol between parxfer clients and object endpoints

#include "platform.hpp"
#include <cstring>

// Magic number: "PXF1"
static constexpr u32 PARXFER_MAGIC   = 0x50584631u;
static constexpr u8  PARXFER_VERSION = 1;

static constexpr u32 MAX_PAYLOAD_LEN = 16u * 1024u * 1024u;

// Largest part a client may send or request in one message
static constexpr u32 MAX_PART_SIZE     = 512u * 1024u;
static constexpr u32 DEFAULT_PART_SIZE = MAX_PART_SIZE;
// Above this a file is uploaded with "big" parts and no checksum
static constexpr u64 LARGE_FILE_THRESHOLD = 10ull * 1024u * 1024u;

static constexpr size_t AUTH_KEY_LEN = 16;

// ---- Message Types (prefixed MT_ to avoid Windows macro collisions) ----
enum class MsgType : u16 {
    MT_AUTH_SESSION   = 0x0001,  // client→server: authorize with a stored session string
    MT_AUTH_KEY       = 0x0002,  // client→server: authorize with a shared auth key
    MT_AUTH_OK        = 0x0003,  // server→client: AuthOk

    MT_EXPORT_AUTH    = 0x0010,  // client→server: export authorization for another endpoint
    MT_EXPORTED_AUTH  = 0x0011,  // server→client: ExportedAuthMsg
    MT_IMPORT_AUTH    = 0x0012,  // client→server: import authorization, answered by AUTH_OK

    MT_GET_FILE       = 0x0020,  // client→server: GetFileReq
    MT_FILE_BYTES     = 0x0021,  // server→client: raw chunk bytes

    MT_SAVE_PART      = 0x0030,  // client→server: SavePartReq + data
    MT_COMMIT_FILE    = 0x0031,  // client→server: CommitFileReq + name
    MT_FILE_LOCATION  = 0x0032,  // server→client: FileLocationMsg

    MT_OK             = 0x0050,
    MT_PING           = 0x0070,
    MT_PONG           = 0x0071,
    MT_ERROR          = 0x00FF,  // server→client: ErrorMsg + message text
};

// ---- Error codes carried in MT_ERROR ----
enum class ErrorCode : u32 {
    NONE              = 0,
    FLOOD_WAIT        = 1,  // value = suggested wait in seconds
    AUTH_REQUIRED     = 2,
    AUTH_INVALID      = 3,
    BAD_REQUEST       = 4,
    NOT_FOUND         = 5,
    CHECKSUM_MISMATCH = 6,
    PART_ORDER        = 7,  // part index went backwards on one connection
    INTERNAL          = 8,
};

inline const char* error_code_str(ErrorCode c) {
    switch (c) {
        case ErrorCode::NONE:              return "NONE";
        case ErrorCode::FLOOD_WAIT:        return "FLOOD_WAIT";
        case ErrorCode::AUTH_REQUIRED:     return "AUTH_REQUIRED";
        case ErrorCode::AUTH_INVALID:      return "AUTH_INVALID";
        case ErrorCode::BAD_REQUEST:       return "BAD_REQUEST";
        case ErrorCode::NOT_FOUND:         return "NOT_FOUND";
        case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case ErrorCode::PART_ORDER:        return "PART_ORDER";
        case ErrorCode::INTERNAL:          return "INTERNAL";
    }
    return "UNKNOWN";
}

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// AuthSessionReq: 16 bytes fixed + session string + api hash
struct AuthSessionReq {
    u8  magic[4];
    u8  version;
    u8  pad;
    u16 session_len;
    u32 api_id;
    u16 api_hash_len;
    u8  pad2[2];
};
static_assert(sizeof(AuthSessionReq) == 16, "AuthSessionReq size mismatch");

// AuthKeyReq: 24 bytes
struct AuthKeyReq {
    u8  magic[4];
    u8  version;
    u8  pad[3];
    u8  auth_key[AUTH_KEY_LEN];
};
static_assert(sizeof(AuthKeyReq) == 24, "AuthKeyReq size mismatch");

// AuthOk: 24 bytes. authorized=0 means the session string was rejected.
struct AuthOk {
    u32 endpoint_id;
    u8  authorized;
    u8  pad[3];
    u8  auth_key[AUTH_KEY_LEN];
};
static_assert(sizeof(AuthOk) == 24, "AuthOk size mismatch");

// ExportAuthReq: 8 bytes
struct ExportAuthReq {
    u32 endpoint_id;
    u8  pad[4];
};
static_assert(sizeof(ExportAuthReq) == 8, "ExportAuthReq size mismatch");

// ExportedAuthMsg: 24 bytes
struct ExportedAuthMsg {
    u64 auth_id;
    u8  bytes[16];
};
static_assert(sizeof(ExportedAuthMsg) == 24, "ExportedAuthMsg size mismatch");

// ImportAuthReq: 32 bytes
struct ImportAuthReq {
    u8  magic[4];
    u8  version;
    u8  pad[3];
    u64 auth_id;
    u8  bytes[16];
};
static_assert(sizeof(ImportAuthReq) == 32, "ImportAuthReq size mismatch");

// GetFileReq: 24 bytes
struct GetFileReq {
    u64 location_id;
    u64 offset;
    u32 limit;
    u8  pad[4];
};
static_assert(sizeof(GetFileReq) == 24, "GetFileReq size mismatch");

// SavePartReq: 24 bytes fixed + part data
struct SavePartReq {
    u64 file_id;
    u32 part_index;
    u32 total_parts;   // only meaningful when big=1
    u8  big;
    u8  pad[7];
};
static_assert(sizeof(SavePartReq) == 24, "SavePartReq size mismatch");

// CommitFileReq: 32 bytes fixed + name
struct CommitFileReq {
    u64 file_id;
    u32 part_count;
    u8  big;
    u8  has_checksum;
    u16 name_len;
    u8  checksum[16];  // xxh3_128, valid when has_checksum=1
};
static_assert(sizeof(CommitFileReq) == 32, "CommitFileReq size mismatch");

// FileLocationMsg: 24 bytes
struct FileLocationMsg {
    u64 location_id;
    u64 size;
    u32 endpoint_id;
    u8  pad[4];
};
static_assert(sizeof(FileLocationMsg) == 24, "FileLocationMsg size mismatch");

// ErrorMsg: 16 bytes fixed + message
struct ErrorMsg {
    u32 code;
    u32 value;
    u16 msg_len;
    u8  pad[6];
};
static_assert(sizeof(ErrorMsg) == 16, "ErrorMsg size mismatch");

#pragma pack(pop)

inline void stamp_magic(u8 magic[4]) {
    magic[0] = (u8)(PARXFER_MAGIC >> 24);
    magic[1] = (u8)(PARXFER_MAGIC >> 16);
    magic[2] = (u8)(PARXFER_MAGIC >>  8);
    magic[3] = (u8)(PARXFER_MAGIC      );
}

inline bool valid_magic(const u8 magic[4]) {
    u32 m = ((u32)magic[0] << 24) | ((u32)magic[1] << 16) |
            ((u32)magic[2] <<  8) |  (u32)magic[3];
    return m == PARXFER_MAGIC;
}
