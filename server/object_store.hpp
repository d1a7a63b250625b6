#pragma once

// ============================================================
// object_store.hpp -- Committed objects on disk plus pending uploads
//
// Parts of an upload are spooled to "<root>/parts/<file_id>.<index>"
// as they arrive, in any order. commit() concatenates them in index
// order into "<root>/objects/<location_id>.obj", verifying the
// xxh3-128 checksum when one is attached. Reads are served through
// a cached mmap of the object file.
//
// Failures are raised as RemoteError so the server can answer them
// with the matching ERROR code.
// ============================================================

#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/platform.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct StoredObject {
    u64         location_id{0};
    u32         endpoint_id{0};
    u64         size{0};
    std::string name;
    std::string path;
};

class ObjectStore {
public:
    // Creates the directory layout; picks up objects left by a previous run
    explicit ObjectStore(std::string root_dir);

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    // total_parts is only checked for big uploads
    void put_part(u64 file_id, u32 part_index, u32 total_parts, bool big,
                  const u8* data, size_t len);

    // All of [0, part_count) must be present. Pending parts are dropped
    // whether or not the commit succeeds.
    StoredObject commit(u32 endpoint_id, u64 file_id, u32 part_count, bool big,
                        const std::optional<hash::Hash128>& checksum,
                        const std::string& name);

    // Up to limit bytes at offset; empty at or past the end
    std::vector<u8> read(u64 location_id, u64 offset, u32 limit);

    std::optional<StoredObject> find(u64 location_id) const;

    // Drop uploads that received no part for longer than max_age
    size_t expire_pending(std::chrono::seconds max_age);

    size_t object_count() const;
    size_t pending_uploads() const;
    const std::string& root() const { return root_; }

private:
    struct PendingUpload {
        std::map<u32, std::string>            parts;   // index -> spool path
        u32                                   total_parts{0};
        bool                                  big{false};
        std::chrono::steady_clock::time_point last_part;
    };

    std::string part_path(u64 file_id, u32 index) const;
    void discard_locked(u64 file_id);
    void scan_existing();

    std::string root_;
    std::string objects_dir_;
    std::string parts_dir_;

    mutable std::mutex                                               mutex_;
    std::unordered_map<u64, StoredObject>                            objects_;
    std::unordered_map<u64, PendingUpload>                           pending_;
    std::unordered_map<u64, std::shared_ptr<file_io::MmapReader>>    readers_;
};
