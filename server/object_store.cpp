// ============================================================
// object_store.cpp
// ============================================================

#include "object_store.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

ObjectStore::ObjectStore(std::string root_dir)
    : root_(std::move(root_dir))
{
    if (!utils::validate_path(root_)) throw std::invalid_argument("Invalid store directory");
    objects_dir_ = (fs::path(root_) / "objects").string();
    parts_dir_   = (fs::path(root_) / "parts").string();
    fs::create_directories(objects_dir_);

    // Parts of uploads that never committed are useless after a restart
    std::error_code ec;
    fs::remove_all(parts_dir_, ec);
    if (ec) LOG_WARN("Cannot clear " + parts_dir_ + ": " + ec.message());
    fs::create_directories(parts_dir_);

    scan_existing();
}

void ObjectStore::scan_existing() {
    for (const auto& entry : fs::directory_iterator(objects_dir_)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".obj") continue;
        u64 id = 0;
        if (!utils::parse_u64(entry.path().stem().string(), id) || id == 0) continue;
        StoredObject obj;
        obj.location_id = id;
        obj.size        = (u64)entry.file_size();
        obj.name        = entry.path().filename().string();
        obj.path        = entry.path().string();
        objects_[id] = std::move(obj);
    }
    if (!objects_.empty()) {
        LOG_INFO("Object store: " + std::to_string(objects_.size()) + " objects in " + objects_dir_);
    }
}

std::string ObjectStore::part_path(u64 file_id, u32 index) const {
    return (fs::path(parts_dir_) / (std::to_string(file_id) + "." + std::to_string(index))).string();
}

void ObjectStore::put_part(u64 file_id, u32 part_index, u32 total_parts, bool big,
                           const u8* data, size_t len)
{
    if (big && part_index >= total_parts) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0,
                          "part " + std::to_string(part_index) + " of " + std::to_string(total_parts));
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = pending_.find(file_id);
        if (it != pending_.end() && it->second.big != big) {
            throw RemoteError(ErrorCode::BAD_REQUEST, 0, "mixed big and small parts");
        }
        if (it != pending_.end() && big && it->second.total_parts != total_parts) {
            throw RemoteError(ErrorCode::BAD_REQUEST, 0, "total part count changed");
        }
    }

    std::string path = part_path(file_id, part_index);
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) throw RemoteError(ErrorCode::INTERNAL, 0, "cannot spool part");
        out.write(reinterpret_cast<const char*>(data), (std::streamsize)len);
        if (!out) throw RemoteError(ErrorCode::INTERNAL, 0, "part write failed");
    }

    std::lock_guard<std::mutex> lk(mutex_);
    PendingUpload& up = pending_[file_id];
    up.big         = big;
    up.total_parts = total_parts;
    up.parts[part_index] = std::move(path);
    up.last_part   = std::chrono::steady_clock::now();
}

void ObjectStore::discard_locked(u64 file_id) {
    auto it = pending_.find(file_id);
    if (it == pending_.end()) return;
    for (const auto& kv : it->second.parts) {
        std::error_code ec;
        fs::remove(kv.second, ec);
    }
    pending_.erase(it);
}

StoredObject ObjectStore::commit(u32 endpoint_id, u64 file_id, u32 part_count, bool big,
                                 const std::optional<hash::Hash128>& checksum,
                                 const std::string& name)
{
    PendingUpload up;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = pending_.find(file_id);
        if (it != pending_.end()) {
            up = std::move(it->second);
            pending_.erase(it);
        }
    }
    // Spool files are ours from here on; remove them on every path
    struct SpoolCleanup {
        const PendingUpload& up;
        ~SpoolCleanup() {
            for (const auto& kv : up.parts) {
                std::error_code ec;
                fs::remove(kv.second, ec);
            }
        }
    } spool_cleanup{up};

    if (up.parts.size() != part_count) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0,
                          "expected " + std::to_string(part_count) + " parts, have " +
                          std::to_string(up.parts.size()));
    }
    if (part_count > 0 && (up.parts.begin()->first != 0 || up.parts.rbegin()->first != part_count - 1)) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0, "part indices are not contiguous");
    }
    if (part_count > 0 && up.big != big) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0, "big flag does not match the parts");
    }
    if (big && part_count > 0 && up.total_parts != part_count) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0, "total part count does not match");
    }

    StoredObject obj;
    obj.endpoint_id = endpoint_id;
    obj.name        = name;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        do {
            obj.location_id = utils::random_id();
        } while (objects_.count(obj.location_id));
    }
    obj.path = (fs::path(objects_dir_) / (std::to_string(obj.location_id) + ".obj")).string();

    hash::StreamHasher128 hasher;
    {
        file_io::AtomicFileWriter out(obj.path);
        std::vector<char> buf;
        for (const auto& kv : up.parts) {
            std::ifstream in(kv.second, std::ios::binary | std::ios::ate);
            if (!in) throw RemoteError(ErrorCode::INTERNAL, 0, "missing spooled part");
            std::streamsize n = in.tellg();
            in.seekg(0);
            buf.resize((size_t)n);
            if (n > 0 && !in.read(buf.data(), n)) {
                throw RemoteError(ErrorCode::INTERNAL, 0, "cannot read spooled part");
            }
            if (checksum) hasher.update(buf.data(), buf.size());
            out.write(buf.data(), buf.size());
        }
        if (checksum && hasher.digest() != *checksum) {
            LOG_WARN("Checksum mismatch for upload " + std::to_string(file_id) + " (" + name +
                     "): got " + hash::to_hex(hasher.digest()) +
                     ", expected " + hash::to_hex(*checksum));
            throw RemoteError(ErrorCode::CHECKSUM_MISMATCH, 0, "checksum mismatch");
        }
        out.commit();
        obj.size = out.bytes_written();
    }

    std::lock_guard<std::mutex> lk(mutex_);
    objects_[obj.location_id] = obj;
    LOG_INFO("Stored " + name + " as " + std::to_string(obj.location_id) + " (" +
             utils::format_bytes(obj.size) + ", " + std::to_string(part_count) + " parts" +
             (checksum ? ", checksum ok" : "") + ")");
    return obj;
}

std::vector<u8> ObjectStore::read(u64 location_id, u64 offset, u32 limit) {
    std::shared_ptr<file_io::MmapReader> reader;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto obj = objects_.find(location_id);
        if (obj == objects_.end()) {
            throw RemoteError(ErrorCode::NOT_FOUND, 0, "no object " + std::to_string(location_id));
        }
        auto it = readers_.find(location_id);
        if (it == readers_.end()) {
            it = readers_.emplace(location_id,
                                  std::make_shared<file_io::MmapReader>(obj->second.path)).first;
        }
        reader = it->second;
    }
    return reader->slice(offset, limit);
}

std::optional<StoredObject> ObjectStore::find(u64 location_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = objects_.find(location_id);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

size_t ObjectStore::expire_pending(std::chrono::seconds max_age) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto now = std::chrono::steady_clock::now();
    std::vector<u64> stale;
    for (const auto& kv : pending_) {
        if (now - kv.second.last_part > max_age) stale.push_back(kv.first);
    }
    for (u64 id : stale) {
        LOG_WARN("Expiring uncommitted upload " + std::to_string(id) + " (" +
                 std::to_string(pending_[id].parts.size()) + " parts)");
        discard_locked(id);
    }
    return stale.size();
}

size_t ObjectStore::object_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return objects_.size();
}

size_t ObjectStore::pending_uploads() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_.size();
}
