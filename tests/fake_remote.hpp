#pragma once

// ============================================================
// fake_remote.hpp -- In-memory RemoteSession/RemoteConnection
//
// FakeCloud holds stored objects, pending uploads and counters the
// tests assert on. Faults (rate limits, failed opens, failed reads,
// rejected sessions) are switched on through its fields.
// ============================================================

#include "../client/remote.hpp"
#include "../common/clock.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

struct FakeCloud {
    struct PendingUpload {
        std::map<u32, std::vector<u8>> parts;
        bool                           big{false};
        u32                            total{0};
    };

    std::mutex mu;
    u32        home{1};
    std::set<u32> endpoints{1, 2, 3};

    std::map<u64, std::vector<u8>> objects;
    std::map<u64, PendingUpload>   uploads;
    std::map<int, std::vector<u32>> part_order;   // connection serial -> indices
    u64 next_location{100};

    int opened{0};
    int closed{0};
    int keyed_opens{0};
    int exports{0};
    int imports{0};
    int chunk_calls{0};

    // Faults
    int                 rate_limits_left{0};
    bool                rate_limit_forever{false};
    u32                 rate_limit_wait{0};
    int                 fail_open_after{-1};      // opens past this count throw
    bool                fail_import{false};
    bool                fail_disconnect{false};   // connections throw from disconnect()
    std::optional<u64>  fail_get_offset;
    std::chrono::milliseconds op_delay{0};

    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    u64 put_object(std::vector<u8> bytes) {
        std::lock_guard<std::mutex> lk(mu);
        u64 id = next_location++;
        objects[id] = std::move(bytes);
        return id;
    }

    std::vector<u8> object(u64 id) {
        std::lock_guard<std::mutex> lk(mu);
        return objects.at(id);
    }

    bool take_rate_limit() {
        std::lock_guard<std::mutex> lk(mu);
        if (rate_limit_forever) return true;
        if (rate_limits_left > 0) {
            --rate_limits_left;
            return true;
        }
        return false;
    }

    int open_count() {
        std::lock_guard<std::mutex> lk(mu);
        return opened;
    }

    int close_count() {
        std::lock_guard<std::mutex> lk(mu);
        return closed;
    }
};

inline std::vector<u8> pattern_bytes(size_t n, u32 seed = 7) {
    std::vector<u8> out(n);
    u32 x = seed;
    for (size_t i = 0; i < n; ++i) {
        x = x * 1103515245u + 12345u;
        out[i] = (u8)(x >> 16);
    }
    return out;
}

class FakeConnection : public RemoteConnection {
public:
    FakeConnection(FakeCloud& cloud, u32 endpoint, int serial)
        : cloud_(cloud), endpoint_(endpoint), serial_(serial) {}

    u32 endpoint_id() const override { return endpoint_; }

    std::vector<u8> get_file_chunk(const FileLocation& loc, u64 offset, u32 limit) override {
        Busy busy(cloud_);
        if (cloud_.take_rate_limit()) throw RateLimitError(cloud_.rate_limit_wait, "FLOOD_WAIT");
        std::lock_guard<std::mutex> lk(cloud_.mu);
        ++cloud_.chunk_calls;
        if (cloud_.fail_get_offset && *cloud_.fail_get_offset == offset) {
            throw RemoteError(ErrorCode::INTERNAL, 0, "read failed");
        }
        auto it = cloud_.objects.find(loc.location_id);
        if (it == cloud_.objects.end()) throw RemoteError(ErrorCode::NOT_FOUND, 0, "no object");
        const std::vector<u8>& data = it->second;
        if (offset >= data.size()) return {};
        size_t end = (size_t)std::min<u64>(data.size(), offset + limit);
        return std::vector<u8>(data.begin() + (long)offset, data.begin() + (long)end);
    }

    void save_file_part(u64 file_id, u32 part_index, const u8* data, size_t len) override {
        store(file_id, part_index, 0, false, data, len);
    }

    void save_big_file_part(u64 file_id, u32 part_index, u32 total_parts,
                            const u8* data, size_t len) override {
        store(file_id, part_index, total_parts, true, data, len);
    }

    AuthKey import_authorization(const ExportedAuthorization&) override {
        std::lock_guard<std::mutex> lk(cloud_.mu);
        ++cloud_.imports;
        if (cloud_.fail_import) throw RemoteError(ErrorCode::AUTH_INVALID, 0, "import rejected");
        AuthKey key{};
        key[0] = (u8)endpoint_;
        return key;
    }

    void disconnect() override {
        if (closed_.exchange(true)) return;
        std::lock_guard<std::mutex> lk(cloud_.mu);
        ++cloud_.closed;
        if (cloud_.fail_disconnect) throw std::runtime_error("socket already gone");
    }

private:
    // Tracks overlapping requests across connections
    struct Busy {
        FakeCloud& c;
        explicit Busy(FakeCloud& cloud) : c(cloud) {
            int now = ++c.in_flight;
            int seen = c.max_in_flight.load();
            while (now > seen && !c.max_in_flight.compare_exchange_weak(seen, now)) {}
            if (c.op_delay.count() > 0) std::this_thread::sleep_for(c.op_delay);
        }
        ~Busy() { --c.in_flight; }
    };

    void store(u64 file_id, u32 index, u32 total, bool big, const u8* data, size_t len) {
        Busy busy(cloud_);
        if (cloud_.take_rate_limit()) throw RateLimitError(cloud_.rate_limit_wait, "FLOOD_WAIT");
        std::lock_guard<std::mutex> lk(cloud_.mu);
        cloud_.part_order[serial_].push_back(index);
        FakeCloud::PendingUpload& up = cloud_.uploads[file_id];
        up.big   = big;
        up.total = total;
        up.parts[index] = std::vector<u8>(data, data + len);
    }

    FakeCloud&        cloud_;
    u32               endpoint_;
    int               serial_;
    std::atomic<bool> closed_{false};
};

class FakeSession : public RemoteSession {
public:
    FakeSession(FakeCloud& cloud, bool authorized, bool fail_connect)
        : cloud_(cloud), authorized_(authorized), fail_connect_(fail_connect) {}

    void connect() override {
        if (fail_connect_) throw std::runtime_error("connection refused");
        connected_ = true;
    }

    void disconnect() override {
        if (connected_.exchange(false)) ++disconnects;
    }

    bool is_connected() const override { return connected_.load(); }
    bool is_authorized() override { return connected_.load() && authorized_; }
    u32 home_endpoint() const override { return cloud_.home; }

    AuthKey auth_key() const override {
        AuthKey key{};
        key[0] = (u8)cloud_.home;
        return key;
    }

    ExportedAuthorization export_authorization(u32 endpoint_id) override {
        std::lock_guard<std::mutex> lk(cloud_.mu);
        if (!cloud_.endpoints.count(endpoint_id)) {
            throw RemoteError(ErrorCode::NOT_FOUND, 0, "no endpoint");
        }
        ++cloud_.exports;
        ExportedAuthorization auth;
        auth.id = (u64)cloud_.exports;
        return auth;
    }

    std::unique_ptr<RemoteConnection>
    open_connection(u32 endpoint_id, const std::optional<AuthKey>& key) override {
        std::lock_guard<std::mutex> lk(cloud_.mu);
        if (cloud_.fail_open_after >= 0 && cloud_.opened >= cloud_.fail_open_after) {
            throw std::runtime_error("connect to endpoint " + std::to_string(endpoint_id) + " failed");
        }
        int serial = cloud_.opened++;
        if (key) ++cloud_.keyed_opens;
        return std::make_unique<FakeConnection>(cloud_, endpoint_id, serial);
    }

    FileLocation commit_file(const UploadedFile& file) override {
        std::lock_guard<std::mutex> lk(cloud_.mu);
        FakeCloud::PendingUpload up = cloud_.uploads[file.file_id];
        cloud_.uploads.erase(file.file_id);
        if (up.parts.size() != file.part_count) {
            throw RemoteError(ErrorCode::BAD_REQUEST, 0, "missing parts");
        }
        std::vector<u8> bytes;
        for (const auto& kv : up.parts) bytes.insert(bytes.end(), kv.second.begin(), kv.second.end());
        if (file.checksum && hash::xxh3_128(bytes.data(), bytes.size()) != *file.checksum) {
            throw RemoteError(ErrorCode::CHECKSUM_MISMATCH, 0, "checksum mismatch");
        }
        last_commit = file;
        u64 id = cloud_.next_location++;
        u64 size = bytes.size();
        cloud_.objects[id] = std::move(bytes);
        return FileLocation{cloud_.home, id, size};
    }

    std::atomic<int>            disconnects{0};
    std::optional<UploadedFile> last_commit;

private:
    FakeCloud&        cloud_;
    bool              authorized_;
    bool              fail_connect_;
    std::atomic<bool> connected_{false};
};

class FakeSessionFactory : public SessionFactory {
public:
    explicit FakeSessionFactory(FakeCloud& cloud) : cloud_(cloud) {}

    std::shared_ptr<RemoteSession>
    create(const Credentials&, const std::string& session_string) override {
        std::lock_guard<std::mutex> lk(mu_);
        ++created;
        auto s = std::make_shared<FakeSession>(cloud_, !rejected.count(session_string), fail_connect);
        made.push_back(s);
        return s;
    }

    std::shared_ptr<FakeSession> last() {
        std::lock_guard<std::mutex> lk(mu_);
        return made.empty() ? nullptr : made.back();
    }

    int                                        created{0};
    bool                                       fail_connect{false};
    std::set<std::string>                      rejected;
    std::vector<std::shared_ptr<FakeSession>>  made;

private:
    FakeCloud& cloud_;
    std::mutex mu_;
};

// Connected, authorized session straight from the fake cloud
inline std::shared_ptr<FakeSession> connected_session(FakeCloud& cloud) {
    auto s = std::make_shared<FakeSession>(cloud, true, false);
    s->connect();
    return s;
}

// Manually advanced clock for cooldown and idle tests
struct ManualClock {
    TimePoint now{SteadyClock::now()};
    std::mutex mu;

    ClockFn fn() {
        return [this] {
            std::lock_guard<std::mutex> lk(mu);
            return now;
        };
    }

    template<typename D>
    void advance(D d) {
        std::lock_guard<std::mutex> lk(mu);
        now += std::chrono::duration_cast<SteadyClock::duration>(d);
    }
};
