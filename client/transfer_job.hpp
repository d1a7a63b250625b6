#pragma once

// ============================================================
// transfer_job.hpp -- Multi-connection download and upload jobs
//
// A job plans parts, fans out one worker per connection and owns
// them until it finishes, fails or is destroyed. Fan-out is
// all-or-nothing: if any connection fails to open, every opened
// connection is closed and the error propagates.
// ============================================================

#include "connection_factory.hpp"
#include "remote.hpp"
#include "retry_policy.hpp"
#include "transfer_worker.hpp"
#include "../common/cancel_token.hpp"
#include "../common/config.hpp"
#include "../common/hash.hpp"
#include "../common/thread_pool.hpp"
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// How parts are split across connections
struct PartPlan {
    u64              total_size{0};
    u32              part_size{0};
    u32              part_count{0};
    int              connections{0};   // 0 when there is nothing to transfer
    std::vector<u32> budgets;          // parts owned by each worker
};

// Pure: part_count = ceil(total/part_size); connections capped at part_count;
// the first (part_count mod connections) workers get one extra part
PartPlan plan_parts(u64 total_size, u32 part_size, int connections);

// Connection count for a file of the given size
using ConnectionCountPolicy = std::function<int(u64)>;

// max_connections at >= 8 MiB, at most 4 at >= 10 KiB, at most 2 below
ConnectionCountPolicy adaptive_connection_policy(int max_connections);
ConnectionCountPolicy fixed_connection_policy(int connections);
ConnectionCountPolicy make_connection_policy(const ServiceConfig& cfg);

struct JobOptions {
    u32                   part_size{DEFAULT_PART_SIZE};
    std::optional<int>    connections;       // overrides policy
    ConnectionCountPolicy policy{adaptive_connection_policy(8)};
    RetryPolicy           retry;
    u64                   large_threshold{LARGE_FILE_THRESHOLD};

    static JobOptions from_config(const ServiceConfig& cfg);

    int connection_count(u64 total_size) const;
};

using ProgressFn = std::function<void(u64 done, u64 total)>;

// ---------------------------------------------------------------
// DownloadJob: lazy, finite, not restartable chunk sequence
// ---------------------------------------------------------------
class DownloadJob {
public:
    DownloadJob(std::shared_ptr<RemoteSession> session, FileLocation location,
                JobOptions opts, CancelToken& token);
    ~DownloadJob();

    DownloadJob(const DownloadJob&) = delete;
    DownloadJob& operator=(const DownloadJob&) = delete;

    // Next chunk in file order. Connections open on the first call.
    // Returns empty once the file is complete; connections are closed by
    // then. On failure closes everything and rethrows.
    std::vector<u8> next_chunk();

    // Drain the sequence into fn; returns bytes delivered
    template<typename F>
    u64 for_each_chunk(F&& fn) {
        u64 total = 0;
        for (;;) {
            std::vector<u8> chunk = next_chunk();
            if (chunk.empty()) break;
            total += chunk.size();
            fn(chunk);
        }
        return total;
    }

    const PartPlan& plan() const { return plan_; }
    bool finished() const { return finished_; }
    u64 bytes_received() const { return bytes_received_; }
    size_t open_workers() const { return workers_.size(); }

private:
    void fan_out();
    void start_round();
    void drain_pending();
    void cleanup();

    std::shared_ptr<RemoteSession> session_;
    FileLocation                   location_;
    JobOptions                     opts_;
    CancelToken&                   token_;
    PartPlan                       plan_;
    ConnectionFactory              factory_;

    std::unique_ptr<ThreadPool>                  pool_;
    std::vector<std::unique_ptr<DownloadWorker>> workers_;
    std::deque<std::future<std::vector<u8>>>     pending_;
    bool started_{false};
    bool finished_{false};
    u32  parts_received_{0};
    u64  bytes_received_{0};
};

// ---------------------------------------------------------------
// UploadJob: sink for sequential byte buffers of a known total size
// ---------------------------------------------------------------
class UploadJob {
public:
    UploadJob(std::shared_ptr<RemoteSession> session, u64 total_size, std::string name,
              JobOptions opts, CancelToken& token);
    ~UploadJob();

    UploadJob(const UploadJob&) = delete;
    UploadJob& operator=(const UploadJob&) = delete;

    // Buffer bytes and dispatch each full part round-robin
    void write(const u8* data, size_t len);

    // Send the tail part, wait for every send and close connections.
    // The result is ready for RemoteSession::commit_file.
    UploadedFile finish();

    const PartPlan& plan() const { return plan_; }
    bool is_large() const { return big_; }
    u64 file_id() const { return file_id_; }
    u64 bytes_written() const { return written_; }
    size_t open_workers() const { return workers_.size(); }

private:
    void dispatch(std::vector<u8> part);
    void fail_and_cleanup();
    void cleanup();

    std::shared_ptr<RemoteSession> session_;
    std::string                    name_;
    JobOptions                     opts_;
    CancelToken&                   token_;
    PartPlan                       plan_;
    bool                           big_;
    u64                            file_id_;

    std::unique_ptr<ThreadPool>                pool_;
    std::vector<std::unique_ptr<UploadWorker>> workers_;
    hash::StreamHasher128                      hasher_;
    std::vector<u8>                            buffer_;
    u64  written_{0};
    u64  ticker_{0};
    bool finished_{false};
};

// Download location into out_path (written atomically)
u64 download_to_file(std::shared_ptr<RemoteSession> session, const FileLocation& location,
                     const std::string& out_path, const JobOptions& opts,
                     CancelToken& token, const ProgressFn& progress = nullptr);

// Upload in_path under name, commit it and return its location
FileLocation upload_from_file(std::shared_ptr<RemoteSession> session,
                              const std::string& in_path, const std::string& name,
                              const JobOptions& opts, CancelToken& token,
                              const ProgressFn& progress = nullptr);
