#pragma once

// ============================================================
// transfer_worker.hpp -- One connection and its slice of a file
//
// Worker i of n owns parts i, i+n, i+2n, ... up to its budget.
// DownloadWorker walks byte offsets, UploadWorker walks part
// indices. Both retry rate-limited requests internally.
// ============================================================

#include "remote.hpp"
#include "retry_policy.hpp"
#include "../common/cancel_token.hpp"
#include "../common/thread_pool.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <vector>

class DownloadWorker {
public:
    DownloadWorker(std::unique_ptr<RemoteConnection> conn,
                   FileLocation location,
                   u64 first_offset, u32 part_size, u64 stride, u32 part_budget,
                   const RetryPolicy& retry, CancelToken& token);
    ~DownloadWorker();

    DownloadWorker(const DownloadWorker&) = delete;
    DownloadWorker& operator=(const DownloadWorker&) = delete;

    // Next part of this worker's slice. Empty once the budget is spent
    // or the endpoint has nothing at the current offset.
    std::vector<u8> next();

    // Idempotent; errors are logged, never thrown
    void disconnect();

    u64 offset() const { return offset_; }
    u32 remaining() const { return remaining_; }

private:
    std::unique_ptr<RemoteConnection> conn_;
    FileLocation      location_;
    u64               offset_;
    u32               part_size_;
    u64               stride_;
    u32               remaining_;
    const RetryPolicy& retry_;
    CancelToken&      token_;
    std::atomic<bool> disconnected_{false};
};

class UploadWorker {
public:
    UploadWorker(std::unique_ptr<RemoteConnection> conn,
                 u64 file_id, u32 part_count, bool big,
                 u32 first_index, u32 stride,
                 const RetryPolicy& retry, CancelToken& token);
    ~UploadWorker();

    UploadWorker(const UploadWorker&) = delete;
    UploadWorker& operator=(const UploadWorker&) = delete;

    // Wait for this worker's previous send (rethrowing its error), then
    // issue part `data` on the pool. Sends on one worker never overlap.
    void next(std::vector<u8> data, ThreadPool& pool);

    // Wait for the in-flight send, if any; rethrows its error
    void wait();

    // Waits for the in-flight send, then closes. Idempotent, never throws.
    void disconnect();

private:
    void send(const std::vector<u8>& data, u32 index);

    std::unique_ptr<RemoteConnection> conn_;
    u64               file_id_;
    u32               part_count_;
    bool              big_;
    u32               index_;
    u32               stride_;
    const RetryPolicy& retry_;
    CancelToken&      token_;
    std::future<void> previous_;
    std::atomic<bool> disconnected_{false};
};
