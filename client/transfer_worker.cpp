// ============================================================
// transfer_worker.cpp
// ============================================================

#include "transfer_worker.hpp"
#include "../common/logger.hpp"
#include <stdexcept>

// ---------------------------------------------------------------
// DownloadWorker
// ---------------------------------------------------------------

DownloadWorker::DownloadWorker(std::unique_ptr<RemoteConnection> conn,
                               FileLocation location,
                               u64 first_offset, u32 part_size, u64 stride, u32 part_budget,
                               const RetryPolicy& retry, CancelToken& token)
    : conn_(std::move(conn))
    , location_(location)
    , offset_(first_offset)
    , part_size_(part_size)
    , stride_(stride)
    , remaining_(part_budget)
    , retry_(retry)
    , token_(token) {}

DownloadWorker::~DownloadWorker() {
    disconnect();
}

std::vector<u8> DownloadWorker::next() {
    if (remaining_ == 0) return {};

    std::vector<u8> bytes = call_with_retry(retry_, token_,
        "get_file_chunk@" + std::to_string(offset_),
        [&] { return conn_->get_file_chunk(location_, offset_, part_size_); });

    if (bytes.empty()) {
        LOG_DEBUG("Endpoint returned no data at offset " + std::to_string(offset_));
        remaining_ = 0;
        return bytes;
    }
    --remaining_;
    offset_ += stride_;
    return bytes;
}

void DownloadWorker::disconnect() {
    if (disconnected_.exchange(true)) return;
    try {
        conn_->disconnect();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Download connection disconnect failed: ") + e.what());
    }
}

// ---------------------------------------------------------------
// UploadWorker
// ---------------------------------------------------------------

UploadWorker::UploadWorker(std::unique_ptr<RemoteConnection> conn,
                           u64 file_id, u32 part_count, bool big,
                           u32 first_index, u32 stride,
                           const RetryPolicy& retry, CancelToken& token)
    : conn_(std::move(conn))
    , file_id_(file_id)
    , part_count_(part_count)
    , big_(big)
    , index_(first_index)
    , stride_(stride)
    , retry_(retry)
    , token_(token) {}

UploadWorker::~UploadWorker() {
    disconnect();
}

void UploadWorker::send(const std::vector<u8>& data, u32 index) {
    call_with_retry(retry_, token_, "save_part#" + std::to_string(index), [&] {
        if (big_) {
            conn_->save_big_file_part(file_id_, index, part_count_, data.data(), data.size());
        } else {
            conn_->save_file_part(file_id_, index, data.data(), data.size());
        }
    });
    LOG_DEBUG("Sent part " + std::to_string(index) + "/" + std::to_string(part_count_) +
              " (" + std::to_string(data.size()) + " bytes)");
}

void UploadWorker::next(std::vector<u8> data, ThreadPool& pool) {
    if (index_ >= part_count_) {
        throw std::logic_error("Upload worker got part " + std::to_string(index_) +
                               " beyond part count " + std::to_string(part_count_));
    }
    wait();
    u32 index = index_;
    index_ += stride_;
    previous_ = pool.enqueue([this, index](const std::vector<u8>& part) { send(part, index); },
                             std::move(data));
}

void UploadWorker::wait() {
    if (previous_.valid()) previous_.get();
}

void UploadWorker::disconnect() {
    if (disconnected_.exchange(true)) return;
    if (previous_.valid()) {
        try {
            previous_.get();
        } catch (const std::exception& e) {
            LOG_DEBUG(std::string("Pending send failed during disconnect: ") + e.what());
        }
    }
    try {
        conn_->disconnect();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Upload connection disconnect failed: ") + e.what());
    }
}
