// ============================================================
// transfer_job.cpp -- Part planning, fan-out, rounds and cleanup
// ============================================================

#include "transfer_job.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>

namespace {

void close_all(std::vector<std::unique_ptr<RemoteConnection>>& conns) {
    for (auto& c : conns) {
        try {
            c->disconnect();
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Disconnect during rollback failed: ") + e.what());
        }
    }
    conns.clear();
}

// Open n connections. The first is created on the calling thread since it
// may run the credential handshake; the rest are opened concurrently.
std::vector<std::unique_ptr<RemoteConnection>>
open_connections(ConnectionFactory& factory, ThreadPool& pool, int n) {
    std::vector<std::unique_ptr<RemoteConnection>> conns;
    conns.reserve((size_t)n);
    conns.push_back(factory.create());

    std::vector<std::future<std::unique_ptr<RemoteConnection>>> futs;
    std::exception_ptr first_error;
    for (int i = 1; i < n; ++i) {
        try {
            futs.push_back(pool.enqueue([&factory] { return factory.create(); }));
        } catch (const std::exception&) {
            first_error = std::current_exception();
            break;
        }
    }
    for (auto& f : futs) {
        try {
            conns.push_back(f.get());
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Connection fan-out failed: ") + e.what());
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) {
        close_all(conns);
        std::rethrow_exception(first_error);
    }
    return conns;
}

void check_part_size(u32 part_size) {
    if (part_size == 0 || part_size > MAX_PART_SIZE) {
        throw std::invalid_argument("part size must be 1-" + std::to_string(MAX_PART_SIZE));
    }
}

} // namespace

// ---------------------------------------------------------------
// Planning and policies
// ---------------------------------------------------------------

PartPlan plan_parts(u64 total_size, u32 part_size, int connections) {
    if (part_size == 0) throw std::invalid_argument("part_size must be > 0");

    PartPlan plan;
    plan.total_size = total_size;
    plan.part_size  = part_size;
    u64 count = (total_size + part_size - 1) / part_size;
    if (count > 0xFFFFFFFFull) throw std::invalid_argument("file has too many parts");
    plan.part_count = (u32)count;
    if (plan.part_count == 0) return plan;

    int n = std::max(1, connections);
    n = (int)std::min<u64>((u64)n, plan.part_count);
    plan.connections = n;

    u32 minimum   = plan.part_count / (u32)n;
    u32 remainder = plan.part_count % (u32)n;
    plan.budgets.reserve((size_t)n);
    for (int i = 0; i < n; ++i) {
        plan.budgets.push_back(minimum + ((u32)i < remainder ? 1 : 0));
    }
    return plan;
}

ConnectionCountPolicy adaptive_connection_policy(int max_connections) {
    int max_conns = std::max(1, max_connections);
    return [max_conns](u64 size) {
        if (size >= 8ull * 1024 * 1024) return max_conns;
        if (size >= 10ull * 1024)       return std::min(4, max_conns);
        return std::min(2, max_conns);
    };
}

ConnectionCountPolicy fixed_connection_policy(int connections) {
    int n = std::max(1, connections);
    return [n](u64) { return n; };
}

ConnectionCountPolicy make_connection_policy(const ServiceConfig& cfg) {
    if (cfg.connection_policy == ConnectionPolicyKind::FIXED) {
        return fixed_connection_policy(cfg.connections_per_transfer);
    }
    return adaptive_connection_policy(cfg.connections_per_transfer);
}

JobOptions JobOptions::from_config(const ServiceConfig& cfg) {
    JobOptions o;
    o.part_size       = cfg.part_size;
    o.policy          = make_connection_policy(cfg);
    o.retry           = RetryPolicy::from_config(cfg);
    o.large_threshold = cfg.large_threshold;
    return o;
}

int JobOptions::connection_count(u64 total_size) const {
    if (connections) return std::max(1, *connections);
    return policy ? std::max(1, policy(total_size)) : 1;
}

// ---------------------------------------------------------------
// DownloadJob
// ---------------------------------------------------------------

DownloadJob::DownloadJob(std::shared_ptr<RemoteSession> session, FileLocation location,
                         JobOptions opts, CancelToken& token)
    : session_(std::move(session))
    , location_(location)
    , opts_(std::move(opts))
    , token_(token)
    , plan_(plan_parts(location.size, opts_.part_size, opts_.connection_count(location.size)))
    , factory_(session_, location.endpoint_id)
{
    check_part_size(opts_.part_size);
    LOG_DEBUG("Download plan: " + utils::format_bytes(plan_.total_size) + ", " +
              std::to_string(plan_.part_count) + " parts over " +
              std::to_string(plan_.connections) + " connections");
}

DownloadJob::~DownloadJob() {
    cleanup();
}

void DownloadJob::fan_out() {
    int n = plan_.connections;
    pool_ = std::make_unique<ThreadPool>((size_t)n, "download");
    auto conns = open_connections(factory_, *pool_, n);

    u64 stride = (u64)n * plan_.part_size;
    for (int i = 0; i < n; ++i) {
        workers_.push_back(std::make_unique<DownloadWorker>(
            std::move(conns[(size_t)i]), location_,
            (u64)i * plan_.part_size, plan_.part_size, stride, plan_.budgets[(size_t)i],
            opts_.retry, token_));
    }
}

// Issue the next request on every worker so they overlap on the wire.
// Results are consumed in worker order.
void DownloadJob::start_round() {
    for (auto& w : workers_) {
        DownloadWorker* worker = w.get();
        pending_.push_back(pool_->enqueue([worker] { return worker->next(); }));
    }
}

std::vector<u8> DownloadJob::next_chunk() {
    if (finished_) return {};
    try {
        token_.throw_if_cancelled();
        if (!started_) {
            started_ = true;
            if (plan_.part_count > 0) fan_out();
        }
        if (workers_.empty()) {
            finished_ = true;
            return {};
        }
        if (pending_.empty()) start_round();

        std::future<std::vector<u8>> fut = std::move(pending_.front());
        pending_.pop_front();
        std::vector<u8> chunk = fut.get();

        if (chunk.empty()) {
            LOG_DEBUG("Download ended after " + std::to_string(parts_received_) + " parts");
            finished_ = true;
            cleanup();
            return chunk;
        }
        ++parts_received_;
        bytes_received_ += chunk.size();
        if (parts_received_ >= plan_.part_count) {
            finished_ = true;
            cleanup();
        }
        return chunk;
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("Download failed: ") + e.what());
        finished_ = true;
        cleanup();
        throw;
    }
}

void DownloadJob::drain_pending() {
    while (!pending_.empty()) {
        std::future<std::vector<u8>> fut = std::move(pending_.front());
        pending_.pop_front();
        try {
            fut.get();
        } catch (const std::exception& e) {
            LOG_DEBUG(std::string("Discarding in-flight request: ") + e.what());
        }
    }
}

void DownloadJob::cleanup() {
    drain_pending();
    for (auto& w : workers_) w->disconnect();
    workers_.clear();
    if (pool_) pool_->shutdown();
}

// ---------------------------------------------------------------
// UploadJob
// ---------------------------------------------------------------

UploadJob::UploadJob(std::shared_ptr<RemoteSession> session, u64 total_size, std::string name,
                     JobOptions opts, CancelToken& token)
    : session_(std::move(session))
    , name_(std::move(name))
    , opts_(std::move(opts))
    , token_(token)
    , plan_(plan_parts(total_size, opts_.part_size, opts_.connection_count(total_size)))
    , big_(total_size > opts_.large_threshold)
    , file_id_(utils::random_id())
{
    check_part_size(opts_.part_size);
    token_.throw_if_cancelled();
    if (plan_.part_count == 0) return;

    int n = plan_.connections;
    pool_ = std::make_unique<ThreadPool>((size_t)n, "upload");
    ConnectionFactory factory(session_, session_->home_endpoint());
    auto conns = open_connections(factory, *pool_, n);
    for (int i = 0; i < n; ++i) {
        workers_.push_back(std::make_unique<UploadWorker>(
            std::move(conns[(size_t)i]), file_id_, plan_.part_count, big_,
            (u32)i, (u32)n, opts_.retry, token_));
    }
    buffer_.reserve(plan_.part_size);
    LOG_DEBUG("Upload plan: " + utils::format_bytes(total_size) + ", " +
              std::to_string(plan_.part_count) + " parts over " + std::to_string(n) +
              " connections" + (big_ ? " (big)" : ""));
}

UploadJob::~UploadJob() {
    cleanup();
}

void UploadJob::dispatch(std::vector<u8> part) {
    UploadWorker& w = *workers_[(size_t)(ticker_ % workers_.size())];
    w.next(std::move(part), *pool_);
    ++ticker_;
}

void UploadJob::write(const u8* data, size_t len) {
    if (finished_) throw std::logic_error("write on a finished upload");
    if (written_ + len > plan_.total_size) {
        throw std::invalid_argument("upload exceeds declared size " +
                                    std::to_string(plan_.total_size));
    }
    try {
        token_.throw_if_cancelled();
        if (!big_) hasher_.update(data, len);
        written_ += len;

        if (buffer_.empty() && len == plan_.part_size) {
            dispatch(std::vector<u8>(data, data + len));
            return;
        }
        while (len > 0) {
            size_t take = std::min(len, (size_t)plan_.part_size - buffer_.size());
            buffer_.insert(buffer_.end(), data, data + take);
            data += take;
            len  -= take;
            if (buffer_.size() == plan_.part_size) {
                std::vector<u8> part;
                part.swap(buffer_);
                buffer_.reserve(plan_.part_size);
                dispatch(std::move(part));
            }
        }
    } catch (const std::exception&) {
        fail_and_cleanup();
        throw;
    }
}

UploadedFile UploadJob::finish() {
    if (finished_) throw std::logic_error("upload already finished");
    try {
        token_.throw_if_cancelled();
        if (written_ != plan_.total_size) {
            throw std::runtime_error("upload got " + std::to_string(written_) +
                                     " of " + std::to_string(plan_.total_size) + " bytes");
        }
        if (!buffer_.empty()) {
            std::vector<u8> part;
            part.swap(buffer_);
            dispatch(std::move(part));
        }
        for (auto& w : workers_) w->wait();
    } catch (const std::exception&) {
        fail_and_cleanup();
        throw;
    }
    cleanup();
    finished_ = true;

    UploadedFile f;
    f.file_id    = file_id_;
    f.part_count = plan_.part_count;
    f.big        = big_;
    f.name       = name_;
    f.size       = written_;
    if (!big_) f.checksum = hasher_.digest();
    return f;
}

void UploadJob::fail_and_cleanup() {
    finished_ = true;
    cleanup();
}

void UploadJob::cleanup() {
    for (auto& w : workers_) w->disconnect();
    workers_.clear();
    if (pool_) pool_->shutdown();
}

// ---------------------------------------------------------------
// File helpers
// ---------------------------------------------------------------

u64 download_to_file(std::shared_ptr<RemoteSession> session, const FileLocation& location,
                     const std::string& out_path, const JobOptions& opts,
                     CancelToken& token, const ProgressFn& progress)
{
    DownloadJob job(std::move(session), location, opts, token);
    file_io::AtomicFileWriter out(out_path);
    u64 got = job.for_each_chunk([&](const std::vector<u8>& chunk) {
        out.write(chunk.data(), chunk.size());
        if (progress) progress(out.bytes_written(), location.size);
    });
    if (got != location.size) {
        throw std::runtime_error("Short download: got " + std::to_string(got) +
                                 " of " + std::to_string(location.size) + " bytes");
    }
    out.commit();
    return got;
}

FileLocation upload_from_file(std::shared_ptr<RemoteSession> session,
                              const std::string& in_path, const std::string& name,
                              const JobOptions& opts, CancelToken& token,
                              const ProgressFn& progress)
{
    file_io::MmapReader reader(in_path);
    UploadJob job(session, reader.size(), name, opts, token);

    const u64 step = opts.part_size;
    for (u64 off = 0; off < reader.size(); off += step) {
        u64 len = reader.span(off, step);
        job.write(reader.data() + off, (size_t)len);
        if (progress) progress(off + len, reader.size());
    }
    UploadedFile file = job.finish();
    return session->commit_file(file);
}
