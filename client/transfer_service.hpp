#pragma once

// ============================================================
// transfer_service.hpp -- Facade tying admission, sessions and jobs
//
// Owns the SessionPool, the AdmissionController, the ResourceMonitor
// and the periodic maintenance (idle reap, stale sweep, memory
// check). A request is admitted,
// then runs on the admission pool: acquire the owner's session,
// run the job, report the outcome, release.
// ============================================================

#include "admission_controller.hpp"
#include "credential_store.hpp"
#include "resource_monitor.hpp"
#include "session_pool.hpp"
#include "transfer_job.hpp"
#include "../common/clock.hpp"
#include "../common/config.hpp"
#include "../common/periodic_task.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class Direction {
    DOWNLOAD,
    UPLOAD,
};

struct TransferRequest {
    Direction          direction{Direction::DOWNLOAD};
    FileLocation       location;      // download source
    std::string        path;          // download target / upload source
    std::string        name;          // stored name for uploads
    std::optional<int> connections;   // overrides the connection policy

    static TransferRequest download(const FileLocation& loc, const std::string& out_path);
    static TransferRequest upload(const std::string& in_path, const std::string& name = "");

    std::string describe() const;
};

struct TransferOutcome {
    OwnerId                     owner{0};
    bool                        ok{false};
    bool                        cancelled{false};
    u64                         bytes{0};
    std::optional<FileLocation> location;       // set for uploads
    SessionError                session_error{SessionError::NONE};
    std::string                 error;
};

struct BatchResult {
    size_t completed{0};
    size_t failed{0};
    size_t skipped{0};
    bool   cancelled{false};
};

using CompletionFn      = std::function<void(const TransferOutcome&)>;
using BatchCompletionFn = std::function<void(const BatchResult&)>;

class TransferService {
public:
    TransferService(ServiceConfig cfg,
                    std::shared_ptr<SessionFactory> sessions,
                    std::shared_ptr<CredentialStore> credentials,
                    ClockFn clock = steady_clock_fn());
    ~TransferService();

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    // Start the reap, sweep and memory check tasks
    void init();

    // Stop maintenance, cancel and wait for every transfer, disconnect all
    // sessions. Idempotent. Called from a completion callback it only
    // refuses new work and cancels; the destructor finishes the job.
    void shutdown();

    Admission start_transfer(OwnerId owner, TransferRequest request, Tier tier,
                             CompletionFn on_done = nullptr);

    // Admit once, then run the items in order, each under its own hold,
    // waiting the tier's intra-batch delay between them. A failed item is
    // counted and the batch continues; cancellation skips the rest.
    Admission start_batch(OwnerId owner, std::vector<TransferRequest> items, Tier tier,
                          BatchCompletionFn on_done = nullptr,
                          CompletionFn on_item = nullptr);

    bool cancel_transfer(OwnerId owner);
    size_t cancel_all();

    // Explicit logout: drop the owner's session
    bool logout(OwnerId owner);

    TransferStatus get_status(OwnerId owner) const;
    std::string status_line(OwnerId owner) const;
    std::string server_status() const;
    std::string resource_status() const;

    size_t active_count() const;
    size_t session_count() const;

    bool wait_idle(std::chrono::milliseconds timeout);

    const ServiceConfig& config() const { return cfg_; }
    SessionPool& sessions() { return pool_; }
    AdmissionController& admission() { return admission_; }
    ResourceMonitor& monitor() { return monitor_; }

private:
    SessionResult acquire_session(OwnerId owner);
    TransferOutcome run_one(OwnerId owner, const TransferRequest& request, CancelToken& token);
    std::chrono::milliseconds intra_delay(Tier tier) const;

    ServiceConfig                    cfg_;
    std::shared_ptr<CredentialStore> credentials_;
    JobOptions                       job_opts_;

    ResourceMonitor     monitor_;
    SessionPool         pool_;
    AdmissionController admission_;

    std::unique_ptr<PeriodicTask> reaper_;
    std::unique_ptr<PeriodicTask> sweeper_;
    std::unique_ptr<PeriodicTask> memory_check_;
    std::atomic<bool>             shut_down_{false};
};
