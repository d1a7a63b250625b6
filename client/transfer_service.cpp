// ============================================================
// transfer_service.cpp
// ============================================================

#include "transfer_service.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <stdexcept>

namespace {

// Logs progress and resident memory at each quarter of the transfer
ProgressFn make_progress_logger(OwnerId owner, const std::string& label,
                                const ResourceMonitor& monitor, double start_rss_mb) {
    auto next_mark = std::make_shared<int>(25);
    return [owner, label, next_mark, &monitor, start_rss_mb](u64 done, u64 total) {
        int pct = total == 0 ? 100 : (int)(done * 100 / total);
        if (pct < *next_mark) return;
        while (*next_mark <= pct) *next_mark += 25;
        double rss = monitor.current_rss_mb();
        LOG_INFO("Owner " + std::to_string(owner) + " " + label + ": " +
                 utils::format_bytes(done) + "/" + utils::format_bytes(total) + " (" +
                 utils::format_percent(done, total) + "), RAM " + utils::format_mb(rss) +
                 " (" + utils::format_mb(rss - start_rss_mb, true) + ")");
    };
}

MemoryThresholds thresholds_from(const ServiceConfig& cfg) {
    MemoryThresholds t;
    t.high_mb     = (double)cfg.memory_high_mb;
    t.critical_mb = (double)cfg.memory_critical_mb;
    t.spike_mb    = (double)cfg.memory_spike_mb;
    return t;
}

template<typename Fn, typename Arg>
void notify(const Fn& fn, const Arg& arg, const char* what) {
    if (!fn) return;
    try {
        fn(arg);
    } catch (const std::exception& e) {
        LOG_WARN(std::string(what) + " callback failed: " + e.what());
    }
}

} // namespace

// ---------------------------------------------------------------
// TransferRequest
// ---------------------------------------------------------------

TransferRequest TransferRequest::download(const FileLocation& loc, const std::string& out_path) {
    TransferRequest s;
    s.direction = Direction::DOWNLOAD;
    s.location  = loc;
    s.path      = out_path;
    return s;
}

TransferRequest TransferRequest::upload(const std::string& in_path, const std::string& name) {
    TransferRequest s;
    s.direction = Direction::UPLOAD;
    s.path      = in_path;
    s.name      = name.empty() ? std::filesystem::path(in_path).filename().string() : name;
    return s;
}

std::string TransferRequest::describe() const {
    if (direction == Direction::DOWNLOAD) {
        return "download " + std::to_string(location.endpoint_id) + "/" +
               std::to_string(location.location_id) + " -> " + path;
    }
    return "upload " + path + " as " + name;
}

// ---------------------------------------------------------------
// TransferService
// ---------------------------------------------------------------

TransferService::TransferService(ServiceConfig cfg,
                                 std::shared_ptr<SessionFactory> sessions,
                                 std::shared_ptr<CredentialStore> credentials,
                                 ClockFn clock)
    : cfg_(std::move(cfg))
    , credentials_(std::move(credentials))
    , job_opts_(JobOptions::from_config(cfg_))
    , monitor_(thresholds_from(cfg_))
    , pool_(std::move(sessions), cfg_.max_sessions,
            std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.idle_timeout),
            cfg_.disconnect_after_transfer, clock)
    , admission_(cfg_.max_concurrent, cfg_.privileged_cooldown, cfg_.standard_cooldown, clock)
{
    if (!credentials_) throw std::invalid_argument("TransferService needs a credential store");
    pool_.set_active_owners(&admission_);
    pool_.set_observer(&monitor_);
    admission_.set_release_hook([this](OwnerId owner) { pool_.release(owner); });
}

TransferService::~TransferService() {
    shutdown();
}

void TransferService::init() {
    if (reaper_) return;
    reaper_ = std::make_unique<PeriodicTask>(
        "session cleanup", std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.reap_interval),
        [this] { pool_.idle_reap(); });
    sweeper_ = std::make_unique<PeriodicTask>(
        "stale sweep", std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.sweep_interval),
        [this] { admission_.sweep_stale(); });
    memory_check_ = std::make_unique<PeriodicTask>(
        "memory check", std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.monitor_interval),
        [this] { monitor_.periodic_check(); });
    reaper_->start();
    sweeper_->start();
    memory_check_->start();
    LOG_INFO("Transfer service ready: " + cfg_.summary());
}

void TransferService::shutdown() {
    if (shut_down_.load()) return;
    if (admission_.on_task_thread()) {
        // Refuses new work and cancels; the rest runs from the destructor
        admission_.shutdown();
        return;
    }
    if (shut_down_.exchange(true)) return;
    if (reaper_)  reaper_->stop();
    if (sweeper_) sweeper_->stop();
    if (memory_check_) memory_check_->stop();
    admission_.shutdown();
    pool_.set_active_owners(nullptr);
    pool_.disconnect_all();
    LOG_INFO("Transfer service stopped. " + monitor_.status_line());
}

std::chrono::milliseconds TransferService::intra_delay(Tier tier) const {
    return tier == Tier::PRIVILEGED ? cfg_.privileged_intra_delay : cfg_.standard_intra_delay;
}

SessionResult TransferService::acquire_session(OwnerId owner) {
    std::optional<Credentials> creds = credentials_->get_credentials(owner);
    std::optional<std::string> session = credentials_->get_session_string(owner);
    return pool_.get_or_create(owner, creds, session.value_or(""));
}

TransferOutcome TransferService::run_one(OwnerId owner, const TransferRequest& request,
                                         CancelToken& token)
{
    TransferOutcome out;
    out.owner = owner;

    SessionResult sr = acquire_session(owner);
    if (!sr.ok()) {
        out.session_error = sr.error;
        out.error = std::string(session_error_str(sr.error)) + ": " + sr.detail;
        Logger::get().transfer_error(owner, request.describe() + ": " + out.error);
        return out;
    }

    JobOptions opts = job_opts_;
    if (request.connections) opts.connections = request.connections;

    LOG_INFO("Owner " + std::to_string(owner) + " starting " + request.describe());
    double start_rss = monitor_.transfer_started(owner, request.describe());
    try {
        if (request.direction == Direction::DOWNLOAD) {
            out.bytes = download_to_file(sr.session, request.location, request.path, opts, token,
                                         make_progress_logger(owner, "download", monitor_, start_rss));
        } else {
            FileLocation loc = upload_from_file(sr.session, request.path, request.name, opts, token,
                                                make_progress_logger(owner, "upload", monitor_, start_rss));
            out.bytes    = loc.size;
            out.location = loc;
        }
        out.ok = true;
        pool_.touch(owner);
        LOG_INFO("Owner " + std::to_string(owner) + " finished " + request.describe() +
                 " (" + utils::format_bytes(out.bytes) + ")");
    } catch (const TransferCancelled& e) {
        out.cancelled = true;
        out.error = e.what();
        LOG_INFO("Owner " + std::to_string(owner) + " cancelled " + request.describe());
    } catch (const std::exception& e) {
        out.error = e.what();
        Logger::get().transfer_error(owner, request.describe() + ": " + e.what());
    }
    monitor_.transfer_finished(owner, request.describe(), start_rss);
    return out;
}

Admission TransferService::start_transfer(OwnerId owner, TransferRequest request, Tier tier,
                                          CompletionFn on_done)
{
    return admission_.start(owner,
        [this, owner, request = std::move(request), on_done](CancelToken& token) {
            pool_.touch(owner);
            TransferOutcome out = run_one(owner, request, token);
            notify(on_done, out, "transfer completion");
        }, tier);
}

Admission TransferService::start_batch(OwnerId owner, std::vector<TransferRequest> items, Tier tier,
                                       BatchCompletionFn on_done, CompletionFn on_item)
{
    auto delay = intra_delay(tier);
    return admission_.start(owner,
        [this, owner, items = std::move(items), delay, on_done, on_item](CancelToken& token) {
            BatchResult result;
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0 && !token.sleep_for(delay)) {
                    result.cancelled = true;
                }
                if (result.cancelled || token.cancelled()) {
                    result.cancelled = true;
                    result.skipped = items.size() - i;
                    break;
                }

                ActiveHold hold(admission_, owner);
                pool_.touch(owner);
                TransferOutcome out = run_one(owner, items[i], token);
                if (out.ok) {
                    ++result.completed;
                } else if (out.cancelled) {
                    result.cancelled = true;
                    result.skipped = items.size() - i;
                    notify(on_item, out, "batch item");
                    break;
                } else {
                    ++result.failed;
                }
                notify(on_item, out, "batch item");
            }
            LOG_INFO("Batch for owner " + std::to_string(owner) + ": " +
                     std::to_string(result.completed) + " completed, " +
                     std::to_string(result.failed) + " failed, " +
                     std::to_string(result.skipped) + " skipped");
            notify(on_done, result, "batch completion");
        }, tier);
}

bool TransferService::cancel_transfer(OwnerId owner) {
    return admission_.cancel(owner);
}

size_t TransferService::cancel_all() {
    return admission_.cancel_all();
}

bool TransferService::logout(OwnerId owner) {
    return pool_.remove(owner);
}

TransferStatus TransferService::get_status(OwnerId owner) const {
    return admission_.get_status(owner);
}

std::string TransferService::status_line(OwnerId owner) const {
    TransferStatus st = admission_.get_status(owner);
    std::string load = "Active: " + std::to_string(admission_.active_count()) + "/" +
                       std::to_string(admission_.capacity());
    switch (st.state) {
        case OwnerState::ACTIVE:
            return "Transfer in progress. " + load;
        case OwnerState::COOLING:
            return "Cooldown active, wait " + utils::format_duration_s(st.cooldown_remaining_s) +
                   ". " + load;
        case OwnerState::IDLE:
            break;
    }
    return "No active transfer. " + load;
}

std::string TransferService::server_status() const {
    return "Active: " + std::to_string(admission_.active_count()) + "/" +
           std::to_string(admission_.capacity()) +
           ", Sessions: " + std::to_string(pool_.size()) + "/" +
           std::to_string(pool_.capacity());
}

std::string TransferService::resource_status() const {
    return monitor_.status_line();
}

size_t TransferService::active_count() const {
    return admission_.active_count();
}

size_t TransferService::session_count() const {
    return pool_.size();
}

bool TransferService::wait_idle(std::chrono::milliseconds timeout) {
    return admission_.wait_idle(timeout);
}
