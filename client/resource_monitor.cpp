// ============================================================
// resource_monitor.cpp
// ============================================================

#include "resource_monitor.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <fstream>

#ifdef _WIN32
#  include <psapi.h>
#endif

MemoryUsage read_process_memory() {
    MemoryUsage usage;
#if defined(_WIN32)
    PROCESS_MEMORY_COUNTERS pmc{};
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        usage.rss_mb = (double)pmc.WorkingSetSize / (1024.0 * 1024);
        usage.vms_mb = (double)pmc.PagefileUsage / (1024.0 * 1024);
    }
#elif defined(__linux__)
    // statm: total and resident sizes in pages
    std::ifstream statm("/proc/self/statm");
    u64 size_pages = 0, resident_pages = 0;
    if (statm >> size_pages >> resident_pages) {
        long page = sysconf(_SC_PAGESIZE);
        double page_mb = (page > 0 ? (double)page : 4096.0) / (1024.0 * 1024);
        usage.rss_mb = (double)resident_pages * page_mb;
        usage.vms_mb = (double)size_pages * page_mb;
    }
#endif
    return usage;
}

const char* memory_status_str(MemoryStatus s) {
    switch (s) {
        case MemoryStatus::OK:       return "ok";
        case MemoryStatus::ELEVATED: return "elevated";
        case MemoryStatus::HIGH:     return "high";
        case MemoryStatus::CRITICAL: return "critical";
    }
    return "unknown";
}

ResourceMonitor::ResourceMonitor(MemoryThresholds thresholds, MemoryProbe probe)
    : thresholds_(thresholds)
    , probe_(probe ? std::move(probe) : MemoryProbe(read_process_memory))
{}

MemoryStatus ResourceMonitor::classify(double rss_mb) const {
    if (rss_mb > thresholds_.critical_mb)    return MemoryStatus::CRITICAL;
    if (rss_mb >= thresholds_.high_mb)       return MemoryStatus::HIGH;
    if (rss_mb >= thresholds_.elevated_mb()) return MemoryStatus::ELEVATED;
    return MemoryStatus::OK;
}

ResourceSnapshot ResourceMonitor::snapshot(const std::string& operation, const std::string& context) {
    ResourceSnapshot snap;
    snap.operation = operation;
    snap.context   = context;
    snap.rss_mb    = probe_().rss_mb;
    snap.status    = classify(snap.rss_mb);

    ResourceCounters c;
    double growth = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        growth = snap.rss_mb - last_rss_mb_;
        snap.spike = have_last_ && growth > thresholds_.spike_mb;
        last_rss_mb_ = snap.rss_mb;
        have_last_   = true;
        history_.push_back(snap);
        while (history_.size() > kHistory) history_.pop_front();
        c = counters_;
    }

    std::string what = operation + (context.empty() ? "" : " (" + context + ")");
    if (snap.status == MemoryStatus::CRITICAL) {
        LOG_ERROR("Memory critical: " + utils::format_mb(snap.rss_mb) + ", sessions " +
                  std::to_string(c.live_sessions()) + ", transfers " +
                  std::to_string(c.running_transfers()) + " - " + what);
    } else if (snap.spike) {
        LOG_WARN("Memory spike: " + utils::format_mb(growth, true) + " (" +
                 utils::format_mb(snap.rss_mb) + " total) - " + what);
    } else if (snap.status == MemoryStatus::HIGH) {
        LOG_WARN("High memory: " + utils::format_mb(snap.rss_mb) + " - " + what);
    } else {
        LOG_DEBUG("Memory: " + utils::format_mb(snap.rss_mb) + " - " + what);
    }
    return snap;
}

void ResourceMonitor::on_session_created(OwnerId owner) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++counters_.sessions_created;
    }
    snapshot("session created", "owner " + std::to_string(owner));
}

void ResourceMonitor::on_session_dropped(OwnerId owner) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++counters_.sessions_dropped;
    }
    snapshot("session dropped", "owner " + std::to_string(owner));
}

double ResourceMonitor::transfer_started(OwnerId owner, const std::string& what) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++counters_.transfers_started;
    }
    ResourceSnapshot snap = snapshot("transfer start", "owner " + std::to_string(owner));
    LOG_INFO("[RAM] " + what + " start: " + utils::format_mb(snap.rss_mb));
    return snap.rss_mb;
}

void ResourceMonitor::transfer_finished(OwnerId owner, const std::string& what, double start_rss_mb) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++counters_.transfers_finished;
    }
    ResourceSnapshot snap = snapshot("transfer end", "owner " + std::to_string(owner));
    LOG_INFO("[RAM] " + what + " end: " + utils::format_mb(snap.rss_mb) + " (" +
             utils::format_mb(snap.rss_mb - start_rss_mb, true) + " from start)");
}

void ResourceMonitor::periodic_check() {
    ResourceSnapshot snap = snapshot("periodic");
    if (snap.status >= MemoryStatus::HIGH) {
        LOG_WARN("Periodic check: " + utils::format_mb(snap.rss_mb) + " (" +
                 memory_status_str(snap.status) + ")");
        log_recent();
    }
}

double ResourceMonitor::current_rss_mb() const {
    return probe_().rss_mb;
}

ResourceCounters ResourceMonitor::counters() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return counters_;
}

std::vector<ResourceSnapshot> ResourceMonitor::recent() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::vector<ResourceSnapshot>(history_.begin(), history_.end());
}

void ResourceMonitor::log_recent() const {
    std::vector<ResourceSnapshot> ops = recent();
    if (ops.empty()) return;
    LOG_INFO("Recent operations:");
    size_t first = ops.size() > 10 ? ops.size() - 10 : 0;
    for (size_t i = first; i < ops.size(); ++i) {
        LOG_INFO("  " + std::to_string(i - first + 1) + ". " + ops[i].operation +
                 (ops[i].context.empty() ? "" : " (" + ops[i].context + ")") + " - " +
                 utils::format_mb(ops[i].rss_mb));
    }
}

std::string ResourceMonitor::status_line() const {
    double rss = current_rss_mb();
    ResourceCounters c = counters();
    return "Memory: " + utils::format_mb(rss) + " (" + memory_status_str(classify(rss)) +
           "), Sessions: " + std::to_string(c.live_sessions()) + " live (" +
           std::to_string(c.sessions_created) + " created), Transfers: " +
           std::to_string(c.running_transfers()) + " running (" +
           std::to_string(c.transfers_started) + " started)";
}
