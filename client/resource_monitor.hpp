#pragma once

// ============================================================
// resource_monitor.hpp -- Process memory accounting
//
// Resident memory is checked against thresholds sized for a
// constrained host. Snapshots are taken when sessions come and go,
// around every transfer and on a fixed interval; the most recent
// ones are kept so a memory incident can be traced back to the
// operations that led up to it.
//
// Lock order: SessionPool notifies under its own lock; the monitor
// never calls back into the pool.
// ============================================================

#include "session_pool.hpp"
#include "../common/platform.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct MemoryUsage {
    double rss_mb{0};
    double vms_mb{0};
};

// This process's usage; zeros where the platform reports nothing
MemoryUsage read_process_memory();

using MemoryProbe = std::function<MemoryUsage()>;

enum class MemoryStatus {
    OK,
    ELEVATED,
    HIGH,
    CRITICAL,
};

const char* memory_status_str(MemoryStatus s);

struct MemoryThresholds {
    double high_mb{400};
    double critical_mb{480};
    double spike_mb{50};      // growth between two snapshots worth a warning

    double elevated_mb() const { return high_mb * 0.75; }
};

struct ResourceSnapshot {
    std::string  operation;
    std::string  context;
    double       rss_mb{0};
    MemoryStatus status{MemoryStatus::OK};
    bool         spike{false};
};

struct ResourceCounters {
    u64 sessions_created{0};
    u64 sessions_dropped{0};
    u64 transfers_started{0};
    u64 transfers_finished{0};

    u64 live_sessions() const { return sessions_created - sessions_dropped; }
    u64 running_transfers() const { return transfers_started - transfers_finished; }
};

class ResourceMonitor : public SessionObserver {
public:
    static constexpr size_t kHistory = 20;

    explicit ResourceMonitor(MemoryThresholds thresholds = MemoryThresholds(),
                             MemoryProbe probe = read_process_memory);

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    MemoryStatus classify(double rss_mb) const;

    // Read the probe, record the result and log it at a level matching
    // its status. The first snapshot is never a spike.
    ResourceSnapshot snapshot(const std::string& operation, const std::string& context = "");

    void on_session_created(OwnerId owner) override;
    void on_session_dropped(OwnerId owner) override;

    // Returns the RSS at start; transfer_finished logs the growth since
    double transfer_started(OwnerId owner, const std::string& what);
    void transfer_finished(OwnerId owner, const std::string& what, double start_rss_mb);

    // Interval check. At HIGH or above the recent history is logged too.
    void periodic_check();

    double current_rss_mb() const;
    ResourceCounters counters() const;
    std::vector<ResourceSnapshot> recent() const;
    void log_recent() const;

    // "Memory: 212.4 MB (ok), Sessions: 3 live (5 created), Transfers: 1 running (4 started)"
    std::string status_line() const;

    const MemoryThresholds& thresholds() const { return thresholds_; }

private:
    MemoryThresholds thresholds_;
    MemoryProbe      probe_;

    mutable std::mutex           mutex_;
    std::deque<ResourceSnapshot> history_;
    ResourceCounters             counters_;
    double                       last_rss_mb_{0};
    bool                         have_last_{false};
};
