#pragma once

// ============================================================
// config.hpp -- Service configuration
//
// Defaults match an unconstrained deployment. from_env() applies
// the deployment environment, then CLI flags override in main.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <optional>

enum class ConnectionPolicyKind {
    ADAPTIVE,   // fewer connections for small files
    FIXED,      // always connections_per_transfer
};

// One remote endpoint, parsed from "id=host:port"
struct EndpointAddress {
    u32         id{0};
    std::string host;
    u16         port{0};

    std::string to_string() const {
        return std::to_string(id) + "=" + host + ":" + std::to_string(port);
    }
};

// Returns nullopt on malformed input
std::optional<EndpointAddress> parse_endpoint(const std::string& s);

struct ServiceConfig {
    using seconds      = std::chrono::seconds;
    using milliseconds = std::chrono::milliseconds;

    bool constrained{false};

    // ---- SessionPool ----
    size_t       max_sessions{15};
    seconds      idle_timeout{120};
    seconds      reap_interval{120};
    milliseconds connect_timeout{10000};
    milliseconds io_timeout{60000};
    bool         disconnect_after_transfer{false};

    // ---- AdmissionController ----
    size_t       max_concurrent{20};
    milliseconds privileged_cooldown{5000};
    milliseconds standard_cooldown{15000};
    milliseconds privileged_intra_delay{10000};
    milliseconds standard_intra_delay{15000};
    seconds      sweep_interval{1800};

    // ---- ResourceMonitor ----
    seconds monitor_interval{300};
    size_t  memory_high_mb{400};
    size_t  memory_critical_mb{480};
    size_t  memory_spike_mb{50};

    // ---- Transfer engine ----
    int                  connections_per_transfer{8};
    u32                  part_size{DEFAULT_PART_SIZE};
    u64                  large_threshold{LARGE_FILE_THRESHOLD};
    ConnectionPolicyKind connection_policy{ConnectionPolicyKind::ADAPTIVE};

    // Rate-limit retry
    int          retry_attempts{3};
    milliseconds retry_max_wait{30000};
    milliseconds retry_default_wait{5000};

    // ---- Remote ----
    std::vector<EndpointAddress> endpoints;   // first is the home endpoint
    u32         default_api_id{0};
    std::string default_api_hash;
    std::string default_session;

    // ---- Logging ----
    std::string log_file;
    std::string transfer_error_log{"transfer_errors.log"};

    // Defaults adjusted for a constrained host (smaller pool and ceiling)
    static ServiceConfig defaults(bool constrained);

    // Defaults + deployment environment variables
    static ServiceConfig from_env();

    // Throws std::invalid_argument describing the first bad field
    void validate() const;

    std::string summary() const;
};

// True when running on a host known to be memory constrained
bool detect_constrained_env();
