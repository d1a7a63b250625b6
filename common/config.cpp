// ============================================================
// config.cpp -- ServiceConfig defaults and environment loading
// ============================================================

#include "config.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>

namespace {

const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

// Integer env var; malformed values are logged and ignored
bool env_i64(const char* name, i64& out) {
    const char* v = env_or_null(name);
    if (!v) return false;
    i64 parsed = 0;
    if (!utils::parse_i64(v, parsed) || parsed < 0) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + v);
        return false;
    }
    out = parsed;
    return true;
}

void env_seconds_as_ms(const char* name, std::chrono::milliseconds& out) {
    i64 v = 0;
    if (env_i64(name, v)) out = std::chrono::milliseconds(v * 1000);
}

void env_seconds(const char* name, std::chrono::seconds& out) {
    i64 v = 0;
    if (env_i64(name, v)) out = std::chrono::seconds(v);
}

void env_size(const char* name, size_t& out) {
    i64 v = 0;
    if (env_i64(name, v)) out = (size_t)v;
}

} // namespace

std::optional<EndpointAddress> parse_endpoint(const std::string& s) {
    auto eq = s.find('=');
    auto colon = s.rfind(':');
    if (eq == std::string::npos || colon == std::string::npos || colon < eq) {
        return std::nullopt;
    }
    u64 id = 0, port = 0;
    if (!utils::parse_u64(s.substr(0, eq), id) || id > 0xFFFFFFFFull) return std::nullopt;
    if (!utils::parse_u64(s.substr(colon + 1), port) || !utils::validate_port((int)port)) {
        return std::nullopt;
    }
    EndpointAddress ep;
    ep.id   = (u32)id;
    ep.host = s.substr(eq + 1, colon - eq - 1);
    ep.port = (u16)port;
    if (ep.host.empty()) return std::nullopt;
    return ep;
}

bool detect_constrained_env() {
    return env_or_null("RENDER") || env_or_null("RENDER_EXTERNAL_URL") ||
           env_or_null("REPLIT_DEPLOYMENT") || env_or_null("REPL_ID");
}

ServiceConfig ServiceConfig::defaults(bool constrained) {
    ServiceConfig cfg;
    cfg.constrained = constrained;
    if (constrained) {
        cfg.max_sessions   = 10;
        cfg.max_concurrent = 10;
    }
    return cfg;
}

ServiceConfig ServiceConfig::from_env() {
    ServiceConfig cfg = defaults(detect_constrained_env());

    // Deployment variables (seconds)
    env_seconds_as_ms("PREMIUM_DOWNLOAD_DELAY", cfg.privileged_cooldown);
    env_seconds_as_ms("FREE_DOWNLOAD_DELAY",    cfg.standard_cooldown);
    env_seconds_as_ms("PREMIUM_INTRA_DELAY",    cfg.privileged_intra_delay);
    env_seconds_as_ms("FREE_INTRA_DELAY",       cfg.standard_intra_delay);

    i64 v = 0;
    if (env_i64("CONNECTIONS_PER_TRANSFER", v)) cfg.connections_per_transfer = (int)v;
    if (env_i64("API_ID", v)) cfg.default_api_id = (u32)v;
    if (const char* h = env_or_null("API_HASH"))       cfg.default_api_hash = h;
    if (const char* s = env_or_null("SESSION_STRING")) cfg.default_session = s;

    // parxfer-specific overrides
    env_size("PARXFER_MAX_SESSIONS",   cfg.max_sessions);
    env_size("PARXFER_MAX_CONCURRENT", cfg.max_concurrent);
    env_seconds("PARXFER_IDLE_TIMEOUT",   cfg.idle_timeout);
    env_seconds("PARXFER_REAP_INTERVAL",  cfg.reap_interval);
    env_seconds("PARXFER_SWEEP_INTERVAL", cfg.sweep_interval);
    env_seconds("PARXFER_MONITOR_INTERVAL", cfg.monitor_interval);
    env_size("PARXFER_MEMORY_HIGH_MB",     cfg.memory_high_mb);
    env_size("PARXFER_MEMORY_CRITICAL_MB", cfg.memory_critical_mb);
    env_seconds_as_ms("PARXFER_RETRY_MAX_WAIT", cfg.retry_max_wait);
    if (env_i64("PARXFER_RETRY_ATTEMPTS", v)) cfg.retry_attempts = (int)v;
    if (env_i64("PARXFER_DISCONNECT_AFTER_TRANSFER", v)) cfg.disconnect_after_transfer = v != 0;

    if (const char* p = env_or_null("PARXFER_CONNECTION_POLICY")) {
        std::string policy = p;
        if (policy == "fixed") {
            cfg.connection_policy = ConnectionPolicyKind::FIXED;
        } else if (policy == "adaptive") {
            cfg.connection_policy = ConnectionPolicyKind::ADAPTIVE;
        } else {
            LOG_WARN("Unknown PARXFER_CONNECTION_POLICY=" + policy + ", using adaptive");
        }
    }

    if (const char* eps = env_or_null("PARXFER_ENDPOINTS")) {
        std::istringstream ss(eps);
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto ep = parse_endpoint(item);
            if (ep) {
                cfg.endpoints.push_back(*ep);
            } else {
                LOG_WARN("Ignoring malformed endpoint: " + item);
            }
        }
    }

    if (const char* lf = env_or_null("PARXFER_LOG_FILE")) cfg.log_file = lf;
    return cfg;
}

void ServiceConfig::validate() const {
    if (max_sessions == 0)   throw std::invalid_argument("max_sessions must be >= 1");
    if (max_concurrent == 0) throw std::invalid_argument("max_concurrent must be >= 1");
    if (connections_per_transfer < 1 || connections_per_transfer > 64) {
        throw std::invalid_argument("connections_per_transfer must be 1-64");
    }
    if (part_size == 0 || part_size > MAX_PART_SIZE) {
        throw std::invalid_argument("part_size must be 1-" + std::to_string(MAX_PART_SIZE));
    }
    if (retry_attempts < 1) throw std::invalid_argument("retry_attempts must be >= 1");
    if (retry_max_wait.count() < 0) throw std::invalid_argument("retry_max_wait must be >= 0");
    if (memory_high_mb == 0 || memory_critical_mb < memory_high_mb) {
        throw std::invalid_argument("memory thresholds must satisfy 0 < high <= critical");
    }
}

std::string ServiceConfig::summary() const {
    std::ostringstream ss;
    ss << "sessions=" << max_sessions
       << " concurrent=" << max_concurrent
       << " conns=" << connections_per_transfer
       << " policy=" << (connection_policy == ConnectionPolicyKind::FIXED ? "fixed" : "adaptive")
       << " idle=" << idle_timeout.count() << "s"
       << " cooldown=" << privileged_cooldown.count() / 1000 << "/"
       << standard_cooldown.count() / 1000 << "s"
       << (constrained ? " (constrained)" : "");
    return ss.str();
}
