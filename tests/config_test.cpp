#include "../common/config.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <optional>
#include <string>

namespace {

// Sets (or clears) one variable for the scope, restoring the old value
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) old_ = old;
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (old_) {
            setenv(name_.c_str(), old_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string                name_;
    std::optional<std::string> old_;
};

} // namespace

TEST(ParseEndpoint, AcceptsIdHostPort) {
    auto ep = parse_endpoint("2=10.0.0.5:7701");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->id, 2u);
    EXPECT_EQ(ep->host, "10.0.0.5");
    EXPECT_EQ(ep->port, 7701);
    EXPECT_EQ(ep->to_string(), "2=10.0.0.5:7701");
}

TEST(ParseEndpoint, RejectsMalformed) {
    EXPECT_FALSE(parse_endpoint(""));
    EXPECT_FALSE(parse_endpoint("host:7700"));
    EXPECT_FALSE(parse_endpoint("1=host"));
    EXPECT_FALSE(parse_endpoint("1=:7700"));
    EXPECT_FALSE(parse_endpoint("x=host:7700"));
    EXPECT_FALSE(parse_endpoint("1=host:0"));
    EXPECT_FALSE(parse_endpoint("1=host:70000"));
    EXPECT_FALSE(parse_endpoint("1=host:port"));
}

TEST(ServiceConfig, Defaults) {
    ServiceConfig cfg;
    EXPECT_EQ(cfg.max_sessions, 15u);
    EXPECT_EQ(cfg.max_concurrent, 20u);
    EXPECT_EQ(cfg.idle_timeout, std::chrono::seconds(120));
    EXPECT_EQ(cfg.privileged_cooldown, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.standard_cooldown, std::chrono::milliseconds(15000));
    EXPECT_EQ(cfg.sweep_interval, std::chrono::seconds(1800));
    EXPECT_EQ(cfg.connections_per_transfer, 8);
    EXPECT_EQ(cfg.part_size, 512u * 1024u);
    EXPECT_EQ(cfg.retry_attempts, 3);
    EXPECT_EQ(cfg.retry_max_wait, std::chrono::milliseconds(30000));
    EXPECT_EQ(cfg.monitor_interval, std::chrono::seconds(300));
    EXPECT_EQ(cfg.memory_high_mb, 400u);
    EXPECT_EQ(cfg.memory_critical_mb, 480u);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(ServiceConfig, ConstrainedHostShrinksPools) {
    ServiceConfig cfg = ServiceConfig::defaults(true);
    EXPECT_TRUE(cfg.constrained);
    EXPECT_EQ(cfg.max_sessions, 10u);
    EXPECT_EQ(cfg.max_concurrent, 10u);
    EXPECT_NE(cfg.summary().find("(constrained)"), std::string::npos);
}

TEST(ServiceConfig, ConstrainedHostDetectedFromEnvironment) {
    ScopedEnv a("RENDER", nullptr), b("RENDER_EXTERNAL_URL", nullptr),
              c("REPLIT_DEPLOYMENT", nullptr), d("REPL_ID", nullptr);
    EXPECT_FALSE(detect_constrained_env());
    ScopedEnv e("RENDER", "true");
    EXPECT_TRUE(detect_constrained_env());
    EXPECT_EQ(ServiceConfig::from_env().max_sessions, 10u);
}

TEST(ServiceConfig, FromEnvironment) {
    ScopedEnv a("PREMIUM_DOWNLOAD_DELAY", "3");
    ScopedEnv b("FREE_DOWNLOAD_DELAY", "20");
    ScopedEnv c("FREE_INTRA_DELAY", "7");
    ScopedEnv d("CONNECTIONS_PER_TRANSFER", "6");
    ScopedEnv e("API_ID", "4242");
    ScopedEnv f("API_HASH", "abcdef");
    ScopedEnv g("SESSION_STRING", "sess");
    ScopedEnv h("PARXFER_ENDPOINTS", "1=127.0.0.1:7700,bogus,2=127.0.0.1:7701");
    ScopedEnv i("PARXFER_CONNECTION_POLICY", "fixed");
    ScopedEnv j("PARXFER_IDLE_TIMEOUT", "45");
    ScopedEnv k("PARXFER_DISCONNECT_AFTER_TRANSFER", "1");
    ScopedEnv l("PARXFER_MEMORY_HIGH_MB", "300");
    ScopedEnv m("PARXFER_MONITOR_INTERVAL", "60");

    ServiceConfig cfg = ServiceConfig::from_env();
    EXPECT_EQ(cfg.privileged_cooldown, std::chrono::milliseconds(3000));
    EXPECT_EQ(cfg.standard_cooldown, std::chrono::milliseconds(20000));
    EXPECT_EQ(cfg.standard_intra_delay, std::chrono::milliseconds(7000));
    EXPECT_EQ(cfg.connections_per_transfer, 6);
    EXPECT_EQ(cfg.default_api_id, 4242u);
    EXPECT_EQ(cfg.default_api_hash, "abcdef");
    EXPECT_EQ(cfg.default_session, "sess");
    ASSERT_EQ(cfg.endpoints.size(), 2u);
    EXPECT_EQ(cfg.endpoints[0].port, 7700);
    EXPECT_EQ(cfg.endpoints[1].id, 2u);
    EXPECT_EQ(cfg.connection_policy, ConnectionPolicyKind::FIXED);
    EXPECT_EQ(cfg.idle_timeout, std::chrono::seconds(45));
    EXPECT_TRUE(cfg.disconnect_after_transfer);
    EXPECT_EQ(cfg.memory_high_mb, 300u);
    EXPECT_EQ(cfg.monitor_interval, std::chrono::seconds(60));
}

TEST(ServiceConfig, MalformedEnvironmentValuesAreIgnored) {
    ScopedEnv a("FREE_DOWNLOAD_DELAY", "soon");
    ScopedEnv b("PARXFER_MAX_SESSIONS", "-3");
    ServiceConfig cfg = ServiceConfig::from_env();
    EXPECT_EQ(cfg.standard_cooldown, std::chrono::milliseconds(15000));
    EXPECT_GT(cfg.max_sessions, 0u);
}

TEST(ServiceConfig, ValidateRejectsBadFields) {
    ServiceConfig cfg;
    cfg.max_sessions = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = ServiceConfig();
    cfg.connections_per_transfer = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = ServiceConfig();
    cfg.part_size = MAX_PART_SIZE + 1;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = ServiceConfig();
    cfg.retry_attempts = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = ServiceConfig();
    cfg.memory_critical_mb = cfg.memory_high_mb - 1;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}
